#include <new>

#include <spdlog/spdlog.h>

#include "core/backing_allocator.hpp"

namespace blink::core {

alloc_result system_allocator::allocate(layout l) noexcept {
  void* ptr = ::operator new(l.size_, std::align_val_t{l.align_}, std::nothrow);
  if (ptr == nullptr) {
    spdlog::warn("system_allocator: unable to allocate {} bytes aligned to {}", l.size_, l.align_);
    return std::unexpected(alloc_error::backing_refused);
  }
  return allocation{static_cast<std::byte*>(ptr), l.size_};
}

void system_allocator::deallocate(std::byte* ptr, layout l) noexcept {
  ::operator delete(ptr, l.size_, std::align_val_t{l.align_});
}

}  // namespace blink::core
