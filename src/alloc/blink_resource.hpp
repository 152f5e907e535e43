#pragma once

#include <cstddef>
#include <memory_resource>
#include <new>

#include <spdlog/spdlog.h>

#include "alloc/concepts.hpp"

namespace blink::alloc {

///
/// std::pmr::memory_resource over a blink allocator, so pmr containers can
/// live in an arena. The resource borrows the allocator and must not outlive it.
///
template <blink_allocator Alloc>
class blink_resource : public std::pmr::memory_resource {
 public:
  explicit blink_resource(Alloc& alloc) noexcept : alloc_{&alloc} {}

  blink_resource(const blink_resource&) = delete;
  blink_resource& operator=(const blink_resource&) = delete;
  blink_resource(blink_resource&&) = delete;
  blink_resource& operator=(blink_resource&&) = delete;

  [[nodiscard]] Alloc& allocator() noexcept { return *alloc_; }

 private:
  void* do_allocate(std::size_t bytes, std::size_t alignment) override {
    auto block = alloc_->allocate(bytes, alignment);
    if (!block) {
      spdlog::debug("blink_resource: allocation of {} bytes aligned to {} failed: {}", bytes, alignment,
                    block.error());
      throw std::bad_alloc();
    }
    return block->data();
  }

  void do_deallocate(void* ptr, std::size_t bytes, std::size_t) override { alloc_->deallocate(ptr, bytes); }

  [[nodiscard]] bool do_is_equal(const memory_resource& other) const noexcept override { return this == &other; }

  Alloc* alloc_;
};

}  // namespace blink::alloc
