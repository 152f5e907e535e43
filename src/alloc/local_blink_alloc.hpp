#pragma once

#include <cstddef>

#include "alloc/blink_alloc.hpp"
#include "alloc/concepts.hpp"
#include "alloc/sync_blink_alloc.hpp"
#include "arena/arena_local.hpp"
#include "arena/growth.hpp"
#include "core/backing_allocator.hpp"
#include "core/error.hpp"
#include "core/layout.hpp"

namespace blink::alloc {

///
/// Single-threaded proxy that carves its chunks out of a shared
/// sync_blink_alloc. Each thread owns its own proxy and borrows the shared
/// allocator through a const reference; the shared allocator is only touched
/// when the proxy needs a new chunk or hands one back.
///
/// The proxy must not outlive the shared allocator. Its chunks are handed
/// back on reset(false) and on destruction.
///
template <core::backing_allocator A = core::system_allocator>
class local_blink_alloc {
 public:
  explicit local_blink_alloc(const sync_blink_alloc<A>& shared) noexcept
      : arena_{arena::arena_config{shared.engine().min_chunk_size()}}, backing_{&shared} {}

  local_blink_alloc(const sync_blink_alloc<A>& shared, arena::arena_config config) noexcept
      : arena_{config}, backing_{&shared} {}

  local_blink_alloc(const local_blink_alloc&) = delete;
  local_blink_alloc& operator=(const local_blink_alloc&) = delete;

  local_blink_alloc(local_blink_alloc&&) noexcept = default;
  local_blink_alloc& operator=(local_blink_alloc&&) = delete;

  ~local_blink_alloc() { arena_.reset(false, backing_); }

  [[nodiscard]] core::alloc_result allocate(std::size_t size, std::size_t align = kDefaultAlign) {
    auto request = core::layout::from_size_align(size, align);
    if (!request) {
      return std::unexpected(request.error());
    }
    return arena_.allocate(*request, backing_);
  }

  [[nodiscard]] core::alloc_result allocate_zeroed(std::size_t size, std::size_t align = kDefaultAlign) {
    auto request = core::layout::from_size_align(size, align);
    if (!request) {
      return std::unexpected(request.error());
    }
    return arena_.allocate_zeroed(*request, backing_);
  }

  [[nodiscard]] core::alloc_result resize(void* ptr, std::size_t old_size, std::size_t old_align,
                                          std::size_t new_size, std::size_t new_align) {
    return resize_impl<false>(ptr, old_size, old_align, new_size, new_align);
  }

  [[nodiscard]] core::alloc_result resize_zeroed(void* ptr, std::size_t old_size, std::size_t old_align,
                                                 std::size_t new_size, std::size_t new_align) {
    return resize_impl<true>(ptr, old_size, old_align, new_size, new_align);
  }

  void deallocate(void* ptr, std::size_t size) noexcept {
    if (ptr != nullptr) {
      arena_.deallocate(static_cast<std::byte*>(ptr), size);
    }
  }

  void reset(bool keep_last = true) noexcept { arena_.reset(keep_last, backing_); }

  // Forgets the proxy's chunks; the shared allocator reclaims them on its reset.
  void reset_leak(bool keep_last = true) noexcept { arena_.reset_leak(keep_last); }

  [[nodiscard]] const sync_blink_alloc<A>& shared() const noexcept { return *backing_.shared_; }

  [[nodiscard]] const arena::arena_local& engine() const noexcept { return arena_; }

 private:
  template <bool Zeroed>
  core::alloc_result resize_impl(void* ptr, std::size_t old_size, std::size_t old_align, std::size_t new_size,
                                 std::size_t new_align) {
    auto new_layout = core::layout::from_size_align(new_size, new_align);
    if (!new_layout) {
      return std::unexpected(new_layout.error());
    }
    if (ptr == nullptr) {
      return Zeroed ? arena_.allocate_zeroed(*new_layout, backing_) : arena_.allocate(*new_layout, backing_);
    }

    auto old_layout = core::layout::from_size_align(old_size, old_align);
    if (!old_layout) {
      return std::unexpected(old_layout.error());
    }

    auto* block = static_cast<std::byte*>(ptr);
    if constexpr (Zeroed) {
      return arena_.resize_zeroed(block, *old_layout, *new_layout, backing_);
    } else {
      return arena_.resize(block, *old_layout, *new_layout, backing_);
    }
  }

  // Serves the proxy's chunks from the shared allocator.
  struct shared_backing {
    const sync_blink_alloc<A>* shared_;

    core::alloc_result allocate(core::layout l) { return shared_->allocate(l.size_, l.align_); }

    void deallocate(std::byte* ptr, core::layout l) noexcept { shared_->deallocate(ptr, l.size_); }
  };
  static_assert(core::backing_allocator<shared_backing>);

  arena::arena_local arena_;
  shared_backing backing_;
};

static_assert(blink_allocator<local_blink_alloc<>>);

}  // namespace blink::alloc
