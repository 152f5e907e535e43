#pragma once

#include <cstddef>
#include <utility>

#include "alloc/concepts.hpp"
#include "arena/arena_local.hpp"
#include "arena/growth.hpp"
#include "core/backing_allocator.hpp"
#include "core/error.hpp"
#include "core/layout.hpp"

namespace blink::alloc {

inline constexpr std::size_t kDefaultAlign = alignof(std::max_align_t);

///
/// Single-threaded bump allocator over a backing allocator.
///
/// Memory is reclaimed in bulk by reset(). Individual deallocation only gives
/// back the most recent block. Blocks returned before a reset must not be
/// used after it.
///
template <core::backing_allocator A = core::system_allocator>
class blink_alloc {
 public:
  blink_alloc() = default;

  explicit blink_alloc(arena::arena_config config) : arena_{config} {}

  explicit blink_alloc(A backing, arena::arena_config config = {})
      : arena_{config}, backing_{std::move(backing)} {}

  blink_alloc(const blink_alloc&) = delete;
  blink_alloc& operator=(const blink_alloc&) = delete;

  blink_alloc(blink_alloc&&) noexcept = default;
  blink_alloc& operator=(blink_alloc&&) = delete;

  ~blink_alloc() { arena_.reset(false, backing_); }

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

  ///
  /// Resizes a block from this allocator. A null `ptr` behaves like
  /// allocate(new_size, new_align). On failure the original block is intact.
  ///
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

  // Invalidates every block served so far.
  void reset(bool keep_last = true) noexcept { arena_.reset(keep_last, backing_); }

  // Drops every chunk without returning it to the backing allocator.
  void reset_leak(bool keep_last = true) noexcept { arena_.reset_leak(keep_last); }

  [[nodiscard]] A& backing() noexcept { return backing_; }

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

  arena::arena_local arena_;
  A backing_;
};

static_assert(blink_allocator<blink_alloc<>>);

}  // namespace blink::alloc
