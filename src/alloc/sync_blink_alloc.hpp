#pragma once

#include <cstddef>
#include <utility>

#include "alloc/blink_alloc.hpp"
#include "alloc/concepts.hpp"
#include "arena/arena_sync.hpp"
#include "arena/growth.hpp"
#include "core/backing_allocator.hpp"
#include "core/error.hpp"
#include "core/layout.hpp"

namespace blink::alloc {

///
/// Thread-safe bump allocator over a backing allocator.
///
/// The const members (allocate, resize, deallocate) may be called from any
/// number of threads through a shared `const sync_blink_alloc&`. reset() needs
/// the allocator itself and must not race with them. reset_unchecked() is the
/// bypass callable through a shared reference; the caller guarantees that no
/// block returned earlier is touched again.
///
/// Threads with allocation-heavy loops should allocate through a
/// local_blink_alloc proxy so most requests never touch the shared lock.
///
template <core::backing_allocator A = core::system_allocator>
class sync_blink_alloc {
 public:
  sync_blink_alloc() = default;

  explicit sync_blink_alloc(arena::arena_config config) : arena_{config} {}

  explicit sync_blink_alloc(A backing, arena::arena_config config = {})
      : arena_{config}, backing_{std::move(backing)} {}

  sync_blink_alloc(const sync_blink_alloc&) = delete;
  sync_blink_alloc& operator=(const sync_blink_alloc&) = delete;
  sync_blink_alloc(sync_blink_alloc&&) = delete;
  sync_blink_alloc& operator=(sync_blink_alloc&&) = delete;

  ~sync_blink_alloc() { arena_.reset(false, backing_); }

  [[nodiscard]] core::alloc_result allocate(std::size_t size, std::size_t align = kDefaultAlign) const {
    auto request = core::layout::from_size_align(size, align);
    if (!request) {
      return std::unexpected(request.error());
    }
    return arena_.allocate(*request, backing_);
  }

  [[nodiscard]] core::alloc_result allocate_zeroed(std::size_t size, std::size_t align = kDefaultAlign) const {
    auto request = core::layout::from_size_align(size, align);
    if (!request) {
      return std::unexpected(request.error());
    }
    return arena_.allocate_zeroed(*request, backing_);
  }

  [[nodiscard]] core::alloc_result resize(void* ptr, std::size_t old_size, std::size_t old_align,
                                          std::size_t new_size, std::size_t new_align) const {
    return resize_impl<false>(ptr, old_size, old_align, new_size, new_align);
  }

  [[nodiscard]] core::alloc_result resize_zeroed(void* ptr, std::size_t old_size, std::size_t old_align,
                                                 std::size_t new_size, std::size_t new_align) const {
    return resize_impl<true>(ptr, old_size, old_align, new_size, new_align);
  }

  void deallocate(void* ptr, std::size_t size) const noexcept {
    if (ptr != nullptr) {
      arena_.deallocate(static_cast<std::byte*>(ptr), size);
    }
  }

  void reset(bool keep_last = true) noexcept { arena_.reset(keep_last, backing_); }

  void reset_unchecked(bool keep_last = true) const noexcept { arena_.reset_unchecked(keep_last, backing_); }

  void reset_leak(bool keep_last = true) noexcept { arena_.reset_leak(keep_last); }

  [[nodiscard]] A& backing() noexcept { return backing_; }

  [[nodiscard]] const arena::arena_sync& engine() const noexcept { return arena_; }

 private:
  template <bool Zeroed>
  core::alloc_result resize_impl(void* ptr, std::size_t old_size, std::size_t old_align, std::size_t new_size,
                                 std::size_t new_align) const {
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

  arena::arena_sync arena_;
  // Only called under the arena's exclusive lock or from reset().
  mutable A backing_;
};

static_assert(blink_allocator<sync_blink_alloc<>>);

}  // namespace blink::alloc
