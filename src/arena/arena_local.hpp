#pragma once

#include <cstddef>
#include <utility>

#include <spdlog/spdlog.h>

#include "arena/chain.hpp"
#include "arena/chunk.hpp"
#include "arena/cursor.hpp"
#include "arena/growth.hpp"
#include "core/assert.hpp"
#include "core/backing_allocator.hpp"
#include "core/error.hpp"
#include "core/layout.hpp"

namespace blink::arena {

///
/// Single-owner arena. Not safe for concurrent use.
///
/// The arena does not own its backing allocator: every operation that may
/// obtain or release chunks takes it as an argument, and the same allocator
/// must be passed for the lifetime of the chunks. All chunks must be released
/// with reset(false, allocator) before the arena is destroyed.
///
class arena_local {
 public:
  using chunk = chunk_header<local_cursor>;

  arena_local() noexcept = default;

  explicit arena_local(arena_config config) noexcept : min_chunk_size_{config.min_chunk_size_} {}

  arena_local(const arena_local&) = delete;
  arena_local& operator=(const arena_local&) = delete;

  arena_local(arena_local&& other) noexcept
      : root_{std::exchange(other.root_, nullptr)}, min_chunk_size_{other.min_chunk_size_} {}

  arena_local& operator=(arena_local&&) = delete;

  ~arena_local() noexcept { BL_DEBUG_ASSERT_MSG(root_ == nullptr, "arena destroyed while still owning chunks"); }

  template <core::backing_allocator A>
  [[nodiscard]] core::alloc_result allocate(core::layout request, A& allocator) {
    return allocate_impl<false>(request, allocator);
  }

  template <core::backing_allocator A>
  [[nodiscard]] core::alloc_result allocate_zeroed(core::layout request, A& allocator) {
    return allocate_impl<true>(request, allocator);
  }

  template <core::backing_allocator A>
  [[nodiscard]] core::alloc_result resize(std::byte* ptr, core::layout old_layout, core::layout new_layout,
                                          A& allocator) {
    return resize_impl<false>(ptr, old_layout, new_layout, allocator);
  }

  template <core::backing_allocator A>
  [[nodiscard]] core::alloc_result resize_zeroed(std::byte* ptr, core::layout old_layout, core::layout new_layout,
                                                 A& allocator) {
    return resize_impl<true>(ptr, old_layout, new_layout, allocator);
  }

  // Best effort: only the most recent allocation of the head chunk is reclaimed.
  void deallocate(std::byte* ptr, std::size_t size) noexcept { dealloc(root_, ptr, size); }

  template <core::backing_allocator A>
  void reset(bool keep_last, A& allocator) noexcept {
    const std::size_t released = arena::reset(root_, keep_last, allocator);
    spdlog::trace("arena_local: reset, keep_last={}, released {} chunks", keep_last, released);
  }

  // Forgets chunks without returning them to the backing allocator.
  void reset_leak(bool keep_last) noexcept { arena::reset_leak(root_, keep_last); }

  // Capacity of the head chunk, 0 when there is none.
  [[nodiscard]] std::size_t last_chunk_size() const noexcept { return root_ != nullptr ? root_->capacity() : 0; }

  [[nodiscard]] std::size_t chunk_count() const noexcept { return chain_length(root_); }

  [[nodiscard]] std::size_t min_chunk_size() const noexcept { return min_chunk_size_; }

 private:
  template <bool Zeroed, core::backing_allocator A>
  core::alloc_result allocate_impl(core::layout request, A& allocator) {
    if (auto result = alloc_fast<Zeroed>(root_, request)) {
      return *result;
    }
    return alloc_slow<Zeroed>(root_, min_chunk_size_, request, allocator);
  }

  template <bool Zeroed, core::backing_allocator A>
  core::alloc_result resize_impl(std::byte* ptr, core::layout old_layout, core::layout new_layout, A& allocator) {
    if (auto result = resize_fast<Zeroed>(root_, ptr, old_layout, new_layout)) {
      return *result;
    }
    return resize_slow<Zeroed>(root_, min_chunk_size_, ptr, old_layout, new_layout, allocator);
  }

  chunk* root_{nullptr};
  std::size_t min_chunk_size_{kChunkStartSize};
};

}  // namespace blink::arena
