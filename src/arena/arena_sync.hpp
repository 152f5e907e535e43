#pragma once

#include <cstddef>

#include <absl/base/thread_annotations.h>
#include <absl/synchronization/mutex.h>
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
/// Arena shared between threads.
///
/// Allocation, resize and deallocate run under the shared lock and race on
/// the head chunk's atomic cursor. Installing a chunk takes the exclusive
/// lock; if another thread changed the head in between, the operation
/// restarts from the fast path instead of installing a second chunk.
///
/// Operations that may run concurrently are const. reset() and reset_leak()
/// need a non-const arena, which the caller must not share with running
/// operations; reset_unchecked() is the const escape hatch for callers that
/// know no returned block is used afterwards.
///
/// The backing allocator is only called under the exclusive lock or from
/// reset(), so it does not need to be thread safe.
///
class arena_sync {
 public:
  using chunk = chunk_header<atomic_cursor>;

  arena_sync() noexcept = default;

  explicit arena_sync(arena_config config) noexcept : min_chunk_size_{config.min_chunk_size_} {}

  arena_sync(const arena_sync&) = delete;
  arena_sync& operator=(const arena_sync&) = delete;
  arena_sync(arena_sync&&) = delete;
  arena_sync& operator=(arena_sync&&) = delete;

  ~arena_sync() noexcept { BL_DEBUG_ASSERT_MSG(root_ == nullptr, "arena destroyed while still owning chunks"); }

  template <core::backing_allocator A>
  [[nodiscard]] core::alloc_result allocate(core::layout request, A& allocator) const {
    return allocate_impl<false>(request, allocator);
  }

  template <core::backing_allocator A>
  [[nodiscard]] core::alloc_result allocate_zeroed(core::layout request, A& allocator) const {
    return allocate_impl<true>(request, allocator);
  }

  template <core::backing_allocator A>
  [[nodiscard]] core::alloc_result resize(std::byte* ptr, core::layout old_layout, core::layout new_layout,
                                          A& allocator) const {
    return resize_impl<false>(ptr, old_layout, new_layout, allocator);
  }

  template <core::backing_allocator A>
  [[nodiscard]] core::alloc_result resize_zeroed(std::byte* ptr, core::layout old_layout, core::layout new_layout,
                                                 A& allocator) const {
    return resize_impl<true>(ptr, old_layout, new_layout, allocator);
  }

  void deallocate(std::byte* ptr, std::size_t size) const noexcept {
    absl::ReaderMutexLock lock{&mutex_};
    dealloc(root_, ptr, size);
  }

  // A non-const arena is not shared with running operations, so no lock.
  template <core::backing_allocator A>
  void reset(bool keep_last, A& allocator) noexcept ABSL_NO_THREAD_SAFETY_ANALYSIS {
    reset_chain(keep_last, allocator);
  }

  // Same as reset() through a shared arena. Serialized against concurrent
  // operations, but blocks returned earlier must no longer be in use.
  template <core::backing_allocator A>
  void reset_unchecked(bool keep_last, A& allocator) const noexcept {
    absl::WriterMutexLock lock{&mutex_};
    reset_chain(keep_last, allocator);
  }

  void reset_leak(bool keep_last) noexcept ABSL_NO_THREAD_SAFETY_ANALYSIS { arena::reset_leak(root_, keep_last); }

  [[nodiscard]] std::size_t last_chunk_size() const noexcept {
    absl::ReaderMutexLock lock{&mutex_};
    return root_ != nullptr ? root_->capacity() : 0;
  }

  [[nodiscard]] std::size_t chunk_count() const noexcept {
    absl::ReaderMutexLock lock{&mutex_};
    return chain_length(root_);
  }

  [[nodiscard]] std::size_t min_chunk_size() const noexcept { return min_chunk_size_; }

 private:
  template <bool Zeroed, core::backing_allocator A>
  core::alloc_result allocate_impl(core::layout request, A& allocator) const {
    for (;;) {
      chunk* observed = nullptr;
      {
        absl::ReaderMutexLock lock{&mutex_};
        if (auto result = alloc_fast<Zeroed>(root_, request)) {
          return *result;
        }
        observed = root_;
      }

      absl::WriterMutexLock lock{&mutex_};
      if (root_ != observed) {
        spdlog::trace("arena_sync: head chunk changed, retrying allocation of {} bytes", request.size_);
        continue;
      }
      return alloc_slow<Zeroed>(root_, min_chunk_size_, request, allocator);
    }
  }

  template <bool Zeroed, core::backing_allocator A>
  core::alloc_result resize_impl(std::byte* ptr, core::layout old_layout, core::layout new_layout,
                                 A& allocator) const {
    for (;;) {
      chunk* observed = nullptr;
      {
        absl::ReaderMutexLock lock{&mutex_};
        if (auto result = resize_fast<Zeroed>(root_, ptr, old_layout, new_layout)) {
          return *result;
        }
        observed = root_;
      }

      absl::WriterMutexLock lock{&mutex_};
      if (root_ != observed) {
        spdlog::trace("arena_sync: head chunk changed, retrying resize to {} bytes", new_layout.size_);
        continue;
      }
      return resize_slow<Zeroed>(root_, min_chunk_size_, ptr, old_layout, new_layout, allocator);
    }
  }

  template <core::backing_allocator A>
  void reset_chain(bool keep_last, A& allocator) const noexcept ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    const std::size_t released = arena::reset(root_, keep_last, allocator);
    spdlog::trace("arena_sync: reset, keep_last={}, released {} chunks", keep_last, released);
  }

  mutable absl::Mutex mutex_;
  mutable chunk* root_ ABSL_GUARDED_BY(mutex_) = nullptr;
  std::size_t min_chunk_size_{kChunkStartSize};
};

}  // namespace blink::arena
