#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "arena/chunk.hpp"
#include "arena/growth.hpp"
#include "core/assert.hpp"
#include "core/backing_allocator.hpp"
#include "core/error.hpp"
#include "core/layout.hpp"

namespace blink::arena {

// ---------------------------------------------------------------------------
// Chunk chain operations shared by the single-owner and the shared arena.
// `root` is the head chunk (most recently installed) or nullptr.
// ---------------------------------------------------------------------------

template <bool Zeroed, cursor Cursor>
[[nodiscard]] std::optional<core::allocation> alloc_fast(chunk_header<Cursor>* root, core::layout request) noexcept {
  if (root == nullptr) {
    return std::nullopt;
  }
  return root->template allocate<Zeroed>(request);
}

///
/// Installs a new head chunk sized by the growth policy and serves `request`
/// from it. The shared arena calls this under its exclusive lock.
///
template <bool Zeroed, cursor Cursor, core::backing_allocator A>
[[nodiscard]] core::alloc_result alloc_slow(chunk_header<Cursor>*& root, std::size_t min_chunk_size,
                                            core::layout request, A& allocator) {
  using chunk = chunk_header<Cursor>;

  const std::optional<std::size_t> head_cumulative =
      root != nullptr ? std::optional<std::size_t>{root->cumulative_size()} : std::nullopt;

  auto chunk_size = next_chunk_size(min_chunk_size, head_cumulative, request, sizeof(chunk), alignof(chunk));
  if (!chunk_size) {
    spdlog::warn("arena: cannot size a chunk for {} bytes aligned to {}: {}", request.size_, request.align_,
                 chunk_size.error());
    return std::unexpected(chunk_size.error());
  }

  auto fresh = chunk::create(*chunk_size, root, allocator);
  if (!fresh) {
    spdlog::warn("arena: backing allocator refused a chunk of {} bytes: {}", *chunk_size, fresh.error());
    return std::unexpected(fresh.error());
  }
  BL_DEBUG_ASSERT_EQ((*fresh)->prev(), root);

  spdlog::debug("arena: installed chunk of {} bytes, capacity {}, cumulative {}", *chunk_size,
                (*fresh)->capacity(), (*fresh)->cumulative_size());

  auto result = (*fresh)->template allocate<Zeroed>(request);
  if (!result) {
    BL_UNREACHABLE();
  }

  root = *fresh;
  return *result;
}

template <bool Zeroed, cursor Cursor>
[[nodiscard]] std::optional<core::allocation> resize_fast(chunk_header<Cursor>* root, std::byte* ptr,
                                                          core::layout old_layout, core::layout new_layout) noexcept {
  if (root == nullptr) {
    return std::nullopt;
  }
  return root->template resize<Zeroed>(ptr, old_layout, new_layout);
}

// Moves the block into a newly installed chunk.
template <bool Zeroed, cursor Cursor, core::backing_allocator A>
[[nodiscard]] core::alloc_result resize_slow(chunk_header<Cursor>*& root, std::size_t min_chunk_size,
                                             std::byte* ptr, core::layout old_layout, core::layout new_layout,
                                             A& allocator) {
  auto fresh = alloc_slow<false>(root, min_chunk_size, new_layout, allocator);
  if (!fresh) {
    return fresh;
  }
  chunk_header<Cursor>::copy_block(fresh->data(), ptr, old_layout.size_, new_layout.size_, Zeroed);
  return fresh;
}

template <cursor Cursor>
void dealloc(chunk_header<Cursor>* root, std::byte* ptr, std::size_t size) noexcept {
  if (root != nullptr) {
    root->deallocate(ptr, size);
  }
}

///
/// Releases chunks back to `allocator`. With `keep_last` the head chunk is
/// kept, emptied and its cumulative size cleared. Returns the number of
/// chunks released.
///
template <cursor Cursor, core::backing_allocator A>
std::size_t reset(chunk_header<Cursor>*& root, bool keep_last, A& allocator) noexcept {
  chunk_header<Cursor>* next = nullptr;
  if (keep_last) {
    if (root == nullptr) {
      return 0;
    }
    next = root->rewind();
  } else {
    next = std::exchange(root, nullptr);
  }

  std::size_t released = 0;
  while (next != nullptr) {
    next = chunk_header<Cursor>::destroy(next, allocator);
    ++released;
  }
  return released;
}

// Same as reset() but forgets the chunks instead of releasing them.
template <cursor Cursor>
void reset_leak(chunk_header<Cursor>*& root, bool keep_last) noexcept {
  if (keep_last) {
    if (root != nullptr) {
      static_cast<void>(root->rewind());
    }
  } else {
    root = nullptr;
  }
}

template <cursor Cursor>
[[nodiscard]] std::size_t chain_length(const chunk_header<Cursor>* root) noexcept {
  std::size_t length = 0;
  for (; root != nullptr; root = root->prev()) {
    ++length;
  }
  return length;
}

}  // namespace blink::arena
