#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <limits>
#include <new>
#include <optional>

#include "arena/cursor.hpp"
#include "core/align.hpp"
#include "core/assert.hpp"
#include "core/backing_allocator.hpp"
#include "core/error.hpp"
#include "core/layout.hpp"

namespace blink::arena {

///
/// Header placed at the start of every chunk obtained from a backing
/// allocator. Usable memory starts right after the header and ends at `end_`.
///
///   chunk start           base()        cursor          end_
///   | chunk_header        | allocated    | free         |
///
/// `prev_` links to the previously installed chunk. `cumulative_size_` is the
/// capacity of this chunk plus the cumulative size of `prev_`.
///
template <cursor Cursor>
class chunk_header {
 public:
  chunk_header(const chunk_header&) = delete;
  chunk_header& operator=(const chunk_header&) = delete;
  chunk_header(chunk_header&&) = delete;
  chunk_header& operator=(chunk_header&&) = delete;

  // Allocates `size` bytes (header included) from `allocator` and links the
  // new chunk in front of `prev`.
  template <core::backing_allocator A>
  [[nodiscard]] static std::expected<chunk_header*, core::alloc_error> create(std::size_t size, chunk_header* prev,
                                                                              A& allocator) {
    BL_DEBUG_ASSERT(size >= sizeof(chunk_header));

    auto request = core::layout::from_size_align(size, alignof(chunk_header));
    if (!request) {
      return std::unexpected(request.error());
    }

    auto block = allocator.allocate(*request);
    if (!block) {
      return std::unexpected(block.error());
    }
    BL_DEBUG_ASSERT(block->size() >= size);
    BL_DEBUG_ASSERT(core::is_aligned_to(block->data(), alignof(chunk_header)));

    std::byte* start = block->data();
    return ::new (static_cast<void*>(start)) chunk_header(start + size, prev);
  }

  // Returns the chunk's memory to `allocator` and yields the previous chunk.
  template <core::backing_allocator A>
  static chunk_header* destroy(chunk_header* chunk, A& allocator) noexcept {
    chunk_header* prev = chunk->prev_;
    const core::layout original = chunk->allocation_layout();
    chunk->~chunk_header();
    allocator.deallocate(reinterpret_cast<std::byte*>(chunk), original);
    return prev;
  }

  [[nodiscard]] std::byte* base() noexcept { return reinterpret_cast<std::byte*>(this) + sizeof(chunk_header); }

  [[nodiscard]] const std::byte* base() const noexcept {
    return reinterpret_cast<const std::byte*>(this) + sizeof(chunk_header);
  }

  [[nodiscard]] std::size_t capacity() const noexcept { return static_cast<std::size_t>(end_ - base()); }

  [[nodiscard]] std::size_t cumulative_size() const noexcept { return cumulative_size_; }

  [[nodiscard]] chunk_header* prev() const noexcept { return prev_; }

  // Layout the chunk was obtained with.
  [[nodiscard]] core::layout allocation_layout() const noexcept {
    return core::layout{static_cast<std::size_t>(end_ - reinterpret_cast<const std::byte*>(this)),
                        alignof(chunk_header)};
  }

  ///
  /// Bumps the cursor past a block that fits `request`.
  /// Empty when the chunk has no room left.
  ///
  template <bool Zeroed>
  [[nodiscard]] std::optional<core::allocation> allocate(core::layout request) noexcept {
    const auto limit = reinterpret_cast<std::uintptr_t>(end_);

    std::byte* current = cursor_.load();
    for (;;) {
      const auto address = reinterpret_cast<std::uintptr_t>(current);
      if (address > std::numeric_limits<std::uintptr_t>::max() - request.padded_size()) {
        return std::nullopt;
      }

      const std::uintptr_t aligned = core::align_down(address + request.padded_size() - request.size_, request.align_);
      const std::uintptr_t next = aligned + request.size_;
      if (next > limit) {
        return std::nullopt;
      }

      std::byte* block = current + (aligned - address);
      if (!cursor_.compare_exchange_weak(current, block + request.size_)) {
        continue;
      }

      if constexpr (Zeroed) {
        std::memset(block, 0, request.size_);
      }
      return core::allocation{block, request.size_};
    }
  }

  ///
  /// Resizes a block previously served from this chunk.
  ///
  /// Shrinking keeps the block in place. Growing stays in place when the block
  /// is the most recent allocation and the chunk has room; otherwise the data
  /// moves to a fresh block of this chunk. Empty when that does not fit either.
  ///
  template <bool Zeroed>
  [[nodiscard]] std::optional<core::allocation> resize(std::byte* ptr, core::layout old_layout,
                                                       core::layout new_layout) noexcept {
    if (core::is_aligned_to(ptr, new_layout.align_)) {
      if (new_layout.size_ <= old_layout.size_) {
        return core::allocation{ptr, new_layout.size_};
      }

      std::byte* old_end = ptr + old_layout.size_;
      std::byte* current = cursor_.load();
      const auto address = reinterpret_cast<std::uintptr_t>(ptr);
      if (current == old_end && address <= std::numeric_limits<std::uintptr_t>::max() - new_layout.size_ &&
          address + new_layout.size_ <= reinterpret_cast<std::uintptr_t>(end_)) {
        if (cursor_.compare_exchange(current, ptr + new_layout.size_)) {
          if constexpr (Zeroed) {
            std::memset(old_end, 0, new_layout.size_ - old_layout.size_);
          }
          return core::allocation{ptr, new_layout.size_};
        }
      }
    }

    auto fresh = allocate<false>(new_layout);
    if (!fresh) {
      return std::nullopt;
    }
    copy_block(fresh->data(), ptr, old_layout.size_, new_layout.size_, Zeroed);
    return fresh;
  }

  // Rewinds the cursor when [ptr, ptr + size) is the most recent allocation.
  // A single attempt; losing a race just leaves the bytes unused.
  void deallocate(std::byte* ptr, std::size_t size) noexcept {
    const auto address = reinterpret_cast<std::uintptr_t>(ptr);
    const auto first = reinterpret_cast<std::uintptr_t>(base());
    const auto limit = reinterpret_cast<std::uintptr_t>(end_);
    if (address < first || address > limit || size > limit - address) {
      return;
    }
    std::byte* expected = ptr + size;
    cursor_.compare_exchange(expected, ptr, std::memory_order_release, std::memory_order_relaxed);
  }

  // Empties the chunk and detaches the rest of the chain, which is returned.
  [[nodiscard]] chunk_header* rewind() noexcept {
    cursor_.store(base());
    cumulative_size_ = 0;
    chunk_header* prev = prev_;
    prev_ = nullptr;
    return prev;
  }

  // Copies min(old_size, new_size) bytes and optionally zeroes the tail.
  static void copy_block(std::byte* dst, const std::byte* src, std::size_t old_size, std::size_t new_size,
                         bool zero_tail) noexcept {
    std::memcpy(dst, src, old_size < new_size ? old_size : new_size);
    if (zero_tail && new_size > old_size) {
      std::memset(dst + old_size, 0, new_size - old_size);
    }
  }

 private:
  chunk_header(std::byte* end, chunk_header* prev) noexcept
      : cursor_{base()},
        end_{end},
        prev_{prev},
        cumulative_size_{capacity() + (prev != nullptr ? prev->cumulative_size_ : 0)} {}

  Cursor cursor_;
  std::byte* end_;
  chunk_header* prev_;
  std::size_t cumulative_size_;
};

}  // namespace blink::arena
