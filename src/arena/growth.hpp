#pragma once

#include <cstddef>
#include <expected>
#include <optional>

#include "core/error.hpp"
#include "core/layout.hpp"

namespace blink::arena {

// 0.25 KiB. Default minimum size of the first chunk.
inline constexpr std::size_t kChunkStartSize = 256;

// 32 KiB. Below this size new chunks are rounded up to a power of two,
// at and above it they are rounded up to kChunkPageSize.
inline constexpr std::size_t kChunkPowerOfTwoThreshold = std::size_t{1} << 15;

// 4 KiB.
inline constexpr std::size_t kChunkPageSize = std::size_t{1} << 12;

// Smallest amount a chain grows by when a chunk runs out.
inline constexpr std::size_t kChunkMinGrowStep = 64;

struct arena_config {
  // Hint for the size of the next chunk; the chain grows past it on demand.
  std::size_t min_chunk_size_{kChunkStartSize};
};

///
/// Total size (header included) of the chunk to install for `request`.
///
/// `head_cumulative_size` is the cumulative size recorded in the current head
/// chunk, or empty when the arena owns no chunk yet.
///
[[nodiscard]] std::expected<std::size_t, core::alloc_error> next_chunk_size(
    std::size_t min_chunk_size, std::optional<std::size_t> head_cumulative_size, core::layout request,
    std::size_t header_size, std::size_t header_align) noexcept;

}  // namespace blink::arena
