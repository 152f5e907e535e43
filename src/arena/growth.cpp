#include "arena/growth.hpp"

#include <algorithm>
#include <limits>

#include "core/align.hpp"
#include "core/assert.hpp"

namespace blink::arena {

namespace {

[[nodiscard]] std::optional<std::size_t> checked_add(std::size_t lhs, std::size_t rhs) noexcept {
  if (lhs > std::numeric_limits<std::size_t>::max() - rhs) {
    return std::nullopt;
  }
  return lhs + rhs;
}

}  // namespace

std::expected<std::size_t, core::alloc_error> next_chunk_size(std::size_t min_chunk_size,
                                                              std::optional<std::size_t> head_cumulative_size,
                                                              core::layout request, std::size_t header_size,
                                                              std::size_t header_align) noexcept {
  BL_DEBUG_ASSERT(core::is_power_of_two(header_align));

  std::optional<std::size_t> size;
  if (head_cumulative_size.has_value()) {
    size = checked_add(std::max(min_chunk_size, *head_cumulative_size),
                       std::max(request.size_, kChunkMinGrowStep));
  } else {
    size = std::max(min_chunk_size, request.size_);
  }

  // The chunk base is only aligned to the header, so stricter requests need
  // room to slide forward.
  if (size && request.align_ > header_align) {
    size = checked_add(*size, request.align_);
  }

  if (size) {
    size = checked_add(*size, header_size);
  }

  if (!size) {
    return std::unexpected(core::alloc_error::layout_overflow);
  }

  // Grow exponentially until the threshold, then in page steps.
  if (*size < kChunkPowerOfTwoThreshold) {
    size = core::next_power_of_two(*size);
  } else {
    size = core::align_up(*size, kChunkPageSize);
  }

  if (size) {
    size = core::align_up(*size, header_align);
  }

  if (!size) {
    return std::unexpected(core::alloc_error::layout_overflow);
  }
  return *size;
}

}  // namespace blink::arena
