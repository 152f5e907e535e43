#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

#include <fmt/format.h>

namespace blink::core {

// ---------------------------------------------------------------------------
// Error type
// ---------------------------------------------------------------------------

// The single allocation failure kind. The enumerator only records the cause
// for diagnostics; every value means "the request could not be served".
enum class alloc_error : std::uint8_t {
  backing_refused,
  layout_overflow,
  invalid_layout,
};

[[nodiscard]] std::string_view to_string(alloc_error error) noexcept;

// A successfully served request: start address and usable length.
using allocation = std::span<std::byte>;

using alloc_result = std::expected<allocation, alloc_error>;

}  // namespace blink::core

template <>
struct fmt::formatter<blink::core::alloc_error> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(blink::core::alloc_error error, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(blink::core::to_string(error), ctx);
  }
};
