#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

namespace blink::core {

[[nodiscard]] constexpr bool is_power_of_two(std::size_t value) noexcept { return std::has_single_bit(value); }

[[nodiscard]] constexpr bool is_aligned_to(std::uintptr_t value, std::size_t align) noexcept {
  return (value & (align - 1)) == 0;
}

[[nodiscard]] inline bool is_aligned_to(const void* ptr, std::size_t align) noexcept {
  return is_aligned_to(reinterpret_cast<std::uintptr_t>(ptr), align);
}

// Empty when rounding up would wrap around the address space.
[[nodiscard]] constexpr std::optional<std::size_t> align_up(std::size_t value, std::size_t align) noexcept {
  const std::size_t mask = align - 1;
  if (value > std::numeric_limits<std::size_t>::max() - mask) {
    return std::nullopt;
  }
  return (value + mask) & ~mask;
}

[[nodiscard]] constexpr std::size_t align_down(std::size_t value, std::size_t align) noexcept {
  return value & ~(align - 1);
}

[[nodiscard]] constexpr std::optional<std::size_t> next_power_of_two(std::size_t value) noexcept {
  if (value <= 1) {
    return 1;
  }
  if (value > (std::size_t{1} << (std::numeric_limits<std::size_t>::digits - 1))) {
    return std::nullopt;
  }
  return std::bit_ceil(value);
}

}  // namespace blink::core
