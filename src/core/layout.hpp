#pragma once

#include <cstddef>
#include <expected>
#include <limits>

#include "core/align.hpp"
#include "core/error.hpp"

namespace blink::core {

///
/// Size and alignment of a memory request.
/// A valid layout has a power-of-two alignment and a size that can be padded
/// to its alignment without wrapping around the address space.
///
struct layout {
  std::size_t size_{0};
  std::size_t align_{1};

  [[nodiscard]] static constexpr std::expected<layout, alloc_error> from_size_align(std::size_t size,
                                                                                   std::size_t align) noexcept {
    if (!is_power_of_two(align)) {
      return std::unexpected(alloc_error::invalid_layout);
    }
    if (size > std::numeric_limits<std::size_t>::max() - (align - 1)) {
      return std::unexpected(alloc_error::layout_overflow);
    }
    return layout{size, align};
  }

  template <typename T>
  [[nodiscard]] static constexpr layout of() noexcept {
    return layout{sizeof(T), alignof(T)};
  }

  template <typename T>
  [[nodiscard]] static constexpr std::expected<layout, alloc_error> array(std::size_t count) noexcept {
    if (count > std::numeric_limits<std::size_t>::max() / sizeof(T)) {
      return std::unexpected(alloc_error::layout_overflow);
    }
    return from_size_align(sizeof(T) * count, alignof(T));
  }

  // Bytes needed to fit the request at any starting address.
  [[nodiscard]] constexpr std::size_t padded_size() const noexcept { return size_ + (align_ - 1); }

  friend constexpr bool operator==(const layout&, const layout&) = default;
};

}  // namespace blink::core
