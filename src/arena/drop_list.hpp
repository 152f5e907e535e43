#pragma once

#include <cstddef>
#include <expected>
#include <limits>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "core/assert.hpp"
#include "core/error.hpp"
#include "core/layout.hpp"

namespace blink::arena {

///
/// Record header preceding `count_` values of one type in caller-provided
/// memory. The values start at the first address after the header that is
/// aligned for their type.
///
struct drops {
  using drop_fn = void (*)(drops* record, std::size_t count) noexcept;

  std::size_t count_;
  drop_fn drop_;
  drops* next_;
};

///
/// Intrusive list of records whose values are destroyed on reset().
///
/// The list never owns record memory: it typically lives in an arena and
/// must stay valid until the list is reset. Destruction runs in reverse
/// registration order.
///
class drop_list {
 public:
  drop_list() noexcept = default;

  drop_list(const drop_list&) = delete;
  drop_list& operator=(const drop_list&) = delete;

  drop_list(drop_list&& other) noexcept : root_{std::exchange(other.root_, nullptr)} {}

  drop_list& operator=(drop_list&&) = delete;

  ~drop_list() noexcept { BL_DEBUG_ASSERT_MSG(root_ == nullptr, "drop_list destroyed with pending records"); }

  // Offset of the first value from the record start.
  template <typename T>
  [[nodiscard]] static constexpr std::size_t value_offset() noexcept {
    return (sizeof(drops) + alignof(T) - 1) & ~(alignof(T) - 1);
  }

  // Layout of a record holding `count` values of T.
  template <typename T>
  [[nodiscard]] static constexpr std::expected<core::layout, core::alloc_error> item_layout(
      std::size_t count = 1) noexcept {
    constexpr std::size_t header = value_offset<T>();
    if (count > (std::numeric_limits<std::size_t>::max() - header) / sizeof(T)) {
      return std::unexpected(core::alloc_error::layout_overflow);
    }
    constexpr std::size_t align = alignof(T) > alignof(drops) ? alignof(T) : alignof(drops);
    return core::layout::from_size_align(header + sizeof(T) * count, align);
  }

  template <typename T>
  [[nodiscard]] static T* values(drops* record) noexcept {
    return std::launder(reinterpret_cast<T*>(reinterpret_cast<std::byte*>(record) + value_offset<T>()));
  }

  ///
  /// Constructs a single T in `memory`, which must satisfy item_layout<T>(1),
  /// and writes the record header in front of it. If the constructor throws
  /// nothing is written to the header.
  ///
  template <typename T, typename... Args>
  static drops* emplace_value(void* memory, Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args...>) {
    auto* bytes = static_cast<std::byte*>(memory);
    ::new (static_cast<void*>(bytes + value_offset<T>())) T(std::forward<Args>(args)...);
    return ::new (memory) drops{1, &destroy<T>, nullptr};
  }

  ///
  /// Writes the record header for `count` values of T in `memory`. The values
  /// themselves must be constructed by the caller (see values<T>()) before
  /// the record is added to a list.
  ///
  template <typename T>
  static drops* make_record(void* memory, std::size_t count) noexcept {
    return ::new (memory) drops{count, &destroy<T>, nullptr};
  }

  // Links the record at the front of the list and returns its first value.
  template <typename T>
  T* add(drops* record) noexcept {
    BL_DEBUG_ASSERT(record->drop_ == &destroy<T>);
    record->next_ = root_;
    root_ = record;
    return values<T>(record);
  }

  // Destroys every registered value, most recently added record first.
  void reset() noexcept;

  [[nodiscard]] bool empty() const noexcept { return root_ == nullptr; }

 private:
  template <typename T>
  static void destroy(drops* record, std::size_t count) noexcept {
    std::destroy_n(values<T>(record), count);
  }

  drops* root_{nullptr};
};

}  // namespace blink::arena
