#pragma once

#include <atomic>
#include <concepts>
#include <cstddef>

#include "core/assert.hpp"

namespace blink::arena {

// ---------------------------------------------------------------------------
// Cursor concept: the next free address of a chunk.
// ---------------------------------------------------------------------------
// `compare_exchange` follows std::atomic semantics: on failure `expected` is
// updated with the current value. `compare_exchange_weak` may fail spuriously
// and must only be used in a retry loop.
template <typename C>
concept cursor = requires(C& c, const C& cc, std::byte* value, std::byte*& expected) {
  { cc.load() } noexcept -> std::same_as<std::byte*>;
  { c.store(value) } noexcept;
  { c.compare_exchange(expected, value) } noexcept -> std::same_as<bool>;
  { c.compare_exchange_weak(expected, value) } noexcept -> std::same_as<bool>;
};

///
/// Plain cell for the single-owner arena.
///
class local_cursor {
 public:
  explicit local_cursor(std::byte* value) noexcept : value_{value} {}

  [[nodiscard]] std::byte* load(std::memory_order = std::memory_order_relaxed) const noexcept { return value_; }

  void store(std::byte* value) noexcept { value_ = value; }

  bool compare_exchange(std::byte*& expected, std::byte* desired, std::memory_order = std::memory_order_seq_cst,
                        std::memory_order = std::memory_order_relaxed) noexcept {
    if (expected != value_) {
      expected = value_;
      return false;
    }
    value_ = desired;
    return true;
  }

  bool compare_exchange_weak(std::byte*& expected, std::byte* desired, std::memory_order = std::memory_order_seq_cst,
                             std::memory_order = std::memory_order_relaxed) noexcept {
    BL_DEBUG_ASSERT_MSG(expected == value_, "compare_exchange_weak expects the last loaded value");
    value_ = desired;
    return true;
  }

 private:
  std::byte* value_;
};

///
/// Atomic cell for the shared arena.
///
class atomic_cursor {
 public:
  explicit atomic_cursor(std::byte* value) noexcept : value_{value} {}

  [[nodiscard]] std::byte* load(std::memory_order order = std::memory_order_relaxed) const noexcept {
    return value_.load(order);
  }

  // Only called while no other thread can observe the chunk.
  void store(std::byte* value) noexcept { value_.store(value, std::memory_order_relaxed); }

  bool compare_exchange(std::byte*& expected, std::byte* desired, std::memory_order success = std::memory_order_acquire,
                        std::memory_order failure = std::memory_order_relaxed) noexcept {
    return value_.compare_exchange_strong(expected, desired, success, failure);
  }

  bool compare_exchange_weak(std::byte*& expected, std::byte* desired,
                             std::memory_order success = std::memory_order_acquire,
                             std::memory_order failure = std::memory_order_relaxed) noexcept {
    return value_.compare_exchange_weak(expected, desired, success, failure);
  }

 private:
  std::atomic<std::byte*> value_;
};

static_assert(cursor<local_cursor>);
static_assert(cursor<atomic_cursor>);

}  // namespace blink::arena
