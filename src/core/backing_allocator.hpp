#pragma once

#include <concepts>
#include <cstddef>

#include "core/error.hpp"
#include "core/layout.hpp"

namespace blink::core {

// ---------------------------------------------------------------------------
// Backing allocator concept
// ---------------------------------------------------------------------------
// Supplies whole chunks to an arena. `deallocate` receives the exact layout
// the block was allocated with.
template <typename A>
concept backing_allocator = requires(A& a, std::byte* ptr, layout l) {
  { a.allocate(l) } -> std::same_as<alloc_result>;
  { a.deallocate(ptr, l) } noexcept;
};

///
/// Stateless allocator over the global aligned operator new/delete.
///
class system_allocator {
 public:
  [[nodiscard]] alloc_result allocate(layout l) noexcept;

  void deallocate(std::byte* ptr, layout l) noexcept;

  friend constexpr bool operator==(const system_allocator&, const system_allocator&) noexcept { return true; }
};
static_assert(backing_allocator<system_allocator>);

}  // namespace blink::core
