#pragma once

#include <concepts>
#include <cstddef>

#include "core/error.hpp"

namespace blink::alloc {

// Allocator front-end accepted by blink_resource and the local proxy.
template <typename T>
concept blink_allocator = requires(T& alloc, void* ptr, std::size_t size, std::size_t align) {
  { alloc.allocate(size, align) } -> std::same_as<core::alloc_result>;
  { alloc.deallocate(ptr, size) } noexcept;
  { alloc.reset(true) } noexcept;
};

}  // namespace blink::alloc
