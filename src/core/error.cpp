#include "core/error.hpp"

#include <magic_enum/magic_enum.hpp>

namespace blink::core {

std::string_view to_string(alloc_error error) noexcept {
  return magic_enum::enum_name(error);
}

}  // namespace blink::core
