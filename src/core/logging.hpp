#pragma once

#include <string_view>

namespace blink::core {

// Sets the level of spdlog's default logger from its textual name
// ("trace", "debug", "info", "warn", "error", "critical", "off").
// Throws std::invalid_argument for any other name.
void configure_logging(std::string_view level);

}  // namespace blink::core
