#include "core/logging.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/spdlog.h>

namespace blink::core {

void configure_logging(std::string_view level) {
  static constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> k_levels{{
      {"trace", spdlog::level::trace},
      {"debug", spdlog::level::debug},
      {"info", spdlog::level::info},
      {"warn", spdlog::level::warn},
      {"error", spdlog::level::err},
      {"critical", spdlog::level::critical},
      {"off", spdlog::level::off},
  }};

  for (const auto& [name, value] : k_levels) {
    if (level == name) {
      spdlog::set_level(value);
      return;
    }
  }

  throw std::invalid_argument(fmt::format("Unknown logging level: {}", level));
}

}  // namespace blink::core
