#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace gopt {

inline constexpr char const* logger_name = "gopt";

// applications can register their own logger under this name before the
// first optimizer is created
inline std::shared_ptr<spdlog::logger> const& logger() {
  static auto const instance = []() -> std::shared_ptr<spdlog::logger> {
    if (auto existing = spdlog::get(logger_name); existing) {
      return existing;
    }

    return spdlog::stdout_color_mt(logger_name);
  }();

  return instance;
}

} // namespace gopt
