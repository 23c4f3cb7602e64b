#pragma once

#include <pulse/utility.h>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>
#include <utility>

namespace pulse {

inline constexpr auto logger_name = "pulse";

namespace detail {
inline auto &logger_slot() {
  static auto slot = std::shared_ptr<spdlog::logger>{};
  return slot;
}
} // namespace detail

/// The library logger. Reuses a logger registered as "pulse" if the
/// application created one, otherwise creates a stderr logger.
inline auto &logger() {
  auto &slot = detail::logger_slot();
  if (not slot) {
    slot = spdlog::get(logger_name);
    if (not slot) {
      slot = spdlog::stderr_color_mt(logger_name);
      slot->set_level(spdlog::level::warn);
    }
  }
  return *slot;
}

inline void set_logger(std::shared_ptr<spdlog::logger> logger) {
  detail::logger_slot() = std::move(logger);
}

inline void set_log_level(spdlog::level::level_enum level) {
  logger().set_level(level);
}

/// Applies SPDLOG_LEVEL, e.g. SPDLOG_LEVEL=pulse=trace.
inline void load_log_levels_from_env() {
  logger();
  spdlog::cfg::load_env_levels();
}

template <typename... Args>
void event(spdlog::format_string_t<Args...> fmt, Args &&...args) {
  logger().trace(fmt, FWD(args)...);
}

} // namespace pulse
