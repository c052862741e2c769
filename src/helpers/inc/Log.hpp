#ifndef IBCHECK_HELPERS_LOG_HPP
#define IBCHECK_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Diagnostic logging setup (spdlog).
 *
 * All library code logs through logger(), which returns the "ibcheck"
 * logger once init() has run and the spdlog default logger before that.
 * Diagnostics go to stderr; report output stays on stdout.
 *
 * @note Thread-safe: spdlog loggers created here use mutex-protected sinks.
 */

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ibcheck {
namespace helpers {
namespace log {

/// Name of the project logger in the spdlog registry.
inline constexpr const char* LOGGER_NAME = "ibcheck";

/**
 * @brief Parse a textual level ("trace".."off").
 * @return spdlog::level::info for unrecognised input.
 */
[[nodiscard]] inline spdlog::level::level_enum parseLevel(std::string_view name) noexcept {
  if (name == "trace") {
    return spdlog::level::trace;
  }
  if (name == "debug") {
    return spdlog::level::debug;
  }
  if (name == "warn" || name == "warning") {
    return spdlog::level::warn;
  }
  if (name == "error") {
    return spdlog::level::err;
  }
  if (name == "critical") {
    return spdlog::level::critical;
  }
  if (name == "off") {
    return spdlog::level::off;
  }
  return spdlog::level::info;
}

/**
 * @brief Create (or reconfigure) the project logger on stderr.
 * @param level Minimum level to emit.
 * @note Cold-path: call once from main().
 */
inline void init(spdlog::level::level_enum level) {
  std::shared_ptr<spdlog::logger> existing = spdlog::get(LOGGER_NAME);
  if (!existing) {
    existing = spdlog::stderr_color_mt(LOGGER_NAME);
    existing->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  }
  existing->set_level(level);
}

/// Change the level of the project logger (or the default logger before init()).
inline void setLevel(spdlog::level::level_enum level) {
  std::shared_ptr<spdlog::logger> lg = spdlog::get(LOGGER_NAME);
  if (!lg) {
    lg = spdlog::default_logger();
  }
  lg->set_level(level);
}

/// Project logger, or the spdlog default logger if init() has not run.
[[nodiscard]] inline std::shared_ptr<spdlog::logger> logger() {
  std::shared_ptr<spdlog::logger> lg = spdlog::get(LOGGER_NAME);
  if (lg) {
    return lg;
  }
  return spdlog::default_logger();
}

} // namespace log
} // namespace helpers
} // namespace ibcheck

#endif // IBCHECK_HELPERS_LOG_HPP
