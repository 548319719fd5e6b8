#pragma once

/**
 * @file logging.hpp
 * @brief Diagnostic logging for logmux itself, on top of spdlog.
 *
 * All messages go through a single named logger ("logmux") that writes to
 * stderr. The logger is created lazily on first use. Its level comes from the
 * LOGMUX_LOG_LEVEL environment variable (trace, debug, info, warn, error,
 * off) and defaults to warn, so an embedding tool stays quiet unless asked.
 *
 * The aggregated device log itself is never written here; it is handed to
 * listeners of LogAggregator.
 */

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace Logmux::log {

inline constexpr const char *kLoggerName = "logmux";
inline constexpr const char *kLevelEnvVar = "LOGMUX_LOG_LEVEL";

std::shared_ptr<spdlog::logger> logger();

// Unknown or empty names map to warn.
spdlog::level::level_enum parse_level(std::string_view name);

void set_level(spdlog::level::level_enum level);

} // namespace Logmux::log

#define LOGMUX_TRACE(...) ::Logmux::log::logger()->trace(__VA_ARGS__)
#define LOGMUX_DEBUG(...) ::Logmux::log::logger()->debug(__VA_ARGS__)
#define LOGMUX_INFO(...) ::Logmux::log::logger()->info(__VA_ARGS__)
#define LOGMUX_WARN(...) ::Logmux::log::logger()->warn(__VA_ARGS__)
#define LOGMUX_ERROR(...) ::Logmux::log::logger()->error(__VA_ARGS__)
