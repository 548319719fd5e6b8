#include "logmux/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace Logmux::log {

namespace {
std::once_flag g_logger_once;
std::shared_ptr<spdlog::logger> g_logger;
} // namespace

spdlog::level::level_enum parse_level(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lowered == "trace")
    return spdlog::level::trace;
  if (lowered == "debug")
    return spdlog::level::debug;
  if (lowered == "info")
    return spdlog::level::info;
  if (lowered == "error")
    return spdlog::level::err;
  if (lowered == "off")
    return spdlog::level::off;
  return spdlog::level::warn;
}

std::shared_ptr<spdlog::logger> logger() {
  std::call_once(g_logger_once, []() {
    // Reuse a logger the embedding tool may already have registered.
    g_logger = spdlog::get(kLoggerName);
    if (!g_logger) {
      g_logger = spdlog::stderr_color_mt(kLoggerName);
    }
    const char *env_level = std::getenv(kLevelEnvVar);
    g_logger->set_level(parse_level(env_level ? env_level : ""));
  });
  return g_logger;
}

void set_level(spdlog::level::level_enum level) { logger()->set_level(level); }

} // namespace Logmux::log
