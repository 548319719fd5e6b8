#pragma once

#include "logmux/capture_process.hpp"
#include "logmux/config.hpp"
#include "logmux/log_aggregator.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace Logmux {

/**
 * @brief The log readers of one device, at most one live session per
 * application.
 */
class LogReaderRegistry {
public:
  /**
   * @param device_config Device-wide settings. Its app_bundle_name is
   * replaced by the application asked for in get_log_reader().
   */
  explicit LogReaderRegistry(LogReaderConfig device_config,
                             std::shared_ptr<SyslogLauncher> launcher = nullptr);
  ~LogReaderRegistry();

  LogReaderRegistry(const LogReaderRegistry &) = delete;
  LogReaderRegistry &operator=(const LogReaderRegistry &) = delete;

  /**
   * @brief Returns the session of `app_bundle_name`, creating it on first
   * use. A disposed session is replaced by a fresh one.
   */
  std::shared_ptr<LogAggregator> get_log_reader(const std::string &app_bundle_name);

  size_t size() const;

  // Disposes every session and forgets them.
  void dispose();

private:
  LogReaderConfig _device_config;
  std::shared_ptr<SyslogLauncher> _launcher;

  mutable std::mutex _mutex;
  std::map<std::string, std::shared_ptr<LogAggregator>> _readers;
};

} // namespace Logmux
