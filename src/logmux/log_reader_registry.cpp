#include "logmux/log_reader_registry.hpp"

#include "logmux/logging.hpp"

#include <utility>

namespace Logmux {

LogReaderRegistry::LogReaderRegistry(LogReaderConfig device_config,
                                     std::shared_ptr<SyslogLauncher> launcher)
    : _device_config(std::move(device_config)), _launcher(std::move(launcher)) {}

LogReaderRegistry::~LogReaderRegistry() { dispose(); }

std::shared_ptr<LogAggregator>
LogReaderRegistry::get_log_reader(const std::string &app_bundle_name) {
  std::lock_guard<std::mutex> lock(_mutex);
  auto &reader = _readers[app_bundle_name];
  if (reader && reader->state() != SessionState::Disposed) {
    return reader;
  }

  LogReaderConfig config = _device_config;
  config.app_bundle_name = app_bundle_name;
  reader = LogAggregator::create(std::move(config), _launcher);
  LOGMUX_DEBUG("created log reader for '{}' on {}", app_bundle_name,
               _device_config.device_id);
  return reader;
}

size_t LogReaderRegistry::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _readers.size();
}

void LogReaderRegistry::dispose() {
  std::map<std::string, std::shared_ptr<LogAggregator>> readers;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    readers.swap(_readers);
  }
  for (auto &[name, reader] : readers) {
    reader->dispose();
  }
}

} // namespace Logmux
