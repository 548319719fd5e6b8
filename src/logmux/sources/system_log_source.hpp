#pragma once

#include "logmux/capture_process.hpp"
#include "logmux/line_source.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Logmux {

/**
 * @brief Reads the device system log through a capture process.
 *
 * stdout and stderr of the process are read on one thread each, split into
 * lines and run through their own MultilineReassembler, so only output of the
 * tracked process reaches the sink. Exit of the capture process does not end
 * the aggregated stream. If the process cannot be started the source stays
 * silent for the whole session.
 */
class SystemLogSource : public LineSource {
public:
  SystemLogSource(std::shared_ptr<SyslogLauncher> launcher,
                  std::string device_id, bool wirelessly_connected,
                  std::string process_name, std::string header_suffix);
  ~SystemLogSource() override;

  SystemLogSource(const SystemLogSource &) = delete;
  SystemLogSource &operator=(const SystemLogSource &) = delete;

  SourceKind kind() const override { return SourceKind::SystemLog; }
  bool start(ISourceSink &sink) override;
  void stop() override;

  bool process_running() const;

private:
  void read_loop(int fd, ISourceSink &sink);

  std::shared_ptr<SyslogLauncher> _launcher;
  std::string _device_id;
  bool _wirelessly_connected;
  std::string _process_name;
  std::string _header_suffix;

  mutable std::mutex _mutex;
  bool _started = false;
  std::atomic<bool> _stopping{false};
  std::unique_ptr<CaptureProcess> _process;
  std::vector<std::thread> _readers;
};

} // namespace Logmux
