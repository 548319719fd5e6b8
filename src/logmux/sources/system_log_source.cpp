#include "logmux/sources/system_log_source.hpp"

#include "logmux/logging.hpp"
#include "logmux/multiline_reassembler.hpp"

#include <cerrno>
#include <poll.h>
#include <system_error>
#include <unistd.h>

namespace Logmux {

namespace {
constexpr int kPollIntervalMs = 100;
constexpr size_t kReadChunkSize = 4096;
} // namespace

SystemLogSource::SystemLogSource(std::shared_ptr<SyslogLauncher> launcher,
                                 std::string device_id,
                                 bool wirelessly_connected,
                                 std::string process_name,
                                 std::string header_suffix)
    : _launcher(std::move(launcher)), _device_id(std::move(device_id)),
      _wirelessly_connected(wirelessly_connected),
      _process_name(std::move(process_name)),
      _header_suffix(std::move(header_suffix)) {}

SystemLogSource::~SystemLogSource() { stop(); }

bool SystemLogSource::start(ISourceSink &sink) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_started || !_launcher) {
    return false;
  }
  _started = true;

  try {
    _process = _launcher->start_logger(_device_id, _wirelessly_connected);
  } catch (const std::system_error &e) {
    LOGMUX_WARN("could not start system log capture for {}: {}", _device_id,
                e.what());
    return false;
  }
  if (!_process) {
    LOGMUX_WARN("no system log capture process for {}", _device_id);
    return false;
  }

  const int out_fd = _process->stdout_fd();
  const int err_fd = _process->stderr_fd();
  _readers.emplace_back([this, out_fd, &sink]() { read_loop(out_fd, sink); });
  _readers.emplace_back([this, err_fd, &sink]() { read_loop(err_fd, sink); });
  LOGMUX_INFO("system log capture started for {} (pid {})", _device_id,
              _process->pid());
  return true;
}

void SystemLogSource::read_loop(int fd, ISourceSink &sink) {
  MultilineReassembler reassembler(_process_name, _header_suffix);
  std::string pending;
  char chunk[kReadChunkSize];

  auto deliver = [&](std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (auto text = reassembler.handle(line)) {
      sink.on_line(SourceKind::SystemLog, std::move(*text));
    }
  };

  while (!_stopping.load(std::memory_order_acquire)) {
    pollfd pfd{fd, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, kPollIntervalMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOGMUX_WARN("poll on system log pipe failed: {}",
                  std::generic_category().message(errno));
      return;
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      LOGMUX_WARN("read on system log pipe failed: {}",
                  std::generic_category().message(errno));
      return;
    }
    if (n == 0) {
      if (!pending.empty()) {
        deliver(pending);
      }
      LOGMUX_DEBUG("system log pipe {} reached end of stream", fd);
      return;
    }

    pending.append(chunk, static_cast<size_t>(n));
    size_t begin = 0;
    for (size_t nl = pending.find('\n', begin); nl != std::string::npos;
         nl = pending.find('\n', begin)) {
      deliver(std::string_view(pending).substr(begin, nl - begin));
      begin = nl + 1;
    }
    pending.erase(0, begin);
  }
}

void SystemLogSource::stop() {
  std::unique_ptr<CaptureProcess> process;
  std::vector<std::thread> readers;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _stopping.store(true, std::memory_order_release);
    process = std::move(_process);
    readers = std::move(_readers);
  }

  if (process) {
    LOGMUX_INFO("killing system log capture (pid {})", process->pid());
    process->kill();
  }
  for (auto &reader : readers) {
    if (reader.joinable()) {
      reader.join();
    }
  }
  // The pipes close with the process object, after the readers are gone.
  process.reset();
}

bool SystemLogSource::process_running() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _process && !_process->exited();
}

} // namespace Logmux
