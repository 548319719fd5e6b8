#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace Logmux {

/**
 * @brief A child process whose stdout and stderr are read through pipes.
 *
 * The process is killed and reaped when the object is destroyed.
 */
class CaptureProcess {
public:
  /**
   * @brief Starts `argv[0]` (looked up in PATH) with the given arguments.
   * @throw std::system_error if the pipes cannot be created, the fork fails
   * or the executable cannot be run.
   * @throw std::invalid_argument if `argv` is empty.
   */
  static std::unique_ptr<CaptureProcess>
  spawn(const std::vector<std::string> &argv);

  ~CaptureProcess();

  CaptureProcess(const CaptureProcess &) = delete;
  CaptureProcess &operator=(const CaptureProcess &) = delete;

  pid_t pid() const { return _pid; }
  int stdout_fd() const { return _stdout_fd; }
  int stderr_fd() const { return _stderr_fd; }

  /**
   * @brief Sends SIGTERM, then SIGKILL if the process is still alive after
   * `grace`, and reaps it. Idempotent.
   */
  void kill(std::chrono::milliseconds grace = std::chrono::milliseconds(500));

  bool exited() const { return _reaped; }

private:
  CaptureProcess(pid_t pid, int stdout_fd, int stderr_fd);
  bool try_reap();

  pid_t _pid;
  int _stdout_fd;
  int _stderr_fd;
  bool _reaped = false;
};

/**
 * @brief Starts the system log capture for a device.
 */
class SyslogLauncher {
public:
  virtual ~SyslogLauncher() = default;

  /**
   * @throw std::system_error when the capture cannot be started.
   */
  virtual std::unique_ptr<CaptureProcess>
  start_logger(const std::string &device_id, bool wirelessly_connected) = 0;
};

/**
 * @brief Runs `idevicesyslog -u <device-id> [--network]`.
 */
class IdeviceSyslogLauncher : public SyslogLauncher {
public:
  explicit IdeviceSyslogLauncher(std::string executable = "idevicesyslog")
      : _executable(std::move(executable)) {}

  std::unique_ptr<CaptureProcess>
  start_logger(const std::string &device_id,
               bool wirelessly_connected) override;

  std::vector<std::string> command_line(const std::string &device_id,
                                        bool wirelessly_connected) const;

private:
  std::string _executable;
};

} // namespace Logmux
