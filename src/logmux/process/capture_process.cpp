#include "logmux/capture_process.hpp"

#include "logmux/logging.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <stdexcept>
#include <system_error>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace Logmux {

namespace {
void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void close_pair(int (&fds)[2]) {
  close_fd(fds[0]);
  close_fd(fds[1]);
}

// Both ends are close-on-exec from the start, so children spawned
// concurrently by other sessions never inherit them. dup2() in our own child
// clears the flag on the copies it makes.
void make_pipe(int (&fds)[2], const char *what) {
  if (::pipe2(fds, O_CLOEXEC) < 0) {
    throw std::system_error(errno, std::generic_category(), what);
  }
}
} // namespace

std::unique_ptr<CaptureProcess>
CaptureProcess::spawn(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    throw std::invalid_argument("CaptureProcess::spawn needs an executable");
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  // Stays open only until exec succeeds; carries errno if it does not.
  int exec_pipe[2] = {-1, -1};
  try {
    make_pipe(out_pipe, "pipe for stdout");
    make_pipe(err_pipe, "pipe for stderr");
    make_pipe(exec_pipe, "pipe for exec status");
  } catch (...) {
    close_pair(out_pipe);
    close_pair(err_pipe);
    close_pair(exec_pipe);
    throw;
  }

  // Built before fork: the child may only make async-signal-safe calls.
  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int fork_errno = errno;
    close_pair(out_pipe);
    close_pair(err_pipe);
    close_pair(exec_pipe);
    throw std::system_error(fork_errno, std::generic_category(), "fork");
  }

  if (pid == 0) {
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);
    ::close(exec_pipe[0]);
    if (::dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
        ::dup2(err_pipe[1], STDERR_FILENO) < 0) {
      const int dup_errno = errno;
      (void)!::write(exec_pipe[1], &dup_errno, sizeof(dup_errno));
      ::_exit(127);
    }
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::execvp(c_argv[0], c_argv.data());
    const int exec_errno = errno;
    (void)!::write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
    ::_exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    throw std::system_error(child_errno, std::generic_category(),
                            "exec " + argv[0]);
  }

  LOGMUX_DEBUG("started '{}' as pid {}", argv[0], pid);
  return std::unique_ptr<CaptureProcess>(
      new CaptureProcess(pid, out_pipe[0], err_pipe[0]));
}

CaptureProcess::CaptureProcess(pid_t pid, int stdout_fd, int stderr_fd)
    : _pid(pid), _stdout_fd(stdout_fd), _stderr_fd(stderr_fd) {}

CaptureProcess::~CaptureProcess() {
  kill();
  close_fd(_stdout_fd);
  close_fd(_stderr_fd);
}

bool CaptureProcess::try_reap() {
  if (_reaped) {
    return true;
  }
  int status = 0;
  const pid_t result = ::waitpid(_pid, &status, WNOHANG);
  if (result == _pid || (result < 0 && errno == ECHILD)) {
    _reaped = true;
  }
  return _reaped;
}

void CaptureProcess::kill(std::chrono::milliseconds grace) {
  if (try_reap()) {
    return;
  }

  ::kill(_pid, SIGTERM);
  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (try_reap()) {
      LOGMUX_DEBUG("pid {} terminated", _pid);
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  LOGMUX_WARN("pid {} ignored SIGTERM, sending SIGKILL", _pid);
  ::kill(_pid, SIGKILL);
  int status = 0;
  while (::waitpid(_pid, &status, 0) < 0 && errno == EINTR) {
  }
  _reaped = true;
}

std::vector<std::string>
IdeviceSyslogLauncher::command_line(const std::string &device_id,
                                    bool wirelessly_connected) const {
  std::vector<std::string> argv{_executable, "-u", device_id};
  if (wirelessly_connected) {
    argv.emplace_back("--network");
  }
  return argv;
}

std::unique_ptr<CaptureProcess>
IdeviceSyslogLauncher::start_logger(const std::string &device_id,
                                    bool wirelessly_connected) {
  return CaptureProcess::spawn(command_line(device_id, wirelessly_connected));
}

} // namespace Logmux
