#pragma once

// Fakes for the collaborators of LogAggregator and a few waiting helpers.

#include "logmux/capture_process.hpp"
#include "logmux/line_source.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <system_error>
#include <thread>
#include <vector>

namespace logmux_test {

inline bool wait_until(const std::function<bool()> &predicate,
                       std::chrono::milliseconds timeout =
                           std::chrono::milliseconds(5000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

// Thread-safe record of what a listener received.
struct Collector {
  mutable std::mutex mutex;
  std::vector<std::string> lines;
  std::vector<std::string> errors;
  int done_count = 0;

  Logmux::LineCallback on_line() {
    return [this](const std::string &line) {
      std::lock_guard<std::mutex> lock(mutex);
      lines.push_back(line);
    };
  }
  Logmux::ErrorCallback on_error() {
    return [this](const std::string &message) {
      std::lock_guard<std::mutex> lock(mutex);
      errors.push_back(message);
    };
  }
  Logmux::DoneCallback on_done() {
    return [this]() {
      std::lock_guard<std::mutex> lock(mutex);
      ++done_count;
    };
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return lines;
  }
  std::vector<std::string> error_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return errors;
  }
  int dones() const {
    std::lock_guard<std::mutex> lock(mutex);
    return done_count;
  }
  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return lines.size();
  }
};

// A LineStream driven by the test thread. Base is one of the collaborator
// interfaces (NativeDebugger, ManagedRuntimeConnection, RemoteConsole).
template <typename Base> class FakeLineStream : public Base {
public:
  std::unique_ptr<Logmux::StreamSubscription>
  listen(Logmux::LineCallback on_line, Logmux::ErrorCallback on_error,
         Logmux::DoneCallback on_done) override {
    std::lock_guard<std::mutex> lock(_state->mutex);
    _state->on_line = std::move(on_line);
    _state->on_error = std::move(on_error);
    _state->on_done = std::move(on_done);
    ++_state->listen_count;
    return std::make_unique<Subscription>(_state);
  }

  void emit(const std::string &line) {
    std::lock_guard<std::mutex> lock(_state->mutex);
    if (_state->on_line) {
      _state->on_line(line);
    }
  }

  void fail(const std::string &message) {
    std::lock_guard<std::mutex> lock(_state->mutex);
    if (_state->on_error) {
      _state->on_error(message);
    }
    clear_locked();
  }

  void finish() {
    std::lock_guard<std::mutex> lock(_state->mutex);
    if (_state->on_done) {
      _state->on_done();
    }
    clear_locked();
  }

  int listen_count() const {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->listen_count;
  }
  int cancel_count() const {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->cancel_count;
  }

private:
  struct State {
    mutable std::mutex mutex;
    Logmux::LineCallback on_line;
    Logmux::ErrorCallback on_error;
    Logmux::DoneCallback on_done;
    int listen_count = 0;
    int cancel_count = 0;
  };

  class Subscription : public Logmux::StreamSubscription {
  public:
    explicit Subscription(std::shared_ptr<State> state)
        : _state(std::move(state)) {}
    ~Subscription() override { cancel(); }
    void cancel() override {
      if (!_state) {
        return;
      }
      std::lock_guard<std::mutex> lock(_state->mutex);
      _state->on_line = nullptr;
      _state->on_error = nullptr;
      _state->on_done = nullptr;
      ++_state->cancel_count;
      _state.reset();
    }

  private:
    std::shared_ptr<State> _state;
  };

  void clear_locked() {
    _state->on_line = nullptr;
    _state->on_error = nullptr;
    _state->on_done = nullptr;
  }

  std::shared_ptr<State> _state = std::make_shared<State>();
};

class FakeDebugger : public FakeLineStream<Logmux::NativeDebugger> {
public:
  explicit FakeDebugger(bool attached = true) : _attached(attached) {}

  bool debugger_attached() const override { return _attached.load(); }
  void detach() override {
    _attached.store(false);
    ++_detach_count;
  }

  void set_attached(bool attached) { _attached.store(attached); }
  int detach_count() const { return _detach_count.load(); }

private:
  std::atomic<bool> _attached;
  std::atomic<int> _detach_count{0};
};

using FakeRuntime = FakeLineStream<Logmux::ManagedRuntimeConnection>;
using FakeConsole = FakeLineStream<Logmux::RemoteConsole>;

// Runs a shell script in place of idevicesyslog.
class ScriptLauncher : public Logmux::SyslogLauncher {
public:
  explicit ScriptLauncher(std::string script) : _script(std::move(script)) {}

  std::unique_ptr<Logmux::CaptureProcess>
  start_logger(const std::string &device_id,
               bool wirelessly_connected) override {
    auto process =
        Logmux::CaptureProcess::spawn({"/bin/sh", "-c", _script});
    std::lock_guard<std::mutex> lock(_mutex);
    _device_ids.push_back(device_id);
    _wireless.push_back(wirelessly_connected);
    _pids.push_back(process->pid());
    return process;
  }

  size_t start_count() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pids.size();
  }
  pid_t last_pid() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pids.empty() ? -1 : _pids.back();
  }

private:
  std::string _script;
  mutable std::mutex _mutex;
  std::vector<std::string> _device_ids;
  std::vector<bool> _wireless;
  std::vector<pid_t> _pids;
};

class FailingLauncher : public Logmux::SyslogLauncher {
public:
  std::unique_ptr<Logmux::CaptureProcess>
  start_logger(const std::string &, bool) override {
    ++attempts;
    throw std::system_error(ENOENT, std::generic_category(),
                            "exec idevicesyslog");
  }

  std::atomic<int> attempts{0};
};

} // namespace logmux_test
