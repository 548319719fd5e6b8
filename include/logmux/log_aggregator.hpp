#pragma once

#include "logmux/capture_process.hpp"
#include "logmux/config.hpp"
#include "logmux/line_deduplicator.hpp"
#include "logmux/line_source.hpp"
#include "logmux/logmux_common_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Logmux {

class SystemLogSource;
class NativeDebuggerSource;
class ManagedRuntimeSource;
class RemoteConsoleSource;
class LogAggregator;

namespace helpers {
template <typename T> class MpscRingBuffer;
}

enum class SessionState : uint8_t { Idle, Active, Disposed };

/**
 * @brief What a source hands to the processing thread.
 */
struct SourceEvent {
  enum class Type : uint8_t { Line, Error, Done };

  Type type = Type::Line;
  SourceKind source = SourceKind::SystemLog;
  std::string text;
};

/**
 * @brief A listener registration on a LogAggregator.
 *
 * Move-only. Cancels itself when destroyed. Cancelling the last subscription
 * of a session disposes the session.
 */
class Subscription {
public:
  Subscription() = default;
  Subscription(Subscription &&other) noexcept;
  Subscription &operator=(Subscription &&other) noexcept;
  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;
  ~Subscription();

  void cancel();
  bool active() const { return _id != 0; }

private:
  friend class LogAggregator;
  Subscription(std::weak_ptr<LogAggregator> aggregator, uint64_t id);

  std::weak_ptr<LogAggregator> _aggregator;
  uint64_t _id = 0;
};

/**
 * @brief Merges the log sources of one running application into a single
 * de-duplicated broadcast stream of lines.
 *
 * Lifecycle: Idle until the first listen(), which starts the processing
 * thread and, if selected, the system log capture. The native debugger,
 * managed runtime and remote console sources start when their handles are
 * provided. Cancelling the last subscription, or dispose(), stops every
 * source and moves to Disposed for good.
 *
 * Sources push SourceEvents into a lock-free MPSC ring buffer from their own
 * threads. A single processing thread pops them, runs the LineDeduplicator
 * against the current SourceSelection and calls listeners. Listener
 * callbacks therefore always run on that thread, one at a time. Lines that
 * arrive while nobody listens are dropped.
 *
 * An error or the end of the native debugger or remote console stream closes
 * the output: listeners get on_error (for errors) and on_done, and every
 * later line is ignored.
 *
 * Always owned by a std::shared_ptr, see create(). It must not be destroyed
 * from inside one of its own listener callbacks.
 */
class LogAggregator : public std::enable_shared_from_this<LogAggregator> {
public:
  /**
   * @param launcher Starts the system log capture. Defaults to
   * IdeviceSyslogLauncher running `config.syslog_executable`.
   */
  static std::shared_ptr<LogAggregator>
  create(LogReaderConfig config,
         std::shared_ptr<SyslogLauncher> launcher = nullptr);

  ~LogAggregator();

  LogAggregator(const LogAggregator &) = delete;
  LogAggregator &operator=(const LogAggregator &) = delete;

  /**
   * @brief Adds a listener. The first one activates the session.
   *
   * No backlog is replayed. If the output is already closed, on_done runs
   * immediately and an inactive Subscription is returned.
   * @throw std::logic_error if the session is disposed.
   * @throw std::invalid_argument if on_line is empty.
   */
  Subscription listen(LineCallback on_line, ErrorCallback on_error = {},
                      DoneCallback on_done = {});

  // Idempotent.
  void dispose();

  /**
   * @brief Blocks until every event posted before the call has been
   * processed. Returns at once when called from a listener callback or when
   * the session is not active.
   */
  void flush();

  // Hooks for handles that only exist once the app is launched. Each one is
  // a no-op if the current selection does not use that source.
  void provide_managed_runtime(std::shared_ptr<ManagedRuntimeConnection> connection);
  void listen_to_native_debugger(std::shared_ptr<NativeDebugger> debugger);
  void listen_to_remote_console(std::shared_ptr<RemoteConsole> console);

  // Recomputed on every call from the device traits and the live debugger
  // and runtime state.
  SourceSelection log_sources() const;
  bool uses_system_log() const;
  bool uses_native_debugger() const;
  bool uses_managed_runtime() const;
  bool uses_remote_console() const;

  SessionState state() const { return _state.load(std::memory_order_acquire); }
  bool output_closed() const { return _closed.load(std::memory_order_acquire); }
  const LogReaderConfig &config() const { return _config; }

private:
  struct Listener {
    uint64_t id;
    LineCallback on_line;
    ErrorCallback on_error;
    DoneCallback on_done;
  };
  using ListenerList = std::vector<Listener>;

  class SourceSink final : public ISourceSink {
  public:
    explicit SourceSink(LogAggregator &owner) : _owner(owner) {}
    void on_line(SourceKind source, std::string line) override;
    void on_error(SourceKind source, std::string message) override;
    void on_done(SourceKind source) override;

  private:
    LogAggregator &_owner;
  };

  friend class Subscription;

  LogAggregator(LogReaderConfig config, std::shared_ptr<SyslogLauncher> launcher);

  void post(SourceEvent event);
  void activate();
  void process_loop();
  void handle(const SourceEvent &event);
  void broadcast_line(const std::string &line);
  void close_output(const std::string *error);
  void cancel_listener(uint64_t id);
  void start_source(LineSource &source);
  bool on_processing_thread() const;
  bool dispatching_here() const;
  std::shared_ptr<const ListenerList> listeners_snapshot() const;

  const LogReaderConfig _config;
  SourceSink _sink{*this};

  std::unique_ptr<SystemLogSource> _system_log_source;
  std::unique_ptr<NativeDebuggerSource> _native_debugger_source;
  std::unique_ptr<ManagedRuntimeSource> _managed_runtime_source;
  std::unique_ptr<RemoteConsoleSource> _remote_console_source;

  std::unique_ptr<helpers::MpscRingBuffer<SourceEvent>> _queue;
  std::thread _processing_thread;
  std::atomic<std::thread::id> _processing_thread_id{};
  std::atomic<bool> _shutdown_flag{false};
  std::atomic<uint64_t> _enqueued{0};
  std::atomic<uint64_t> _processed{0};

  std::mutex _lifecycle_mutex;
  std::atomic<SessionState> _state{SessionState::Idle};
  std::atomic<bool> _closed{false};

  // Copy-on-write: the processing thread iterates a snapshot.
  mutable std::mutex _listeners_mutex;
  std::shared_ptr<const ListenerList> _listeners;
  uint64_t _next_listener_id = 1;
  // Held while callbacks run, so a cancel from another thread waits for an
  // in-flight callback of the cancelled listener.
  std::mutex _dispatch_mutex;
  std::atomic<std::thread::id> _dispatch_owner{};

  // Only touched on the processing thread.
  LineDeduplicator _deduplicator;
};

} // namespace Logmux
