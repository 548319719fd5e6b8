#include "logmux/log_aggregator.hpp"

#include "logmux/helpers/mpsc_ring_buffer.hpp"
#include "logmux/logging.hpp"
#include "logmux/source_classifier.hpp"
#include "logmux/sources/stream_sources.hpp"
#include "logmux/sources/system_log_source.hpp"

#include <chrono>
#include <stdexcept>

namespace Logmux {

namespace {
constexpr auto kIdleSleep = std::chrono::milliseconds(1);
} // namespace

// --- Subscription ---

Subscription::Subscription(std::weak_ptr<LogAggregator> aggregator,
                           uint64_t id)
    : _aggregator(std::move(aggregator)), _id(id) {}

Subscription::Subscription(Subscription &&other) noexcept
    : _aggregator(std::move(other._aggregator)), _id(other._id) {
  other._id = 0;
}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    cancel();
    _aggregator = std::move(other._aggregator);
    _id = other._id;
    other._id = 0;
  }
  return *this;
}

Subscription::~Subscription() { cancel(); }

void Subscription::cancel() {
  if (_id == 0) {
    return;
  }
  const uint64_t id = _id;
  _id = 0;
  if (auto aggregator = _aggregator.lock()) {
    aggregator->cancel_listener(id);
  }
  _aggregator.reset();
}

// --- SourceSink ---

void LogAggregator::SourceSink::on_line(SourceKind source, std::string line) {
  _owner.post({SourceEvent::Type::Line, source, std::move(line)});
}

void LogAggregator::SourceSink::on_error(SourceKind source,
                                         std::string message) {
  _owner.post({SourceEvent::Type::Error, source, std::move(message)});
}

void LogAggregator::SourceSink::on_done(SourceKind source) {
  _owner.post({SourceEvent::Type::Done, source, {}});
}

// --- LogAggregator ---

std::shared_ptr<LogAggregator>
LogAggregator::create(LogReaderConfig config,
                      std::shared_ptr<SyslogLauncher> launcher) {
  if (!launcher) {
    launcher =
        std::make_shared<IdeviceSyslogLauncher>(config.syslog_executable);
  }
  return std::shared_ptr<LogAggregator>(
      new LogAggregator(std::move(config), std::move(launcher)));
}

LogAggregator::LogAggregator(LogReaderConfig config,
                             std::shared_ptr<SyslogLauncher> launcher)
    : _config(std::move(config)),
      _listeners(std::make_shared<const ListenerList>()) {
  _system_log_source = std::make_unique<SystemLogSource>(
      std::move(launcher), _config.device_id,
      _config.traits.wirelessly_connected, _config.process_name(),
      _config.header_suffix);
  _native_debugger_source = std::make_unique<NativeDebuggerSource>();
  _managed_runtime_source = std::make_unique<ManagedRuntimeSource>();
  _remote_console_source = std::make_unique<RemoteConsoleSource>();
  _queue = std::make_unique<helpers::MpscRingBuffer<SourceEvent>>(
      _config.queue_capacity);
}

LogAggregator::~LogAggregator() {
  dispose();
  if (_processing_thread.joinable()) {
    if (on_processing_thread()) {
      _processing_thread.detach();
    } else {
      _processing_thread.join();
    }
  }
}

SourceSelection LogAggregator::log_sources() const {
  return classify(ClassifierInputs::from_traits(
      _config.traits, _native_debugger_source->debugger_attached(),
      _managed_runtime_source->connected()));
}

bool LogAggregator::uses_system_log() const {
  return log_sources().uses(SourceKind::SystemLog);
}

bool LogAggregator::uses_native_debugger() const {
  return log_sources().uses(SourceKind::NativeDebugger);
}

bool LogAggregator::uses_managed_runtime() const {
  return log_sources().uses(SourceKind::ManagedRuntime);
}

bool LogAggregator::uses_remote_console() const {
  return log_sources().uses(SourceKind::RemoteConsole);
}

Subscription LogAggregator::listen(LineCallback on_line,
                                   ErrorCallback on_error,
                                   DoneCallback on_done) {
  if (!on_line) {
    throw std::invalid_argument("LogAggregator::listen needs a line callback");
  }

  std::unique_lock<std::mutex> lifecycle(_lifecycle_mutex);
  if (state() == SessionState::Disposed) {
    throw std::logic_error("LogAggregator::listen on a disposed session");
  }
  if (output_closed()) {
    lifecycle.unlock();
    if (on_done) {
      on_done();
    }
    return Subscription();
  }

  uint64_t id;
  {
    std::lock_guard<std::mutex> lock(_listeners_mutex);
    id = _next_listener_id++;
    auto updated = std::make_shared<ListenerList>(*_listeners);
    updated->push_back(
        {id, std::move(on_line), std::move(on_error), std::move(on_done)});
    _listeners = std::move(updated);
  }

  if (state() == SessionState::Idle) {
    activate();
  }
  return Subscription(weak_from_this(), id);
}

void LogAggregator::activate() {
  _state.store(SessionState::Active, std::memory_order_release);
  _processing_thread = std::thread([this]() { process_loop(); });

  const SourceSelection selection = log_sources();
  LOGMUX_INFO("log session for '{}' on {} active: primary {}, fallback {}",
              _config.process_name(), _config.device_id,
              to_string(selection.primary),
              selection.fallback ? to_string(*selection.fallback) : "none");

  // The system log is the only source that runs without a launched app.
  if (selection.uses(SourceKind::SystemLog)) {
    start_source(*_system_log_source);
  }
}

void LogAggregator::start_source(LineSource &source) {
  if (!source.start(_sink)) {
    LOGMUX_DEBUG("{} source contributes nothing to this session",
                 to_string(source.kind()));
  }
}

void LogAggregator::provide_managed_runtime(
    std::shared_ptr<ManagedRuntimeConnection> connection) {
  if (!connection) {
    throw std::invalid_argument("provide_managed_runtime needs a connection");
  }
  std::lock_guard<std::mutex> lifecycle(_lifecycle_mutex);
  if (state() == SessionState::Disposed || !uses_managed_runtime()) {
    return;
  }
  _managed_runtime_source->attach(std::move(connection));
  start_source(*_managed_runtime_source);
}

void LogAggregator::listen_to_native_debugger(
    std::shared_ptr<NativeDebugger> debugger) {
  if (!debugger) {
    throw std::invalid_argument("listen_to_native_debugger needs a debugger");
  }
  std::lock_guard<std::mutex> lifecycle(_lifecycle_mutex);
  if (state() == SessionState::Disposed || !uses_native_debugger()) {
    return;
  }
  _native_debugger_source->attach(std::move(debugger));
  start_source(*_native_debugger_source);
}

void LogAggregator::listen_to_remote_console(
    std::shared_ptr<RemoteConsole> console) {
  if (!console) {
    throw std::invalid_argument("listen_to_remote_console needs a console");
  }
  std::lock_guard<std::mutex> lifecycle(_lifecycle_mutex);
  if (state() == SessionState::Disposed || !uses_remote_console()) {
    return;
  }
  _remote_console_source->attach(std::move(console));
  start_source(*_remote_console_source);
}

void LogAggregator::post(SourceEvent event) {
  while (state() == SessionState::Active && !output_closed()) {
    if (_queue->try_push(std::move(event))) {
      _enqueued.fetch_add(1, std::memory_order_release);
      return;
    }
    // Full: wait for the processing thread to catch up.
    std::this_thread::sleep_for(kIdleSleep);
  }
}

void LogAggregator::process_loop() {
  _processing_thread_id.store(std::this_thread::get_id(),
                              std::memory_order_release);
  SourceEvent event;
  while (!_shutdown_flag.load(std::memory_order_acquire)) {
    if (_queue->try_pop(event)) {
      handle(event);
      _processed.fetch_add(1, std::memory_order_release);
    } else {
      std::this_thread::sleep_for(kIdleSleep);
    }
  }
}

void LogAggregator::handle(const SourceEvent &event) {
  if (output_closed()) {
    return;
  }
  switch (event.type) {
  case SourceEvent::Type::Line: {
    const SourceSelection selection = log_sources();
    if (_deduplicator.admit(event.text, event.source, selection) ==
        Admission::Emit) {
      broadcast_line(event.text);
    } else {
      LOGMUX_TRACE("dropped {} line: {}", to_string(event.source), event.text);
    }
    break;
  }
  case SourceEvent::Type::Error:
    LOGMUX_ERROR("{} stream failed: {}", to_string(event.source), event.text);
    close_output(&event.text);
    break;
  case SourceEvent::Type::Done:
    LOGMUX_INFO("{} stream ended, closing output", to_string(event.source));
    close_output(nullptr);
    break;
  }
}

std::shared_ptr<const LogAggregator::ListenerList>
LogAggregator::listeners_snapshot() const {
  std::lock_guard<std::mutex> lock(_listeners_mutex);
  return _listeners;
}

bool LogAggregator::on_processing_thread() const {
  return std::this_thread::get_id() ==
         _processing_thread_id.load(std::memory_order_acquire);
}

// True while this thread runs listener callbacks, on the processing thread
// or inside close_output() called from dispose(). _dispatch_mutex is held
// then and must not be taken again.
bool LogAggregator::dispatching_here() const {
  return on_processing_thread() ||
         _dispatch_owner.load(std::memory_order_acquire) ==
             std::this_thread::get_id();
}

void LogAggregator::broadcast_line(const std::string &line) {
  const auto listeners = listeners_snapshot();
  std::lock_guard<std::mutex> dispatch(_dispatch_mutex);
  _dispatch_owner.store(std::this_thread::get_id(), std::memory_order_release);
  for (const auto &listener : *listeners) {
    listener.on_line(line);
  }
  _dispatch_owner.store(std::thread::id(), std::memory_order_release);
}

void LogAggregator::close_output(const std::string *error) {
  if (_closed.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  const auto listeners = listeners_snapshot();
  std::unique_lock<std::mutex> dispatch(_dispatch_mutex, std::defer_lock);
  if (!dispatching_here()) {
    dispatch.lock();
    _dispatch_owner.store(std::this_thread::get_id(),
                          std::memory_order_release);
  }
  for (const auto &listener : *listeners) {
    if (error && listener.on_error) {
      listener.on_error(*error);
    }
    if (listener.on_done) {
      listener.on_done();
    }
  }
  if (dispatch.owns_lock()) {
    _dispatch_owner.store(std::thread::id(), std::memory_order_release);
  }
}

void LogAggregator::cancel_listener(uint64_t id) {
  bool last = false;
  {
    std::lock_guard<std::mutex> lock(_listeners_mutex);
    auto updated = std::make_shared<ListenerList>();
    for (const auto &listener : *_listeners) {
      if (listener.id != id) {
        updated->push_back(listener);
      }
    }
    last = updated->empty();
    _listeners = std::move(updated);
  }

  if (!dispatching_here()) {
    // Wait out a callback that may still be running on the old snapshot.
    std::lock_guard<std::mutex> dispatch(_dispatch_mutex);
  }

  if (last) {
    dispose();
  }
}

void LogAggregator::flush() {
  if (on_processing_thread()) {
    return;
  }
  const uint64_t target = _enqueued.load(std::memory_order_acquire);
  while (state() == SessionState::Active &&
         _processed.load(std::memory_order_acquire) < target) {
    std::this_thread::sleep_for(kIdleSleep);
  }
}

void LogAggregator::dispose() {
  {
    std::lock_guard<std::mutex> lifecycle(_lifecycle_mutex);
    if (state() == SessionState::Disposed) {
      return;
    }
    _state.store(SessionState::Disposed, std::memory_order_release);
  }
  LOGMUX_INFO("disposing log session for '{}' on {}", _config.process_name(),
              _config.device_id);

  // Producers blocked on a full queue give up once the state changed.
  _system_log_source->stop();
  _native_debugger_source->stop();
  _managed_runtime_source->stop();
  _remote_console_source->stop();

  _shutdown_flag.store(true, std::memory_order_release);
  if (_processing_thread.joinable() && !on_processing_thread()) {
    _processing_thread.join();
  }

  // Listeners still attached at an explicit dispose learn the stream ended.
  close_output(nullptr);
  {
    std::lock_guard<std::mutex> lock(_listeners_mutex);
    _listeners = std::make_shared<const ListenerList>();
  }
  // The processing thread is either joined or the caller itself.
  _deduplicator.reset();
}

} // namespace Logmux
