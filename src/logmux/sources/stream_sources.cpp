#include "logmux/sources/stream_sources.hpp"

#include "logmux/logging.hpp"

#include <regex>

namespace Logmux {

// --- StreamLineSource ---

StreamLineSource::~StreamLineSource() {
  // Subclasses must have called stop(); only drop the subscription here.
  std::lock_guard<std::mutex> lock(_mutex);
  _subscription.reset();
}

void StreamLineSource::attach_stream(std::shared_ptr<LineStream> stream) {
  std::lock_guard<std::mutex> lock(_mutex);
  _stream = std::move(stream);
}

std::shared_ptr<LineStream> StreamLineSource::stream() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _stream;
}

bool StreamLineSource::has_stream() const { return stream() != nullptr; }

bool StreamLineSource::start(ISourceSink &sink) {
  std::shared_ptr<LineStream> stream;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_started || _stopped || !_stream) {
      return false;
    }
    _started = true;
    stream = _stream;
  }

  const SourceKind source = kind();
  auto subscription = stream->listen(
      [this, &sink, source](const std::string &line) {
        if (auto text = transform(line)) {
          sink.on_line(source, std::move(*text));
        }
      },
      [this, &sink, source](const std::string &message) {
        if (ends_output()) {
          sink.on_error(source, message);
        } else {
          LOGMUX_WARN("{} stream error ignored: {}", to_string(source),
                      message);
        }
      },
      [this, &sink, source]() {
        if (ends_output()) {
          sink.on_done(source);
        } else {
          LOGMUX_DEBUG("{} stream ended", to_string(source));
        }
      });

  if (!subscription) {
    LOGMUX_WARN("{} stream refused the subscription", to_string(source));
    return false;
  }
  {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_stopped) {
      // stop() ran while we were subscribing.
      lock.unlock();
      subscription->cancel();
      return false;
    }
    _subscription = std::move(subscription);
  }
  LOGMUX_INFO("{} source started", to_string(source));
  return true;
}

void StreamLineSource::stop() {
  std::unique_ptr<StreamSubscription> subscription;
  std::shared_ptr<LineStream> stream;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_stopped) {
      return;
    }
    _stopped = true;
    subscription = std::move(_subscription);
    stream = _stream;
  }
  if (subscription) {
    subscription->cancel();
    LOGMUX_DEBUG("{} source stopped", to_string(kind()));
  }
  if (stream) {
    on_stopped(stream);
  }
}

// --- NativeDebuggerSource ---

void NativeDebuggerSource::attach(std::shared_ptr<NativeDebugger> debugger) {
  attach_stream(std::move(debugger));
}

std::shared_ptr<NativeDebugger> NativeDebuggerSource::debugger() const {
  return std::static_pointer_cast<NativeDebugger>(stream());
}

bool NativeDebuggerSource::debugger_attached() const {
  auto current = debugger();
  return current && current->debugger_attached();
}

std::string NativeDebuggerSource::strip_metadata(const std::string &line) {
  // Date, time, process[pid:tid], then the message.
  static const std::regex metadata(R"(^\S* \S* \S*\[[0-9:]*] (.*))");
  std::smatch match;
  if (std::regex_search(line, match, metadata)) {
    return match[1].str();
  }
  return line;
}

void NativeDebuggerSource::on_stopped(const std::shared_ptr<LineStream> &) {
  if (auto current = debugger()) {
    current->detach();
  }
}

// --- ManagedRuntimeSource ---

void ManagedRuntimeSource::attach(
    std::shared_ptr<ManagedRuntimeConnection> connection) {
  const bool connected = connection != nullptr;
  attach_stream(std::move(connection));
  _connected.store(connected, std::memory_order_release);
}

std::optional<std::string>
ManagedRuntimeSource::transform(const std::string &line) const {
  std::string message = line;
  if (!message.empty() && message.back() == '\n') {
    message.pop_back();
  }
  if (message.empty()) {
    return std::nullopt;
  }
  return message;
}

} // namespace Logmux
