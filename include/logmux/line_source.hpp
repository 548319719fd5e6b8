#pragma once

#include "logmux/logmux_common_types.hpp"

#include <functional>
#include <memory>
#include <string>

namespace Logmux {

using LineCallback = std::function<void(const std::string &line)>;
using ErrorCallback = std::function<void(const std::string &message)>;
using DoneCallback = std::function<void()>;

/**
 * @brief A live subscription to a LineStream.
 *
 * Once cancel() returns no further callback of the subscription runs.
 * Destroying the subscription cancels it.
 */
class StreamSubscription {
public:
  virtual ~StreamSubscription() = default;
  virtual void cancel() = 0;
};

/**
 * @brief A stream of text lines owned by an external collaborator.
 *
 * Callbacks may run on any thread, but the calls of one subscription are
 * sequential and in production order. After on_error or on_done no more
 * callbacks follow.
 */
class LineStream {
public:
  virtual ~LineStream() = default;

  virtual std::unique_ptr<StreamSubscription>
  listen(LineCallback on_line, ErrorCallback on_error, DoneCallback on_done) = 0;
};

/**
 * @brief A native debugger session attached to (or launching) the app.
 *
 * Its lines are the app's console output as printed by the debugger, native
 * ones prefixed with a timestamp and process metadata.
 */
class NativeDebugger : public LineStream {
public:
  virtual bool debugger_attached() const = 0;
  virtual void detach() = 0;
};

/**
 * @brief A connection to the managed runtime's stdout/stderr event streams.
 *
 * Each "line" is the text of one event and may end with a newline.
 */
class ManagedRuntimeConnection : public LineStream {};

/**
 * @brief The vendor toolchain's remote console for managed-connectivity
 * devices.
 */
class RemoteConsole : public LineStream {};

/**
 * @brief Receives everything a LineSource produces. Called from the source's
 * threads.
 */
class ISourceSink {
public:
  virtual ~ISourceSink() = default;

  virtual void on_line(SourceKind source, std::string line) = 0;
  virtual void on_error(SourceKind source, std::string message) = 0;
  virtual void on_done(SourceKind source) = 0;
};

/**
 * @brief One backend the aggregator can take lines from.
 *
 * start() is called at most once per session and returns false if the
 * source could not start; such a source contributes nothing. stop() is
 * idempotent and, once it returns, the sink receives nothing more from this
 * source.
 */
class LineSource {
public:
  virtual ~LineSource() = default;

  virtual SourceKind kind() const = 0;
  virtual bool start(ISourceSink &sink) = 0;
  virtual void stop() = 0;
};

} // namespace Logmux
