#pragma once

#include "logmux/line_source.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace Logmux {

/**
 * @brief Base for sources backed by a collaborator-owned LineStream.
 *
 * The source exists from the start of the session; the live stream is
 * supplied later through attach(). start() subscribes to whatever stream is
 * attached at that moment.
 */
class StreamLineSource : public LineSource {
public:
  ~StreamLineSource() override;

  bool start(ISourceSink &sink) override;
  void stop() override;

  bool has_stream() const;

protected:
  void attach_stream(std::shared_ptr<LineStream> stream);
  std::shared_ptr<LineStream> stream() const;

  // Returns the text to forward, or std::nullopt to skip the line.
  virtual std::optional<std::string> transform(const std::string &line) const {
    return line;
  }
  // Whether an error or end of this stream ends the aggregated stream.
  virtual bool ends_output() const { return true; }
  virtual void on_stopped(const std::shared_ptr<LineStream> &) {}

private:
  mutable std::mutex _mutex;
  std::shared_ptr<LineStream> _stream;
  std::unique_ptr<StreamSubscription> _subscription;
  bool _started = false;
  bool _stopped = false;
};

/**
 * @brief Console output relayed by an attached native debugger.
 */
class NativeDebuggerSource : public StreamLineSource {
public:
  ~NativeDebuggerSource() override { stop(); }

  SourceKind kind() const override { return SourceKind::NativeDebugger; }

  void attach(std::shared_ptr<NativeDebugger> debugger);
  bool debugger_attached() const;

  /**
   * @brief Strips native logging metadata, keeping a [Category] if present:
   * "2020-09-15 19:15:10.931434-0700 Runner[541:226276] text" -> "text".
   * Lines printed by managed code carry no metadata and pass unchanged.
   */
  static std::string strip_metadata(const std::string &line);

protected:
  std::optional<std::string> transform(const std::string &line) const override {
    return strip_metadata(line);
  }
  void on_stopped(const std::shared_ptr<LineStream> &stream) override;

private:
  std::shared_ptr<NativeDebugger> debugger() const;
};

/**
 * @brief stdout/stderr events of the managed runtime.
 *
 * The runtime appends a newline to every event; it is removed and empty
 * events are skipped. Errors are logged and otherwise ignored.
 */
class ManagedRuntimeSource : public StreamLineSource {
public:
  ~ManagedRuntimeSource() override { stop(); }

  SourceKind kind() const override { return SourceKind::ManagedRuntime; }

  void attach(std::shared_ptr<ManagedRuntimeConnection> connection);
  bool connected() const { return _connected.load(std::memory_order_acquire); }

protected:
  std::optional<std::string> transform(const std::string &line) const override;
  bool ends_output() const override { return false; }

private:
  std::atomic<bool> _connected{false};
};

/**
 * @brief Lines from the vendor remote console, forwarded unchanged.
 */
class RemoteConsoleSource : public StreamLineSource {
public:
  ~RemoteConsoleSource() override { stop(); }

  SourceKind kind() const override { return SourceKind::RemoteConsole; }

  void attach(std::shared_ptr<RemoteConsole> console) {
    attach_stream(std::move(console));
  }
};

} // namespace Logmux
