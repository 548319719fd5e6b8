#include <catch2/catch_all.hpp>

#include "logmux/sources/stream_sources.hpp"
#include "test_support.hpp"

#include <mutex>
#include <string>
#include <vector>

using Logmux::ManagedRuntimeSource;
using Logmux::NativeDebuggerSource;
using Logmux::RemoteConsoleSource;
using Logmux::SourceKind;
using namespace logmux_test;

namespace {
// Records what a source hands over, on the calling thread.
struct RecordingSink : Logmux::ISourceSink {
  std::mutex mutex;
  std::vector<std::pair<SourceKind, std::string>> lines;
  std::vector<std::string> errors;
  int done_count = 0;

  void on_line(SourceKind source, std::string line) override {
    std::lock_guard<std::mutex> lock(mutex);
    lines.emplace_back(source, std::move(line));
  }
  void on_error(SourceKind, std::string message) override {
    std::lock_guard<std::mutex> lock(mutex);
    errors.push_back(std::move(message));
  }
  void on_done(SourceKind) override {
    std::lock_guard<std::mutex> lock(mutex);
    ++done_count;
  }
};
} // namespace

TEST_CASE("strip_metadata", "[sources]") {
  REQUIRE(NativeDebuggerSource::strip_metadata(
              "2020-09-15 19:15:10.931434-0700 Runner[541:226276] Did finish "
              "launching.") == "Did finish launching.");
  REQUIRE(NativeDebuggerSource::strip_metadata(
              "2020-09-15 19:15:10.931434-0700 Runner[541:226276] [Category] "
              "text") == "[Category] text");
  REQUIRE(NativeDebuggerSource::strip_metadata("flutter: hello") ==
          "flutter: hello");
  REQUIRE(NativeDebuggerSource::strip_metadata("") == "");
}

TEST_CASE("A stream source needs an attached stream", "[sources]") {
  RecordingSink sink;
  NativeDebuggerSource source;
  REQUIRE_FALSE(source.has_stream());
  REQUIRE_FALSE(source.debugger_attached());
  REQUIRE_FALSE(source.start(sink));
}

TEST_CASE("Native debugger source", "[sources]") {
  RecordingSink sink;
  auto debugger = std::make_shared<FakeDebugger>();
  NativeDebuggerSource source;
  source.attach(debugger);
  REQUIRE(source.debugger_attached());
  REQUIRE(source.kind() == SourceKind::NativeDebugger);

  REQUIRE(source.start(sink));
  REQUIRE_FALSE(source.start(sink));
  REQUIRE(debugger->listen_count() == 1);

  debugger->emit("2020-09-15 19:15:10.931434-0700 Runner[1:2] native");
  debugger->emit("flutter: managed");
  REQUIRE(sink.lines.size() == 2);
  REQUIRE(sink.lines[0].first == SourceKind::NativeDebugger);
  REQUIRE(sink.lines[0].second == "native");
  REQUIRE(sink.lines[1].second == "flutter: managed");

  SECTION("Errors and end are forwarded") {
    debugger->fail("gone");
    REQUIRE(sink.errors == std::vector<std::string>{"gone"});
  }

  SECTION("stop cancels and detaches once") {
    source.stop();
    source.stop();
    REQUIRE(debugger->cancel_count() == 1);
    REQUIRE(debugger->detach_count() == 1);
    REQUIRE_FALSE(source.debugger_attached());
    debugger->emit("flutter: after stop");
    REQUIRE(sink.lines.size() == 2);
  }
}

TEST_CASE("A stopped source does not start", "[sources]") {
  RecordingSink sink;
  auto console = std::make_shared<FakeConsole>();
  RemoteConsoleSource source;
  source.attach(console);
  source.stop();
  REQUIRE_FALSE(source.start(sink));
  REQUIRE(console->listen_count() == 0);
}

TEST_CASE("Managed runtime source", "[sources]") {
  RecordingSink sink;
  auto runtime = std::make_shared<FakeRuntime>();
  ManagedRuntimeSource source;
  REQUIRE_FALSE(source.connected());
  source.attach(runtime);
  REQUIRE(source.connected());
  REQUIRE(source.start(sink));

  runtime->emit("flutter: one\n");
  runtime->emit("\n");
  runtime->emit("");
  runtime->emit("two\n\n");
  REQUIRE(sink.lines.size() == 2);
  REQUIRE(sink.lines[0].second == "flutter: one");
  REQUIRE(sink.lines[1].second == "two\n");

  runtime->fail("service gone");
  REQUIRE(sink.errors.empty());
  REQUIRE(sink.done_count == 0);
}

TEST_CASE("Remote console source forwards lines unchanged", "[sources]") {
  RecordingSink sink;
  auto console = std::make_shared<FakeConsole>();
  RemoteConsoleSource source;
  source.attach(console);
  REQUIRE(source.start(sink));

  console->emit("2020-09-15 19:15:10.931434-0700 Runner[1:2] kept");
  REQUIRE(sink.lines.size() == 1);
  REQUIRE(sink.lines[0].first == SourceKind::RemoteConsole);
  REQUIRE(sink.lines[0].second ==
          "2020-09-15 19:15:10.931434-0700 Runner[1:2] kept");

  console->finish();
  REQUIRE(sink.done_count == 1);
}
