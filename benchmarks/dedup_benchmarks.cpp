#include <benchmark/benchmark.h>
#include <string>
#include <vector>

#include "logmux/line_deduplicator.hpp"
#include "logmux/multiline_reassembler.hpp"
#include "logmux/vis_decoder.hpp"

using Logmux::Admission;
using Logmux::LineDeduplicator;
using Logmux::SourceKind;
using Logmux::SourceSelection;

namespace {
const SourceSelection kSelection{SourceKind::NativeDebugger,
                                 SourceKind::ManagedRuntime};

std::vector<std::string> make_lines(size_t count) {
  std::vector<std::string> lines;
  lines.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    lines.push_back("flutter: frame " + std::to_string(i) + " rendered");
  }
  return lines;
}
} // namespace

/**
 * @brief BM_Dedup_FallbackThenPrimary
 *
 * @Measures: The worst case of the policy, where the fallback is always ahead
 * and each primary line searches the pending buffer. The argument is how far
 * ahead the fallback runs, i.e. the pending buffer size.
 *
 * @When_To_Be_Concerned:
 *   - Time per line growing much faster than the lag.
 */
static void BM_Dedup_FallbackThenPrimary(benchmark::State &state) {
  const auto lag = static_cast<size_t>(state.range(0));
  const auto lines = make_lines(lag);
  for (auto _ : state) {
    LineDeduplicator dedup;
    for (const auto &line : lines) {
      benchmark::DoNotOptimize(
          dedup.admit(line, SourceKind::ManagedRuntime, kSelection));
    }
    for (const auto &line : lines) {
      if (dedup.admit(line, SourceKind::NativeDebugger, kSelection) !=
          Admission::Drop) {
        state.SkipWithError("Primary duplicate was not dropped");
        break;
      }
    }
  }
  state.SetItemsProcessed(state.iterations() * 2 *
                          static_cast<int64_t>(lag));
}
BENCHMARK(BM_Dedup_FallbackThenPrimary)->Arg(8)->Arg(64)->Arg(512);

static void BM_Multiline_SystemLogLines(benchmark::State &state) {
  const std::vector<std::string> input{
      "Sep 15 19:15:10 iPhone Runner(Flutter)[297] <Notice>: flutter: frame",
      "  continuation of the frame message",
      "Sep 15 19:15:10 iPhone SpringBoard[55] <Notice>: unrelated",
      R"(Sep 15 19:15:10 iPhone Runner[297] <Notice>: caf\M-C\M-) ok)",
  };
  Logmux::MultilineReassembler reassembler("Runner");
  for (auto _ : state) {
    for (const auto &line : input) {
      benchmark::DoNotOptimize(reassembler.handle(line));
    }
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_Multiline_SystemLogLines);

static void BM_VisDecode(benchmark::State &state) {
  const std::string line =
      R"(flutter: \M-b\M^@\M^Y quoted \342\200\231 and plain text around it)";
  for (auto _ : state) {
    benchmark::DoNotOptimize(Logmux::decode_syslog(line));
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_VisDecode);
