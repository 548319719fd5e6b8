#include <atomic>
#include <benchmark/benchmark.h>
#include <string>
#include <thread>
#include <vector>

#include "logmux/helpers/mpsc_ring_buffer.hpp"
#include "logmux/log_aggregator.hpp"

using Logmux::SourceEvent;
using Logmux::SourceKind;
using Logmux::helpers::MpscRingBuffer;

constexpr size_t kBenchQueueCapacity = 1024;

/**
 * @brief BM_EventQueue_SingleThread_PushPop
 *
 * @Measures: One push immediately followed by one pop of a line event, from a
 * single thread. Baseline cost of moving a SourceEvent through the queue
 * without contention or full/empty effects.
 *
 * @What_To_Look_For:
 *   - **`items_per_second`**: higher is better.
 *   - The line length argument shows how much of the cost is the string
 *     move rather than the queue itself.
 */
static void BM_EventQueue_SingleThread_PushPop(benchmark::State &state) {
  MpscRingBuffer<SourceEvent> queue(kBenchQueueCapacity);
  const std::string line(static_cast<size_t>(state.range(0)), 'x');
  SourceEvent popped;
  for (auto _ : state) {
    if (!queue.try_push(
            {SourceEvent::Type::Line, SourceKind::SystemLog, line})) {
      state.SkipWithError("Queue full during push");
      break;
    }
    if (!queue.try_pop(popped)) {
      state.SkipWithError("Queue empty during pop");
      break;
    }
    benchmark::DoNotOptimize(popped.text.data());
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_EventQueue_SingleThread_PushPop)->Arg(16)->Arg(128)->Arg(1024);

/**
 * @brief BM_EventQueue_Sources
 *
 * @Measures: Throughput with one producer thread per log source pushing line
 * events and the benchmark thread consuming, as the processing thread does.
 *
 * @What_To_Look_For:
 *   - **`items_per_second`** as the number of sources grows. Up to four
 *     sources are realistic; throughput should not collapse.
 *
 * @When_To_Be_Concerned:
 *   - Negative scaling or a benchmark that does not finish.
 */
static void BM_EventQueue_Sources(benchmark::State &state) {
  const int num_sources = static_cast<int>(state.range(0));
  const long items_per_source = 8192;
  const long total_items = items_per_source * num_sources;
  MpscRingBuffer<SourceEvent> queue(kBenchQueueCapacity);

  for (auto _ : state) {
    std::vector<std::thread> producers;
    for (int i = 0; i < num_sources; ++i) {
      producers.emplace_back([&queue, items_per_source, i]() {
        const auto source = static_cast<SourceKind>(i % 4);
        for (long j = 0; j < items_per_source; ++j) {
          SourceEvent event{SourceEvent::Type::Line, source,
                            "flutter: line " + std::to_string(j)};
          while (!queue.try_push(std::move(event))) {
            std::this_thread::yield();
          }
        }
      });
    }

    long consumed = 0;
    SourceEvent popped;
    while (consumed < total_items) {
      if (queue.try_pop(popped)) {
        benchmark::DoNotOptimize(popped.text.data());
        ++consumed;
      } else {
        std::this_thread::yield();
      }
    }

    state.PauseTiming();
    for (auto &t : producers) {
      t.join();
    }
    state.ResumeTiming();
  }
  state.SetItemsProcessed(state.iterations() * total_items);
}
BENCHMARK(BM_EventQueue_Sources)
    ->Arg(1)
    ->Arg(2)
    ->Arg(4)
    ->Unit(benchmark::kMillisecond);

/**
 * @brief BM_EventQueue_HighContention
 *
 * @Measures: Producers hammering a queue of 64 slots, so pushes regularly
 * find it full. Stresses the ticket CAS on `_tail`.
 */
static void BM_EventQueue_HighContention(benchmark::State &state) {
  const int num_producers = static_cast<int>(state.range(0));
  MpscRingBuffer<long> queue(64);
  const long items_per_producer = 32768 / num_producers;
  const long total_items = items_per_producer * num_producers;

  for (auto _ : state) {
    std::vector<std::thread> producers;
    for (int i = 0; i < num_producers; ++i) {
      producers.emplace_back([&queue, items_per_producer, i]() {
        for (long j = 0; j < items_per_producer; ++j) {
          long val = (static_cast<long>(i) << 32) | j;
          while (!queue.try_push(std::move(val))) {
            std::this_thread::yield();
          }
        }
      });
    }

    long consumed = 0;
    long popped = 0;
    while (consumed < total_items) {
      if (queue.try_pop(popped)) {
        benchmark::DoNotOptimize(popped);
        ++consumed;
      } else {
        std::this_thread::yield();
      }
    }

    state.PauseTiming();
    for (auto &t : producers) {
      t.join();
    }
    state.ResumeTiming();
  }
  state.SetItemsProcessed(state.iterations() * total_items);
}
BENCHMARK(BM_EventQueue_HighContention)
    ->Arg(1)
    ->Arg(2)
    ->Arg(4)
    ->Arg(8)
    ->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
