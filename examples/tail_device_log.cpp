#include "logmux/logmux.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted.store(true); }

void usage(const char *program) {
  std::cerr << "usage: " << program
            << " <device-id> <App.app> <os-major-version> [--network]\n";
}
} // namespace

// Tails the system log of a device for one application through the
// aggregator, the way the launch workflow would before a debugger or the
// runtime connection exists. Exits when the device does not use the system
// log for this session (OS 13 or later, debugger first).
//
// Run this example with:
// ./build/tail_device_log 00008030-001A2D1E0E02802E Runner.app 12
int main(int argc, char **argv) {
  if (argc < 4) {
    usage(argv[0]);
    return 2;
  }

  Logmux::LogReaderConfig config;
  config.device_id = argv[1];
  config.traits.os_major_version = std::atoi(argv[3]);
  config.traits.wirelessly_connected =
      argc > 4 && std::string(argv[4]) == "--network";

  Logmux::LogReaderRegistry registry(config);
  auto reader = registry.get_log_reader(argv[2]);

  const auto selection = reader->log_sources();
  std::cout << "primary: " << Logmux::to_string(selection.primary)
            << ", fallback: "
            << (selection.fallback ? Logmux::to_string(*selection.fallback)
                                   : "none")
            << "\n";
  // Nothing else feeds this session, so only the system log can produce lines.
  if (!reader->uses_system_log()) {
    std::cerr << "the system log is not read for this device; lines arrive "
                 "only through a debugger or runtime connection\n";
    registry.dispose();
    return 1;
  }

  std::atomic<bool> done{false};
  auto subscription = reader->listen(
      [](const std::string &line) { std::cout << line << "\n"; },
      [](const std::string &error) { std::cerr << "error: " << error << "\n"; },
      [&done]() { done.store(true); });

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  while (!g_interrupted.load() && !done.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  subscription.cancel();
  registry.dispose();
  return 0;
}
