#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace Logmux {

/**
 * @brief The closed set of places a device log line can come from.
 */
enum class SourceKind : uint8_t {
  SystemLog,      // idevicesyslog style system log daemon capture
  NativeDebugger, // lines printed through an attached native debugger
  ManagedRuntime, // stdout/stderr events of the managed runtime
  RemoteConsole,  // vendor-managed remote device console
};

constexpr std::string_view to_string(SourceKind kind) {
  switch (kind) {
  case SourceKind::SystemLog:
    return "system-log";
  case SourceKind::NativeDebugger:
    return "native-debugger";
  case SourceKind::ManagedRuntime:
    return "managed-runtime";
  case SourceKind::RemoteConsole:
    return "remote-console";
  }
  return "unknown";
}

/**
 * @brief Which source is trusted first and which one is consulted only
 * speculatively until the primary proves itself.
 */
struct SourceSelection {
  SourceKind primary{SourceKind::SystemLog};
  std::optional<SourceKind> fallback;

  bool uses(SourceKind kind) const {
    return primary == kind || (fallback && *fallback == kind);
  }

  bool operator==(const SourceSelection &) const = default;
};

// Application lines printed by the runtime carry this prefix.
inline constexpr std::string_view kFlutterLinePrefix = "flutter:";

inline bool is_flutter_line(std::string_view line) {
  return line.substr(0, kFlutterLinePrefix.size()) == kFlutterLinePrefix;
}

} // namespace Logmux
