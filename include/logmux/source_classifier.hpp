#pragma once

#include "logmux/config.hpp"
#include "logmux/logmux_common_types.hpp"

#include <optional>

namespace Logmux {

// First OS major version whose system log no longer carries application
// output reliably, making the debugger or the runtime the better source.
inline constexpr int kMinimumUniversalLoggingOsVersion = 13;

// First toolchain major version that ships the unified remote console.
inline constexpr int kMinimumRemoteConsoleToolchainVersion = 26;

// On CI from this OS major version on, the native debugger is primary with
// the system log as its fallback.
inline constexpr int kMinimumCiNativeDebuggerOsVersion = 16;

/**
 * @brief Every input of the source decision, passed explicitly.
 *
 * The last two fields change while a session runs, so a selection must be
 * recomputed from fresh inputs whenever it is needed.
 */
struct ClassifierInputs {
  bool managed_connectivity = false;
  bool wirelessly_connected = false;
  int os_major_version = 0;
  std::optional<int> toolchain_major_version;
  bool ci_variant = false;
  bool native_debugger_attached = false;
  bool managed_runtime_connected = false;

  static ClassifierInputs from_traits(const DeviceTraits &traits,
                                      bool native_debugger_attached,
                                      bool managed_runtime_connected);
};

/**
 * @brief Picks the primary and fallback log source for a device.
 *
 * Rules, first match wins:
 *  1. managed connectivity, toolchain >= 26: remote console, then runtime.
 *  2. managed connectivity, wireless: runtime only.
 *  3. managed connectivity, wired: system log, then runtime.
 *  4. OS < 13: system log only.
 *  5. CI and OS >= 16: native debugger, then system log.
 *  6. runtime connected and no debugger attached: runtime, then debugger.
 *  7. otherwise: native debugger, then runtime.
 */
SourceSelection classify(const ClassifierInputs &inputs);

} // namespace Logmux
