#include "logmux/source_classifier.hpp"

namespace Logmux {

ClassifierInputs ClassifierInputs::from_traits(const DeviceTraits &traits,
                                               bool native_debugger_attached,
                                               bool managed_runtime_connected) {
  ClassifierInputs inputs;
  inputs.managed_connectivity = traits.managed_connectivity;
  inputs.wirelessly_connected = traits.wirelessly_connected;
  inputs.os_major_version = traits.os_major_version;
  inputs.toolchain_major_version = traits.toolchain_major_version;
  inputs.ci_variant = traits.ci_variant;
  inputs.native_debugger_attached = native_debugger_attached;
  inputs.managed_runtime_connected = managed_runtime_connected;
  return inputs;
}

SourceSelection classify(const ClassifierInputs &inputs) {
  if (inputs.managed_connectivity) {
    if (inputs.toolchain_major_version &&
        *inputs.toolchain_major_version >=
            kMinimumRemoteConsoleToolchainVersion) {
      return {SourceKind::RemoteConsole, SourceKind::ManagedRuntime};
    }
    // The system log is unreliable over the network.
    if (inputs.wirelessly_connected) {
      return {SourceKind::ManagedRuntime, std::nullopt};
    }
    return {SourceKind::SystemLog, SourceKind::ManagedRuntime};
  }

  if (inputs.os_major_version < kMinimumUniversalLoggingOsVersion) {
    return {SourceKind::SystemLog, std::nullopt};
  }

  if (inputs.ci_variant &&
      inputs.os_major_version >= kMinimumCiNativeDebuggerOsVersion) {
    return {SourceKind::NativeDebugger, SourceKind::SystemLog};
  }

  if (inputs.managed_runtime_connected && !inputs.native_debugger_attached) {
    return {SourceKind::ManagedRuntime, SourceKind::NativeDebugger};
  }

  return {SourceKind::NativeDebugger, SourceKind::ManagedRuntime};
}

} // namespace Logmux
