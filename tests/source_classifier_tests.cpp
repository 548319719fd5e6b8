#include <catch2/catch_all.hpp>

#include "logmux/source_classifier.hpp"

using Logmux::ClassifierInputs;
using Logmux::classify;
using Logmux::SourceKind;
using Logmux::SourceSelection;

namespace {
ClassifierInputs physical_device(int os_major_version) {
  ClassifierInputs inputs;
  inputs.os_major_version = os_major_version;
  return inputs;
}

ClassifierInputs managed_device(int os_major_version) {
  ClassifierInputs inputs = physical_device(os_major_version);
  inputs.managed_connectivity = true;
  return inputs;
}
} // namespace

TEST_CASE("Managed connectivity devices", "[classifier]") {
  SECTION("A recent toolchain uses the remote console") {
    auto inputs = managed_device(17);
    inputs.toolchain_major_version = 26;
    REQUIRE(classify(inputs) ==
            SourceSelection{SourceKind::RemoteConsole, SourceKind::ManagedRuntime});

    inputs.wirelessly_connected = true;
    REQUIRE(classify(inputs).primary == SourceKind::RemoteConsole);
  }

  SECTION("Wireless without the remote console uses the runtime only") {
    auto inputs = managed_device(17);
    inputs.toolchain_major_version = 25;
    inputs.wirelessly_connected = true;
    const auto selection = classify(inputs);
    REQUIRE(selection.primary == SourceKind::ManagedRuntime);
    REQUIRE_FALSE(selection.fallback.has_value());
  }

  SECTION("Wired uses the system log with the runtime as fallback") {
    auto inputs = managed_device(17);
    REQUIRE(classify(inputs) ==
            SourceSelection{SourceKind::SystemLog, SourceKind::ManagedRuntime});
  }
}

TEST_CASE("Devices older than the universal logging cutoff", "[classifier]") {
  auto inputs = physical_device(12);
  inputs.managed_runtime_connected = true;
  inputs.ci_variant = true;
  const auto selection = classify(inputs);
  REQUIRE(selection.primary == SourceKind::SystemLog);
  REQUIRE_FALSE(selection.fallback.has_value());
  REQUIRE(selection.uses(SourceKind::SystemLog));
  REQUIRE_FALSE(selection.uses(SourceKind::ManagedRuntime));
}

TEST_CASE("CI devices from OS 16 prefer the debugger", "[classifier]") {
  auto inputs = physical_device(16);
  inputs.ci_variant = true;
  REQUIRE(classify(inputs) ==
          SourceSelection{SourceKind::NativeDebugger, SourceKind::SystemLog});

  SECTION("Even with the runtime connected and no debugger") {
    inputs.managed_runtime_connected = true;
    REQUIRE(classify(inputs).primary == SourceKind::NativeDebugger);
  }

  SECTION("Not below OS 16") {
    inputs.os_major_version = 15;
    REQUIRE(classify(inputs) ==
            SourceSelection{SourceKind::NativeDebugger, SourceKind::ManagedRuntime});
  }
}

TEST_CASE("Runtime and debugger state flip the primary", "[classifier]") {
  auto inputs = physical_device(17);

  SECTION("Nothing connected yet") {
    REQUIRE(classify(inputs) ==
            SourceSelection{SourceKind::NativeDebugger, SourceKind::ManagedRuntime});
  }

  SECTION("Runtime connected without a debugger") {
    inputs.managed_runtime_connected = true;
    REQUIRE(classify(inputs) ==
            SourceSelection{SourceKind::ManagedRuntime, SourceKind::NativeDebugger});
  }

  SECTION("Runtime connected with a debugger attached") {
    inputs.managed_runtime_connected = true;
    inputs.native_debugger_attached = true;
    REQUIRE(classify(inputs) ==
            SourceSelection{SourceKind::NativeDebugger, SourceKind::ManagedRuntime});
  }
}

TEST_CASE("classify is deterministic", "[classifier]") {
  auto inputs = managed_device(18);
  inputs.toolchain_major_version = 26;
  REQUIRE(classify(inputs) == classify(inputs));
}

TEST_CASE("ClassifierInputs from device traits", "[classifier]") {
  Logmux::DeviceTraits traits;
  traits.os_major_version = 17;
  traits.managed_connectivity = true;
  traits.wirelessly_connected = true;
  traits.ci_variant = true;
  traits.toolchain_major_version = 15;

  const auto inputs = ClassifierInputs::from_traits(traits, true, false);
  REQUIRE(inputs.os_major_version == 17);
  REQUIRE(inputs.managed_connectivity);
  REQUIRE(inputs.wirelessly_connected);
  REQUIRE(inputs.ci_variant);
  REQUIRE(inputs.toolchain_major_version == 15);
  REQUIRE(inputs.native_debugger_attached);
  REQUIRE_FALSE(inputs.managed_runtime_connected);
}
