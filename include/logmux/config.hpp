#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace Logmux {

/**
 * @brief Static facts about the device and the tool environment that the
 * source classifier depends on.
 */
struct DeviceTraits {
  int os_major_version = 0;
  // Reachable through the vendor's device-management transport rather than
  // the legacy cable-sync protocol.
  bool managed_connectivity = false;
  bool wirelessly_connected = false;
  bool ci_variant = false;
  // Major version of the vendor toolchain, if one is installed.
  std::optional<int> toolchain_major_version;
};

constexpr size_t kDefaultQueueCapacity = 4096;

/**
 * @brief Everything needed to build one log reader for one application on
 * one device.
 */
struct LogReaderConfig {
  std::string device_id;
  std::string device_name;
  // Bundle name of the application, e.g. "Runner.app". The ".app" suffix is
  // stripped to get the process name matched in the system log.
  std::string app_bundle_name;
  std::string header_suffix = "Flutter";
  DeviceTraits traits;
  size_t queue_capacity = kDefaultQueueCapacity;
  std::string syslog_executable = "idevicesyslog";

  std::string process_name() const;
};

} // namespace Logmux
