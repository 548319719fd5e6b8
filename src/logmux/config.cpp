#include "logmux/config.hpp"

#include <string_view>

namespace Logmux {

std::string LogReaderConfig::process_name() const {
  constexpr std::string_view kBundleSuffix = ".app";
  std::string name = app_bundle_name;
  // Every occurrence is removed, "Runner.app" and "My.app.app" alike.
  for (size_t pos = name.find(kBundleSuffix); pos != std::string::npos;
       pos = name.find(kBundleSuffix, pos)) {
    name.erase(pos, kBundleSuffix.size());
  }
  return name;
}

} // namespace Logmux
