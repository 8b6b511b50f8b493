#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace fmd::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static fmd::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

// Effective values with built-in defaults applied to zero/empty fields.
std::string DatabaseBackend(const fmd::runtime::config::RuntimeConfig& config);
uint32_t    LockTimeoutMs(const fmd::runtime::config::RuntimeConfig& config);
uint32_t    MaxDevicesPerUser(const fmd::runtime::config::RuntimeConfig& config);
uint64_t    PositionExpirySec(const fmd::runtime::config::RuntimeConfig& config);
uint32_t    GcIntervalSec(const fmd::runtime::config::RuntimeConfig& config);

} // namespace fmd::config
