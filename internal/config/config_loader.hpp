#pragma once

#include <string>

#include "config/config.pb.h"

namespace flowstate::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  are rejected with the field path in the message.
*/
class ConfigLoader {
 public:
  static flowstate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // In-memory backend with every default resolved; used by tools and tests.
  static flowstate::runtime::config::RuntimeConfig Defaults();

  // Replaces zero values with the documented defaults.
  static void ApplyDefaults(flowstate::runtime::config::RuntimeConfig* config);

  // Throws std::invalid_argument on settings that cannot work together.
  static void Validate(const flowstate::runtime::config::RuntimeConfig& config);
};

} // namespace flowstate::config
