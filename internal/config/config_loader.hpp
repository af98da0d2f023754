#pragma once

#include <string>

#include "config/config.pb.h"

namespace tams::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset fields receive their defaults and the result is
  validated before it is returned.
*/
class ConfigLoader {
 public:
  static tams::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static tams::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(tams::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error naming the offending field.
  static void Validate(const tams::runtime::config::RuntimeConfig& config);
};

} // namespace tams::config
