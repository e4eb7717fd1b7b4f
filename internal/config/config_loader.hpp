#pragma once

#include <string>

#include "config/config.pb.h"

namespace lidar::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset processing,
  storage, worker and entity graph settings are filled with their defaults
  and the result is validated; any problem throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static lidar::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static lidar::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(lidar::runtime::config::RuntimeConfig& config);
  static void Validate(const lidar::runtime::config::RuntimeConfig& config);
};

} // namespace lidar::config
