#pragma once

#include <string>

#include "config/config.pb.h"

namespace datamarket::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. The result has passed ValidateConfig.
*/
class ConfigLoader {
 public:
  static datamarket::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

// Throws std::invalid_argument naming the first inconsistent setting.
void ValidateConfig(const datamarket::runtime::config::RuntimeConfig& config);

} // namespace datamarket::config
