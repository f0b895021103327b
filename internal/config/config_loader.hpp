#pragma once

#include <string>

#include "config/config.pb.h"

namespace deliveryiq::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Zero or empty tuning values are replaced by the built-in
  defaults, so the returned message is always fully populated.
*/
class ConfigLoader {
 public:
  static deliveryiq::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static deliveryiq::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(deliveryiq::runtime::config::RuntimeConfig& config);
  static void Validate(const deliveryiq::runtime::config::RuntimeConfig& config);
};

} // namespace deliveryiq::config
