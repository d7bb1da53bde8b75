#pragma once

#include <string>

#include "config/config.pb.h"

namespace syncq::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Quoted scalars always stay strings.

  Errors throw util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static syncq::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static syncq::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  // rejects inconsistent or missing settings
  static void Validate(const syncq::runtime::config::RuntimeConfig& config);
};

} // namespace syncq::config
