#pragma once

#include <string>

#include "config/config.pb.h"

namespace phrase::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected by the protobuf JSON parser. Semantic checks (word bounds,
  batch sizes) run after parsing.
*/
class ConfigLoader {
 public:
  static phrase::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static phrase::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws std::runtime_error describing the first inconsistent setting.
  static void Validate(const phrase::runtime::config::RuntimeConfig& config);
};

} // namespace phrase::config
