#pragma once

#include <string>

#include "config/config.pb.h"

namespace scanhub::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. The parsed config is validated before it is returned.
*/
class ConfigLoader {
 public:
  static scanhub::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static scanhub::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Throws std::invalid_argument describing the first offending field.
  static void Validate(const scanhub::runtime::config::RuntimeConfig& config);
};

} // namespace scanhub::config
