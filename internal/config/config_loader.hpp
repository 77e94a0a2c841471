#pragma once

#include <string>

#include "config/config.pb.h"

namespace creditgate::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown fields
  are rejected, then Validate() checks cross-field rules that the
  schema cannot express. Numeric defaults and clamps are applied later
  by ResolveRuntimeSettings.
*/
class ConfigLoader {
 public:
  static creditgate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static creditgate::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws std::runtime_error naming the first offending field.
  static void Validate(const creditgate::runtime::config::RuntimeConfig& config);
};

} // namespace creditgate::config
