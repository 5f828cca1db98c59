#pragma once

#include <string>

#include "config/config.pb.h"

namespace opentimeline::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected, and the result is checked for values the engine cannot run
  with before it is returned.
*/
class ConfigLoader {
 public:
  static opentimeline::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static opentimeline::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws std::runtime_error naming the offending key.
  static void Validate(const opentimeline::runtime::config::RuntimeConfig& config);
};

} // namespace opentimeline::config
