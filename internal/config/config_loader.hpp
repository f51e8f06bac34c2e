#pragma once

#include <string>

#include "config/config.pb.h"

namespace artifact::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, rendered as JSON and parsed into the
  config message. Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static artifact::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static artifact::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace artifact::config
