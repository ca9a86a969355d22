#pragma once

#include <string>

#include "config/config.pb.h"

namespace supervisor::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static supervisor::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static supervisor::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& content);
};

} // namespace supervisor::config
