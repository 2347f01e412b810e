#pragma once

#include <string>

#include "config/config.pb.h"

namespace farmer::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected; missing keys keep their proto3 zero value.
*/
class ConfigLoader {
 public:
  static farmer::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same as LoadFromYaml, for YAML already held in memory.
  static farmer::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace farmer::config
