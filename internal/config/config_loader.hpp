#pragma once

#include <string>

#include "config/config.pb.h"

namespace artifact::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so the YAML layout
  mirrors proto/config/config.proto field for field.
*/
class ConfigLoader {
 public:
  static artifact::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static artifact::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace artifact::config
