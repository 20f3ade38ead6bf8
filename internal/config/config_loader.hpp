#pragma once

#include <string>

#include "config/config.pb.h"

namespace entitystore::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static entitystore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static entitystore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace entitystore::config
