#pragma once

#include <string>

#include "config/config.pb.h"

namespace jobclaim::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected.
*/
class ConfigLoader {
 public:
  static jobclaim::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static jobclaim::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace jobclaim::config
