#pragma once

#include <string>

#include "config/config.pb.h"

namespace tripgraph::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Afterwards defaults are filled in, TRIPGRAPH_DB_PASSWORD
  overrides the postgres password and the result is validated.

  Any problem throws std::runtime_error; configuration errors are fatal.
*/
class ConfigLoader {
 public:
  static tripgraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static tripgraph::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace tripgraph::config
