#pragma once

#include <string>

#include "config/config.pb.h"

namespace usedgear::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  mistyped values fail the load instead of being ignored.
*/
class ConfigLoader {
 public:
  static usedgear::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static usedgear::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Built-in configuration used when no file is given: in-memory store,
  // shipped market balance, info logging.
  static usedgear::runtime::config::RuntimeConfig Defaults();
};

} // namespace usedgear::config
