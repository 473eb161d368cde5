#pragma once

#include <string>

#include "config/config.pb.h"

namespace streamledger::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static streamledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static streamledger::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace streamledger::config
