#pragma once

#include <string>

#include "config/config.pb.h"

namespace flashback::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset numeric knobs
  are filled with defaults; a missing capture directory is rejected.
*/
class ConfigLoader {
 public:
  static flashback::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(flashback::runtime::config::RuntimeConfig& config);
};

} // namespace flashback::config
