#pragma once

#include <string>

#include "config/config.pb.h"

namespace imc::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset controller and
  queue knobs are filled with defaults after parsing.
*/
class ConfigLoader {
 public:
  static imc::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(imc::runtime::config::RuntimeConfig* config);
};

} // namespace imc::config
