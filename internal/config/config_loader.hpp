#pragma once

#include <string>

#include "config/config.pb.h"

namespace carelog::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset values are filled from ApplyDefaults(), after which the
  result is validated. Any failure throws std::runtime_error naming the
  offending file or key.
*/
class ConfigLoader {
 public:
  static carelog::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config used when no file is given: in-memory database, ./carelog-data blobs.
  static carelog::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(carelog::runtime::config::RuntimeConfig& config);
  static void Validate(const carelog::runtime::config::RuntimeConfig& config);
};

} // namespace carelog::config
