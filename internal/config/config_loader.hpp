#pragma once

#include <string>

#include "config/config.pb.h"

namespace shortener::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, on top of Defaults().
  Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static shortener::runtime::config::RuntimeConfig Defaults();

  static shortener::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // SERVER_ADDRESS, BASE_URL, DATABASE_DSN, FILE_STORAGE_PATH win over the file.
  static void ApplyEnvironment(shortener::runtime::config::RuntimeConfig& config);
};

} // namespace shortener::config
