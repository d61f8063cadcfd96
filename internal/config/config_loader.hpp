#pragma once

#include <string>

#include "config/config.pb.h"

namespace schemaflow::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Missing table names get their defaults; a relative
  migrations directory is resolved against the config file's directory.

  Any failure raises util::ConfigError.
*/
class ConfigLoader {
 public:
  static constexpr const char* kDefaultVersionTable = "schemaflow_version";
  static constexpr const char* kDefaultHistoryTable = "schemaflow_history";

  static schemaflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same pipeline for an in-memory document; relative paths stay relative.
  static schemaflow::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Fills defaults and checks required fields.
  static void Validate(schemaflow::runtime::config::RuntimeConfig& config);
};

} // namespace schemaflow::config
