#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <regex>

#include "internal/util/errors.hpp"

namespace schemaflow::config {

using util::ConfigError;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigError("Unsupported YAML node");
  }
}

static schemaflow::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  if (!yaml.IsMap()) {
    throw ConfigError("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  schemaflow::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

schemaflow::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = ParseYaml(yaml);

  auto* migrations = config.mutable_migrations();
  if (!migrations->directory().empty()) {
    std::filesystem::path dir(migrations->directory());
    if (dir.is_relative()) {
      migrations->set_directory((std::filesystem::path(path).parent_path() / dir).lexically_normal().string());
    }
  }

  Validate(config);
  return config;
}

schemaflow::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw ConfigError("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = ParseYaml(yaml);
  Validate(config);
  return config;
}

void ConfigLoader::Validate(schemaflow::runtime::config::RuntimeConfig& config) {
  static const std::regex kIdentifier("[A-Za-z_][A-Za-z0-9_]*");

  const auto& database = config.database();
  switch (database.backend_case()) {
    case schemaflow::runtime::config::DatabaseConfig::kSqlite:
      if (database.sqlite().path().empty()) {
        throw ConfigError("database.sqlite.path is required");
      }
      break;
    case schemaflow::runtime::config::DatabaseConfig::kPostgres:
      if (database.postgres().connection_uri().empty()) {
        throw ConfigError("database.postgres.connectionUri is required");
      }
      break;
    default:
      throw ConfigError("database: one of sqlite or postgres is required");
  }

  auto* migrations = config.mutable_migrations();
  if (migrations->directory().empty()) {
    throw ConfigError("migrations.directory is required");
  }
  if (migrations->version_table().empty()) {
    migrations->set_version_table(kDefaultVersionTable);
  }
  if (migrations->history_table().empty()) {
    migrations->set_history_table(kDefaultHistoryTable);
  }
  if (!std::regex_match(migrations->version_table(), kIdentifier) || !std::regex_match(migrations->history_table(), kIdentifier)) {
    throw ConfigError("migrations: table names must be plain identifiers");
  }
  if (migrations->version_table() == migrations->history_table()) {
    throw ConfigError("migrations: version and history tables must differ");
  }

  if (!config.logging().level().empty()) {
    static const std::regex kLevel("trace|debug|info|warn|warning|error|err|critical|off");
    if (!std::regex_match(config.logging().level(), kLevel)) {
      throw ConfigError("logging.level: unknown level '" + config.logging().level() + "'");
    }
  }
}

} // namespace schemaflow::config
