#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace schemaflow::runtime::config {
class RuntimeConfig;
}

namespace schemaflow::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the "schemaflow" logger on stderr as the spdlog default.

  SCHEMAFLOW_LOG_LEVEL / SCHEMAFLOW_LOG_PATTERN override the config.
  Stdout is left to command output (history, current, heads).
*/
void InitializeLogging(const schemaflow::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace schemaflow::observability

#define SCHEMAFLOW_LOG_DEBUG(message, ...) ::schemaflow::observability::LogDebug((message), ##__VA_ARGS__)
#define SCHEMAFLOW_LOG_INFO(message, ...) ::schemaflow::observability::LogInfo((message), ##__VA_ARGS__)
#define SCHEMAFLOW_LOG_WARN(message, ...) ::schemaflow::observability::LogWarn((message), ##__VA_ARGS__)
#define SCHEMAFLOW_LOG_ERROR(message, ...) ::schemaflow::observability::LogError((message), ##__VA_ARGS__)
