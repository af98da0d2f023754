#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace tams::runtime::config {
class RuntimeConfig;
}

namespace tams::observability {

// key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// TAMS_LOG_LEVEL and TAMS_LOG_PATTERN override the config values.
void InitializeLogging(const tams::runtime::config::RuntimeConfig& config);
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

} // namespace tams::observability

#define TAMS_LOG_DEBUG(message, ...) ::tams::observability::LogDebug((message), ##__VA_ARGS__)
#define TAMS_LOG_INFO(message, ...) ::tams::observability::LogInfo((message), ##__VA_ARGS__)
#define TAMS_LOG_WARN(message, ...) ::tams::observability::LogWarn((message), ##__VA_ARGS__)
#define TAMS_LOG_ERROR(message, ...) ::tams::observability::LogError((message), ##__VA_ARGS__)
