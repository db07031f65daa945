#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace scanhub::runtime::config {
class RuntimeConfig;
}

namespace scanhub::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// key=value pairs separated by spaces. Values that are empty or contain
// whitespace, quotes, '=' or backslashes are double quoted and escaped so a
// login like "alice smith" stays one field.
std::string FormatFields(std::initializer_list<LogField> fields);

// Case-insensitive spdlog level name ("warning" is accepted for warn).
// nullopt for anything else.
std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name);

// Falls back to info, with a warning, when the configured level is unknown.
void InitializeLogging(const scanhub::runtime::config::RuntimeConfig& config);
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

} // namespace scanhub::observability

#define SCANHUB_LOG_DEBUG(message, ...) ::scanhub::observability::LogDebug((message), ##__VA_ARGS__)
#define SCANHUB_LOG_INFO(message, ...) ::scanhub::observability::LogInfo((message), ##__VA_ARGS__)
#define SCANHUB_LOG_WARN(message, ...) ::scanhub::observability::LogWarn((message), ##__VA_ARGS__)
#define SCANHUB_LOG_ERROR(message, ...) ::scanhub::observability::LogError((message), ##__VA_ARGS__)
