#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace supervisor::runtime::config {
class RuntimeConfig;
}

namespace supervisor::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// key=value pairs separated by spaces; values with spaces, quotes or '='
// are double-quoted with backslash escapes.
std::string FormatFields(std::initializer_list<LogField> fields);

// Accepts spdlog level names (trace, debug, info, warn, error, critical, off).
// Throws std::invalid_argument for anything else.
spdlog::level::level_enum ParseLevel(std::string_view level);

// Daemon logs go to stderr; SUPERVISOR_LOG_LEVEL and SUPERVISOR_LOG_PATTERN
// override the config file.
void InitializeLogging(const supervisor::runtime::config::RuntimeConfig& config);
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

} // namespace supervisor::observability

#define SUPERVISOR_LOG_DEBUG(message, ...) ::supervisor::observability::LogDebug((message), ##__VA_ARGS__)
#define SUPERVISOR_LOG_INFO(message, ...) ::supervisor::observability::LogInfo((message), ##__VA_ARGS__)
#define SUPERVISOR_LOG_WARN(message, ...) ::supervisor::observability::LogWarn((message), ##__VA_ARGS__)
#define SUPERVISOR_LOG_ERROR(message, ...) ::supervisor::observability::LogError((message), ##__VA_ARGS__)
