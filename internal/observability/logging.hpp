#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace planner::runtime::config {
class RuntimeConfig;
}

namespace planner::observability {

/*
  One key=value pair appended to a log line.

  Values holding spaces, quotes or '=' are quoted, so process and resource
  names ("Frame welding") stay a single token.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Effective settings after env > config > built-in precedence.
struct LoggingSettings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string               pattern;
  bool                      include_trace_context = false;
};

// Throws util::InvalidParameters for an unknown level name.
LoggingSettings ResolveLoggingSettings(const planner::runtime::config::RuntimeConfig& config);

// Logs go to stderr so that program output on stdout stays clean.
void InitializeLogging(const planner::runtime::config::RuntimeConfig& config);
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

} // namespace planner::observability

#define PLANNER_LOG_DEBUG(message, ...) ::planner::observability::LogDebug((message), ##__VA_ARGS__)
#define PLANNER_LOG_INFO(message, ...) ::planner::observability::LogInfo((message), ##__VA_ARGS__)
#define PLANNER_LOG_WARN(message, ...) ::planner::observability::LogWarn((message), ##__VA_ARGS__)
#define PLANNER_LOG_ERROR(message, ...) ::planner::observability::LogError((message), ##__VA_ARGS__)
