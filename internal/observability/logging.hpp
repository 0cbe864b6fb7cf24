#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace checkpoint::runtime::config {
class RuntimeConfig;
}

namespace checkpoint::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationMsField(std::string_view key, std::uint64_t millis);

/*
  Installs "checkpoint-<component>" as the spdlog default logger.

  A worker process also stamps worker_id on every line so interleaved
  output from several workers can be told apart.
*/
void InitializeLogging(const checkpoint::runtime::config::RuntimeConfig& config, std::string_view component = {});
void ShutdownLogging();

// Fields appended to every line after the per-call fields.
void SetContextFields(std::vector<LogField> fields);

// `message key=value ...`; values with spaces, quotes or '=' are quoted.
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

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

} // namespace checkpoint::observability

#define CHECKPOINT_LOG_DEBUG(message, ...) ::checkpoint::observability::LogDebug((message), ##__VA_ARGS__)
#define CHECKPOINT_LOG_INFO(message, ...) ::checkpoint::observability::LogInfo((message), ##__VA_ARGS__)
#define CHECKPOINT_LOG_WARN(message, ...) ::checkpoint::observability::LogWarn((message), ##__VA_ARGS__)
#define CHECKPOINT_LOG_ERROR(message, ...) ::checkpoint::observability::LogError((message), ##__VA_ARGS__)
