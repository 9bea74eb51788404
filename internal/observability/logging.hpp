#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace ferry::runtime::config {
class RuntimeConfig;
}

namespace ferry::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Routes every log line to stderr through the "ferry" spdlog logger, so
  stdout stays free for streamed records. FERRY_LOG_LEVEL,
  FERRY_LOG_PATTERN and FERRY_LOG_INCLUDE_TRACE_CONTEXT override the
  logging section of the runtime config.
*/
void InitializeLogging(const ferry::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// spdlog level name ("warn", "err", "warning", ...); unknown names map to info.
spdlog::level::level_enum ParseLevel(std::string_view name);

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

} // namespace ferry::observability

#define FERRY_LOG_DEBUG(message, ...) ::ferry::observability::LogDebug((message), ##__VA_ARGS__)
#define FERRY_LOG_INFO(message, ...) ::ferry::observability::LogInfo((message), ##__VA_ARGS__)
#define FERRY_LOG_WARN(message, ...) ::ferry::observability::LogWarn((message), ##__VA_ARGS__)
#define FERRY_LOG_ERROR(message, ...) ::ferry::observability::LogError((message), ##__VA_ARGS__)
