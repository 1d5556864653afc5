#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace txcoord::runtime::config {
class RuntimeConfig;
}

namespace txcoord::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// For caller-supplied identifiers (xids) that may carry arbitrary bytes:
// non-printable bytes are rendered as \xNN and the value is quoted.
LogField BytesField(std::string_view key, std::string_view value);

void InitializeLogging(const txcoord::runtime::config::RuntimeConfig& config);
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

} // namespace txcoord::observability

#define TXCOORD_LOG_DEBUG(message, ...) ::txcoord::observability::LogDebug((message), ##__VA_ARGS__)
#define TXCOORD_LOG_INFO(message, ...) ::txcoord::observability::LogInfo((message), ##__VA_ARGS__)
#define TXCOORD_LOG_WARN(message, ...) ::txcoord::observability::LogWarn((message), ##__VA_ARGS__)
#define TXCOORD_LOG_ERROR(message, ...) ::txcoord::observability::LogError((message), ##__VA_ARGS__)
