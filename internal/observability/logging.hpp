#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace imc::runtime::config {
class RuntimeConfig;
}

namespace imc::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// Installs the default logger, named after the controller id so that lines
// from peer controllers sharing a sink can be told apart. Safe to call again
// after a config reload.
void InitializeLogging(const imc::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Writes `message key=value ...`. Values with spaces, quotes or '=' are
// double-quoted. Trace and span ids are appended when enabled and a span is active.
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

} // namespace imc::observability

#define IMC_LOG_DEBUG(message, ...) ::imc::observability::LogDebug((message), ##__VA_ARGS__)
#define IMC_LOG_INFO(message, ...) ::imc::observability::LogInfo((message), ##__VA_ARGS__)
#define IMC_LOG_WARN(message, ...) ::imc::observability::LogWarn((message), ##__VA_ARGS__)
#define IMC_LOG_ERROR(message, ...) ::imc::observability::LogError((message), ##__VA_ARGS__)
