#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace streamledger::runtime::config {
class RuntimeConfig;
}

namespace streamledger::observability {

/*
  Structured logging on top of spdlog.

  Fields are rendered as key=value after the message so lines stay greppable:
    stream created stream_id=3 payer=alice recipient=bob amount=1000
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const streamledger::runtime::config::RuntimeConfig& config);
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

} // namespace streamledger::observability

#define STREAMLEDGER_LOG_DEBUG(message, ...) ::streamledger::observability::LogDebug((message), ##__VA_ARGS__)
#define STREAMLEDGER_LOG_INFO(message, ...) ::streamledger::observability::LogInfo((message), ##__VA_ARGS__)
#define STREAMLEDGER_LOG_WARN(message, ...) ::streamledger::observability::LogWarn((message), ##__VA_ARGS__)
#define STREAMLEDGER_LOG_ERROR(message, ...) ::streamledger::observability::LogError((message), ##__VA_ARGS__)
