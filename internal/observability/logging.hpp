#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace vault::runtime::config {
class LoggingConfig;
}

namespace vault::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UIntField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// logger_name distinguishes the server from the CLI in shared log sinks
void InitializeLogging(const vault::runtime::config::LoggingConfig& config, const std::string& logger_name = "archive-vault");
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

} // namespace vault::observability

#define VAULT_LOG_DEBUG(message, ...) ::vault::observability::LogDebug((message), ##__VA_ARGS__)
#define VAULT_LOG_INFO(message, ...) ::vault::observability::LogInfo((message), ##__VA_ARGS__)
#define VAULT_LOG_WARN(message, ...) ::vault::observability::LogWarn((message), ##__VA_ARGS__)
#define VAULT_LOG_ERROR(message, ...) ::vault::observability::LogError((message), ##__VA_ARGS__)
