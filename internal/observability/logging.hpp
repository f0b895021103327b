#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace deliveryiq::runtime::config {
class RuntimeConfig;
}

namespace deliveryiq::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// Level and pattern come from DELIVERYIQ_LOG_LEVEL / DELIVERYIQ_LOG_PATTERN,
// then the logging config section, then built-in defaults.
void InitializeLogging(const deliveryiq::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// "message key=value key=\"quoted value\"". Values with spaces, quotes or '=' are quoted.
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

} // namespace deliveryiq::observability

#define DELIVERYIQ_LOG_DEBUG(message, ...) ::deliveryiq::observability::LogDebug((message), ##__VA_ARGS__)
#define DELIVERYIQ_LOG_INFO(message, ...) ::deliveryiq::observability::LogInfo((message), ##__VA_ARGS__)
#define DELIVERYIQ_LOG_WARN(message, ...) ::deliveryiq::observability::LogWarn((message), ##__VA_ARGS__)
#define DELIVERYIQ_LOG_ERROR(message, ...) ::deliveryiq::observability::LogError((message), ##__VA_ARGS__)
