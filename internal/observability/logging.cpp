#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace deliveryiq::observability {
namespace {

constexpr const char* kLoggerName     = "delivery-iq";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Environment beats config beats the default.
std::string Setting(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

// Error messages and carrier service names routinely contain spaces.
bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" =\"\t\n") != std::string::npos;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::ostringstream out;
  out << message;
  for (const auto& field : fields) {
    out << ' ' << field.key << '=';
    if (NeedsQuoting(field.value)) {
      out << std::quoted(field.value);
    } else {
      out << field.value;
    }
  }
  return out.str();
}

void InitializeLogging(const deliveryiq::runtime::config::RuntimeConfig& config) {
  const auto level   = Setting("DELIVERYIQ_LOG_LEVEL", config.logging().level(), kDefaultLevel);
  const auto pattern = Setting("DELIVERYIQ_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(spdlog::level::from_str(level));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  spdlog::log(level, "{}", FormatLogLine(message, fields));
}

} // namespace deliveryiq::observability
