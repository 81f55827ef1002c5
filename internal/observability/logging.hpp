#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace sensorweave::runtime::config {
class RuntimeConfig;
}

namespace sensorweave::observability {

/*
  Structured logging on spdlog.

  A record renders as `<message> key=value key="value with spaces"`,
  followed by the active trace context when logging.include_trace_context
  is set. Before InitializeLogging runs, records go to spdlog's default
  logger at info level.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// Level, pattern and trace flag may be overridden by SENSORWEAVE_LOG_LEVEL,
// SENSORWEAVE_LOG_PATTERN and SENSORWEAVE_LOG_INCLUDE_TRACE_CONTEXT.
void InitializeLogging(const sensorweave::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

bool ShouldLog(spdlog::level::level_enum level);
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace sensorweave::observability

// fields are only built when the level is enabled
#define SENSORWEAVE_LOG_AT(level, message, ...)                                         \
  do {                                                                                 \
    if (::sensorweave::observability::ShouldLog(level)) {                              \
      ::sensorweave::observability::Log((level), (message), ##__VA_ARGS__);            \
    }                                                                                  \
  } while (0)

#define SENSORWEAVE_LOG_DEBUG(message, ...) SENSORWEAVE_LOG_AT(::spdlog::level::debug, message, ##__VA_ARGS__)
#define SENSORWEAVE_LOG_INFO(message, ...) SENSORWEAVE_LOG_AT(::spdlog::level::info, message, ##__VA_ARGS__)
#define SENSORWEAVE_LOG_WARN(message, ...) SENSORWEAVE_LOG_AT(::spdlog::level::warn, message, ##__VA_ARGS__)
#define SENSORWEAVE_LOG_ERROR(message, ...) SENSORWEAVE_LOG_AT(::spdlog::level::err, message, ##__VA_ARGS__)
