#include "internal/observability/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <vector>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace sensorweave::observability {

namespace {

constexpr const char* kLoggerName     = "sensorweave";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : fallback;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out.append("\\n");
    } else {
      out.push_back(c);
    }
  }
  out.push_back('"');
}

std::string Render(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line.append(field.key);
    line.push_back('=');
    AppendValue(line, field.value);
  }
  if (g_include_trace_context.load(std::memory_order_relaxed)) {
    const auto trace = CurrentTraceContext();
    if (!trace.empty()) {
      line.push_back(' ');
      line.append(trace);
    }
  }
  return line;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out.precision(6);
  out << value;
  return {std::string(key), out.str()};
}

void InitializeLogging(const sensorweave::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!logging.file_path().empty()) {
    const std::size_t max_bytes = static_cast<std::size_t>(logging.max_file_size_mb() > 0 ? logging.max_file_size_mb() : 64) * 1024 * 1024;
    const std::size_t max_files = logging.max_files() > 0 ? logging.max_files() : 4;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logging.file_path(), max_bytes, max_files));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(EnvOr("SENSORWEAVE_LOG_PATTERN", logging.pattern().empty() ? kDefaultPattern : logging.pattern()));
  logger->set_level(spdlog::level::from_str(EnvOr("SENSORWEAVE_LOG_LEVEL", logging.level().empty() ? "info" : logging.level())));
  logger->flush_on(spdlog::level::warn);

  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(std::move(logger));

  const auto trace_flag = EnvOr("SENSORWEAVE_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "false");
  g_include_trace_context = trace_flag == "1" || trace_flag == "true";
}

// flushes only; the logger stays usable for destructors that run afterwards
void ShutdownLogging() {
  if (auto* logger = spdlog::default_logger_raw()) {
    logger->flush();
  }
}

bool ShouldLog(spdlog::level::level_enum level) {
  auto* logger = spdlog::default_logger_raw();
  return logger != nullptr && logger->should_log(level);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (auto* logger = spdlog::default_logger_raw()) {
    logger->log(level, "{}", Render(message, fields));
  }
}

} // namespace sensorweave::observability
