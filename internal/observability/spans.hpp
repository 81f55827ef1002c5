#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/observability/otlp_config.hpp"

namespace sensorweave::observability {

// Installs the OTLP tracer provider when observability.tracing_enabled is set.
bool InitializeTracing(const sensorweave::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

// "trace_id=... span_id=..." for the active span, empty without one.
std::string CurrentTraceContext();

/*
  RAII span made active for the current thread until destruction.
  Every method is a no-op when tracing is compiled out or not initialized.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const sensorweave::runtime::config::RuntimeConfig&) {
  return false;
}
inline void ShutdownTracing() {
}
inline std::string CurrentTraceContext() {
  return {};
}

inline SpanScope::SpanScope(std::string_view) {
}
inline SpanScope::~SpanScope() = default;
inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}
inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}
inline void SpanScope::SetAttribute(std::string_view, double) {
}
inline void SpanScope::AddEvent(std::string_view) {
}
inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace sensorweave::observability
