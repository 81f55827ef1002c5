#pragma once

#include <memory>
#include <string_view>

#include "internal/observability/otlp_config.hpp"

namespace sensorweave::observability {

// Installs the OTLP meter provider when observability.metrics_enabled is set.
bool InitializeMetrics(const sensorweave::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Node instruments.

    sensorweave.rpc.count / sensorweave.rpc.latency_ms       route, success
    sensorweave.correlation.count / .latency_ms              mode, outcome
    sensorweave.significance.verdicts                        meaningful, pass_count
    sensorweave.pattern.events                               event
    sensorweave.session.events                               event
*/
class Metrics {
 public:
  static Metrics& Instance();

  ~Metrics();
  Metrics(const Metrics&)            = delete;
  Metrics& operator=(const Metrics&) = delete;

  void RecordRpc(std::string_view route, bool success, double latency_ms);

  // outcome is "ok" or a correlation error code name
  void RecordCorrelation(std::string_view mode, std::string_view outcome, double latency_ms);

  void RecordSignificance(bool meaningful, int pass_count);

  // created, confirmed, merged, retired
  void RecordPatternEvent(std::string_view event);

  // gap, overwrite, pause, resume, sync_lost, recovered
  void RecordSessionEvent(std::string_view event);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const sensorweave::runtime::config::RuntimeConfig&) {
  return false;
}
inline void ShutdownMetrics() {
}

inline Metrics::Metrics()  = default;
inline Metrics::~Metrics() = default;
inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}
inline void Metrics::RecordRpc(std::string_view, bool, double) {
}
inline void Metrics::RecordCorrelation(std::string_view, std::string_view, double) {
}
inline void Metrics::RecordSignificance(bool, int) {
}
inline void Metrics::RecordPatternEvent(std::string_view) {
}
inline void Metrics::RecordSessionEvent(std::string_view) {
}
#endif

} // namespace sensorweave::observability
