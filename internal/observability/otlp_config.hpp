#pragma once

#include <string>

namespace sensorweave::runtime::config {
class RuntimeConfig;
}

namespace sensorweave::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

// Exporter settings shared by the trace and metric pipelines.
struct OtlpConfig {
  std::string   service_name{"sensorweave-node"};
  std::string   service_version{"0.1.0"};
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpConfig OtlpConfigFromRuntime(const sensorweave::runtime::config::RuntimeConfig& config);

// Explicit endpoint, then OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT,
// then OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal);

} // namespace sensorweave::observability
