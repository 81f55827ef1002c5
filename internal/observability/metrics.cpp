#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace sensorweave::observability {

namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace nostd       = opentelemetry::nostd;

namespace {

using Attribute = std::pair<nostd::string_view, opentelemetry::common::AttributeValue>;

std::mutex                                 g_metrics_mutex;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;
std::atomic<bool>                          g_rpc_metrics{true};
std::atomic<bool>                          g_session_metrics{true};

nostd::string_view View(std::string_view s) {
  return nostd::string_view(s.data(), s.size());
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, OtlpSignal::kMetrics);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const sensorweave::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto  otlp_config = OtlpConfigFromRuntime(config);
  const auto& settings    = observability.metrics();

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(settings.collection_interval_ms() > 0 ? settings.collection_interval_ms() : 5000);
  if (settings.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(settings.export_timeout_ms());
  }
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(otlp_config), reader_options);

  auto resource = opentelemetry::sdk::resource::Resource::Create(
      {{"service.name", otlp_config.service_name}, {"service.version", otlp_config.service_version}});
  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource);
  provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(nostd::shared_ptr<metrics_api::MeterProvider>(provider));

  g_rpc_metrics     = settings.request_metrics_enabled();
  g_session_metrics = settings.session_metrics_enabled();

  std::scoped_lock lock(g_metrics_mutex);
  g_provider = std::move(provider);
  return true;
}

void ShutdownMetrics() {
  std::shared_ptr<sdkmetrics::MeterProvider> provider;
  {
    std::scoped_lock lock(g_metrics_mutex);
    provider = std::move(g_provider);
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

struct Metrics::Impl {
  nostd::shared_ptr<metrics_api::Meter> meter;

  nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> rpc_count;
  nostd::unique_ptr<metrics_api::Histogram<double>>      rpc_latency_ms;
  nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> correlation_count;
  nostd::unique_ptr<metrics_api::Histogram<double>>      correlation_latency_ms;
  nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> significance_verdicts;
  nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> pattern_events;
  nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> session_events;
};

// Instruments bind to the provider installed when Instance() is first called.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("sensorweave", "0.1.0");

  impl_->rpc_count      = impl_->meter->CreateUInt64Counter("sensorweave.rpc.count", "RPCs served", "1");
  impl_->rpc_latency_ms = impl_->meter->CreateDoubleHistogram("sensorweave.rpc.latency_ms", "RPC latency", "ms");
  impl_->correlation_count = impl_->meter->CreateUInt64Counter("sensorweave.correlation.count", "Correlation requests by mode and outcome", "1");
  impl_->correlation_latency_ms =
      impl_->meter->CreateDoubleHistogram("sensorweave.correlation.latency_ms", "Correlation latency by execution mode", "ms");
  impl_->significance_verdicts = impl_->meter->CreateUInt64Counter("sensorweave.significance.verdicts", "Significance evaluations", "1");
  impl_->pattern_events        = impl_->meter->CreateUInt64Counter("sensorweave.pattern.events", "Pattern library changes", "1");
  impl_->session_events        = impl_->meter->CreateUInt64Counter("sensorweave.session.events", "Stream session events", "1");
}

Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRpc(std::string_view route, bool success, double latency_ms) {
  if (!g_rpc_metrics) {
    return;
  }
  const opentelemetry::context::Context context;
  impl_->rpc_count->Add(1, {Attribute{"route", View(route)}, Attribute{"success", success}}, context);
  impl_->rpc_latency_ms->Record(latency_ms, {Attribute{"route", View(route)}}, context);
}

void Metrics::RecordCorrelation(std::string_view mode, std::string_view outcome, double latency_ms) {
  const opentelemetry::context::Context context;
  impl_->correlation_count->Add(1, {Attribute{"mode", View(mode)}, Attribute{"outcome", View(outcome)}}, context);
  if (outcome == "ok") {
    impl_->correlation_latency_ms->Record(latency_ms, {Attribute{"mode", View(mode)}}, context);
  }
}

void Metrics::RecordSignificance(bool meaningful, int pass_count) {
  impl_->significance_verdicts->Add(
      1, {Attribute{"meaningful", meaningful}, Attribute{"pass_count", static_cast<std::int64_t>(pass_count)}}, opentelemetry::context::Context{});
}

void Metrics::RecordPatternEvent(std::string_view event) {
  impl_->pattern_events->Add(1, {Attribute{"event", View(event)}}, opentelemetry::context::Context{});
}

void Metrics::RecordSessionEvent(std::string_view event) {
  if (!g_session_metrics) {
    return;
  }
  impl_->session_events->Add(1, {Attribute{"event", View(event)}}, opentelemetry::context::Context{});
}

} // namespace sensorweave::observability

#endif
