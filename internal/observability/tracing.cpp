#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>

#include <chrono>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace sensorweave::observability {

namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace nostd     = opentelemetry::nostd;

using TracingConfig = sensorweave::runtime::config::ObservabilityConfig_TracingConfig;

namespace {

std::mutex                                g_tracing_mutex;
std::shared_ptr<sdktrace::TracerProvider> g_provider;
nostd::shared_ptr<trace_api::Tracer>      g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, OtlpSignal::kTraces);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> MakeProcessor(const TracingConfig& tracing, std::unique_ptr<sdktrace::SpanExporter> exporter) {
  if (tracing.processor() == TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }

  sdktrace::BatchSpanProcessorOptions options;
  const auto&                         batch = tracing.batch();
  if (batch.max_queue_size() > 0) options.max_queue_size = batch.max_queue_size();
  if (batch.max_export_batch_size() > 0) options.max_export_batch_size = batch.max_export_batch_size();
  if (batch.schedule_delay_ms() > 0) options.schedule_delay_millis = std::chrono::milliseconds(batch.schedule_delay_ms());
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), options);
}

nostd::shared_ptr<trace_api::Tracer> Tracer() {
  std::scoped_lock lock(g_tracing_mutex);
  if (g_tracer) {
    return g_tracer;
  }
  // falls back to whatever provider the process installed, the no-op one by default
  return trace_api::Provider::GetTracerProvider()->GetTracer("sensorweave", "0.1.0");
}

} // namespace

bool InitializeTracing(const sensorweave::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto otlp_config = OtlpConfigFromRuntime(config);
  auto processor = MakeProcessor(config.observability().tracing(), MakeSpanExporter(otlp_config));
  auto resource  = opentelemetry::sdk::resource::Resource::Create(
      {{"service.name", otlp_config.service_name}, {"service.version", otlp_config.service_version}});

  std::shared_ptr<sdktrace::TracerProvider> provider = sdktrace::TracerProviderFactory::Create(std::move(processor), resource);
  trace_api::Provider::SetTracerProvider(nostd::shared_ptr<trace_api::TracerProvider>(provider));

  std::scoped_lock lock(g_tracing_mutex);
  g_provider = std::move(provider);
  g_tracer   = g_provider->GetTracer("sensorweave", otlp_config.service_version);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    std::scoped_lock lock(g_tracing_mutex);
    provider = std::move(g_provider);
    g_tracer = nullptr;
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

std::string CurrentTraceContext() {
  auto span = trace_api::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  return "trace_id=" + std::string(trace_id, sizeof(trace_id)) + " span_id=" + std::string(span_id, sizeof(span_id));
}

struct SpanScope::Impl {
  nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                   scope;

  explicit Impl(nostd::shared_ptr<trace_api::Span> started) : span(std::move(started)), scope(span) {
  }
};

SpanScope::SpanScope(std::string_view name) {
  auto tracer = Tracer();
  if (tracer) {
    impl_ = std::make_unique<Impl>(tracer->StartSpan(nostd::string_view(name.data(), name.size())));
  }
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) impl_->span->SetAttribute(nostd::string_view(key.data(), key.size()), nostd::string_view(value.data(), value.size()));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) impl_->span->SetAttribute(nostd::string_view(key.data(), key.size()), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_) impl_->span->SetAttribute(nostd::string_view(key.data(), key.size()), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_) impl_->span->AddEvent(nostd::string_view(name.data(), name.size()));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_) {
    return;
  }
  const std::string message(description);
  impl_->span->AddEvent("exception", {{"exception.message", message}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, message);
}

} // namespace sensorweave::observability

#endif
