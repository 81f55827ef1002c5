#include "engine.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sensorweave::correlation {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

EngineOptions EngineOptions::FromConfig(const sensorweave::runtime::config::CorrelationConfig& config) {
  EngineOptions options;
  options.router.local_latency_threshold = util::DurationOr(config.local_latency_threshold(), std::chrono::milliseconds(10));
  if (config.local_max_samples() > 0) options.local.max_samples = config.local_max_samples();
  if (config.privacy_max_samples() > 0) options.privacy.max_samples = config.privacy_max_samples();
  if (config.privacy_fraction_bits() > 0) {
    if (config.privacy_fraction_bits() > 24) throw util::InvalidArgument("correlation.privacy_fraction_bits must be at most 24");
    options.privacy.fraction_bits = config.privacy_fraction_bits();
  }
  return options;
}

CorrelationEngine::CorrelationEngine(EngineOptions options, std::shared_ptr<CustomOperationRegistry> custom)
    : local_(options.local), remote_(options.remote, std::move(custom)), privacy_(options.privacy), router_(options.router) {
}

ExecutionMode CorrelationEngine::Resolve(const CorrelationRequest& request) const {
  if (request.mode == ExecutionMode::kAdaptive) return router_.Route(request, local_, privacy_);
  router_.Validate(request.mode, request, local_, privacy_);
  return request.mode;
}

Strategy CorrelationEngine::Select(ExecutionMode mode) const {
  switch (mode) {
    case ExecutionMode::kLocal:
      return local_;
    case ExecutionMode::kPrivacyPreserving:
      return privacy_;
    case ExecutionMode::kRemote:
    case ExecutionMode::kAdaptive:
      break;
  }
  return remote_;
}

CorrelationResult CorrelationEngine::Compute(const CorrelationRequest& request, ComputeContext context) const {
  observability::SpanScope span("correlation.compute");
  span.SetAttribute("request_id", request.request_id);
  span.SetAttribute("operation", ToString(request.operation));

  const auto  started = ComputeContext::Clock::now();
  std::string mode_name = ToString(request.mode);
  try {
    const auto mode = Resolve(request);
    mode_name       = ToString(mode);
    span.SetAttribute("mode", mode_name);

    if (mode == ExecutionMode::kLocal && request.constraints.max_latency) {
      const auto deadline = started + *request.constraints.max_latency;
      if (!context.deadline || deadline < *context.deadline) context.deadline = deadline;
    }

    auto result    = std::visit([&](const auto& strategy) { return strategy.Compute(request, context); }, Select(mode));
    result.latency = std::chrono::duration_cast<std::chrono::microseconds>(ComputeContext::Clock::now() - started);

    observability::Metrics::Instance().RecordCorrelation(mode_name, "ok", result.latency.count() / 1000.0);
    SENSORWEAVE_LOG_DEBUG("correlation computed", {StringField("request_id", request.request_id), StringField("mode", ToString(mode)),
                                                   IntField("lag_samples", result.peak.lag_samples), DoubleField("strength", result.peak.strength)});
    return result;
  } catch (const util::CorrelationError& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordCorrelation(mode_name, util::ToString(e.code()), 0.0);
    SENSORWEAVE_LOG_WARN("correlation failed", {StringField("request_id", request.request_id), StringField("code", util::ToString(e.code())),
                                                StringField("error", e.what())});
    throw;
  }
}

} // namespace sensorweave::correlation
