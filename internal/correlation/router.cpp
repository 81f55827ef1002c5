#include "router.hpp"

#include "internal/util/errors.hpp"
#include "signal_ops.hpp"

namespace sensorweave::correlation {

namespace {

[[noreturn]] void Unsatisfiable(const CorrelationRequest& request, const std::string& why) {
  throw util::CorrelationError(util::CorrelationErrorCode::kConstraintUnsatisfiable, why, {.request_id = request.request_id});
}

} // namespace

bool AdaptiveRouter::LatencyBound(const CorrelationRequest& request) const {
  const auto& latency = request.constraints.max_latency;
  return latency && *latency < options_.local_latency_threshold;
}

ExecutionMode AdaptiveRouter::Route(const CorrelationRequest& request, const LocalStrategy& local, const PrivacyPreservingStrategy& privacy) const {
  const auto& constraints = request.constraints;
  const bool  same        = SameSource(request.sources);
  const bool  local_ok    = local.Available(request);

  if (same && LatencyBound(request)) {
    if (local_ok) return ExecutionMode::kLocal;
    Unsatisfiable(request, std::string("latency bound needs local computation, which cannot run ") + ToString(request.operation) + " on " +
                               std::to_string(request.sources.front().samples.size()) + " samples");
  }

  if (constraints.privacy == PrivacyLevel::kCritical) {
    if (!same) {
      if (!privacy.Supports(request.operation)) {
        Unsatisfiable(request, std::string("critical privacy: ") + ToString(request.operation) + " has no privacy-preserving form");
      }
      if (!privacy.Available(request)) Unsatisfiable(request, "critical privacy: sources need distinct parties and bounded segments for privacy-preserving mode");
      return ExecutionMode::kPrivacyPreserving;
    }
    if (local_ok) return ExecutionMode::kLocal;
    Unsatisfiable(request, "critical privacy: raw samples may not leave the site and local mode cannot run the request");
  }

  if (constraints.privacy == PrivacyLevel::kSensitive && !same && privacy.Available(request)) {
    return ExecutionMode::kPrivacyPreserving;
  }

  if (constraints.budget == ComputeBudget::kLow) {
    return same && local_ok ? ExecutionMode::kLocal : ExecutionMode::kRemote;
  }

  return ExecutionMode::kRemote;
}

void AdaptiveRouter::Validate(ExecutionMode mode, const CorrelationRequest& request, const LocalStrategy& local,
                              const PrivacyPreservingStrategy& privacy) const {
  const auto& constraints = request.constraints;
  const bool  same        = SameSource(request.sources);
  const bool  local_only  = same && LatencyBound(request);
  const util::ErrorContext ctx{.request_id = request.request_id};

  switch (mode) {
    case ExecutionMode::kLocal:
      if (!local.Available(request)) {
        throw util::CorrelationError(util::CorrelationErrorCode::kModeUnavailable, "local mode unavailable for this request", ctx);
      }
      return;

    case ExecutionMode::kRemote:
      if (local_only) Unsatisfiable(request, "remote mode cannot meet the latency bound of co-located sources");
      if (constraints.privacy == PrivacyLevel::kCritical) Unsatisfiable(request, "remote mode would expose raw samples under critical privacy");
      return;

    case ExecutionMode::kPrivacyPreserving:
      if (!privacy.Available(request)) {
        throw util::CorrelationError(util::CorrelationErrorCode::kModeUnavailable, "privacy-preserving mode unavailable for this request", ctx);
      }
      if (same) {
        throw util::CorrelationError(util::CorrelationErrorCode::kModeUnavailable, "privacy-preserving mode needs sources from two parties", ctx);
      }
      return;

    case ExecutionMode::kAdaptive:
      return;
  }
}

} // namespace sensorweave::correlation
