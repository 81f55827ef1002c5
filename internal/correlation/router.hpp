#pragma once

#include <chrono>

#include "local_strategy.hpp"
#include "privacy_strategy.hpp"
#include "remote_strategy.hpp"
#include "types.hpp"

namespace sensorweave::correlation {

struct RouterOptions {
  std::chrono::microseconds local_latency_threshold{10000};
};

/*
  Picks an execution mode from the request's constraints.

  Order: latency, privacy, compute budget, default remote. A latency
  bound under the threshold on co-located sources is met locally or not
  at all; cross-site requests have no local option and go on to the
  privacy and budget rules. When no mode satisfies a stated constraint
  the router throws CorrelationError(kConstraintUnsatisfiable).
*/
class AdaptiveRouter {
 public:
  explicit AdaptiveRouter(RouterOptions options = {}) : options_(options) {
  }

  ExecutionMode Route(const CorrelationRequest& request, const LocalStrategy& local, const PrivacyPreservingStrategy& privacy) const;

  // rejects an explicitly requested mode that cannot run or would break a constraint
  void Validate(ExecutionMode mode, const CorrelationRequest& request, const LocalStrategy& local,
                const PrivacyPreservingStrategy& privacy) const;

 private:
  bool LatencyBound(const CorrelationRequest& request) const;

  RouterOptions options_;
};

} // namespace sensorweave::correlation
