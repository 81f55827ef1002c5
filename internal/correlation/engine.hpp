#pragma once

#include <memory>
#include <variant>

#include "local_strategy.hpp"
#include "privacy_strategy.hpp"
#include "remote_strategy.hpp"
#include "router.hpp"
#include "types.hpp"

namespace sensorweave::runtime::config {
class CorrelationConfig;
}

namespace sensorweave::correlation {

using Strategy = std::variant<LocalStrategy, RemoteStrategy, PrivacyPreservingStrategy>;

struct EngineOptions {
  LocalOptions   local;
  RemoteOptions  remote;
  PrivacyOptions privacy;
  RouterOptions  router;

  static EngineOptions FromConfig(const sensorweave::runtime::config::CorrelationConfig& config);
};

/*
  Entry point for correlation requests.

  Resolves the execution mode (router for adaptive requests, validation
  for explicit ones), derives the local deadline from the latency bound
  and dispatches to the chosen strategy.
*/
class CorrelationEngine {
 public:
  explicit CorrelationEngine(EngineOptions options = {}, std::shared_ptr<CustomOperationRegistry> custom = nullptr);

  CorrelationResult Compute(const CorrelationRequest& request, ComputeContext context = {}) const;

  // mode the request would run in; throws like Compute for unsatisfiable constraints
  ExecutionMode Resolve(const CorrelationRequest& request) const;

  Strategy Select(ExecutionMode mode) const;

  CustomOperationRegistry& custom_operations() const {
    return *remote_.custom();
  }

 private:
  LocalStrategy             local_;
  RemoteStrategy            remote_;
  PrivacyPreservingStrategy privacy_;
  AdaptiveRouter            router_;
};

} // namespace sensorweave::correlation
