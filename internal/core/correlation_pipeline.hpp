#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/correlation/engine.hpp"
#include "internal/pattern/pattern_library.hpp"
#include "internal/significance/evaluator.hpp"
#include "internal/stream/session_manager.hpp"
#include "internal/stream/timeline_aligner.hpp"
#include "sensorweave/v1/types.pb.h"

namespace sensorweave::registry {
class CapabilityRegistry;
}

namespace sensorweave::core {

struct PipelineOutcome {
  correlation::CorrelationResult       result;
  significance::SignificanceScore      significance;
  std::optional<pattern::PublishOutcome> published;
};

/*
  One agent's view of the subsystem: discover bridges, subscribe to
  their streams, align what arrived and run correlation through
  significance into the pattern library.
*/
class CorrelationPipeline {
 public:
  CorrelationPipeline(std::string agent_id, std::shared_ptr<registry::CapabilityRegistry> registry, std::shared_ptr<stream::SessionManager> sessions,
                      std::shared_ptr<correlation::CorrelationEngine> engine, std::shared_ptr<significance::SignificanceEvaluator> evaluator,
                      std::shared_ptr<pattern::PatternLibrary> patterns);

  std::vector<sensorweave::v1::ScoredBridge> Discover(const sensorweave::v1::DiscoveryQuery& query) const;

  std::shared_ptr<stream::StreamSession> Subscribe(const std::string& uri, const stream::SubscribeParams& params = {});

  // drains up to max_packets per session, waiting up to `wait` for a first packet,
  // and returns the streams aligned onto one timeline
  std::vector<correlation::SourceSignal> CollectAligned(const std::vector<std::string>& session_ids, std::size_t max_packets,
                                                        std::chrono::milliseconds wait = std::chrono::milliseconds(0));

  // computes, evaluates and publishes a meaningful result as this agent's evidence
  PipelineOutcome Correlate(const correlation::CorrelationRequest& request, correlation::ComputeContext context = {});

  const std::string& agent_id() const {
    return agent_id_;
  }

 private:
  std::string                                         agent_id_;
  std::shared_ptr<registry::CapabilityRegistry>       registry_;
  std::shared_ptr<stream::SessionManager>             sessions_;
  std::shared_ptr<correlation::CorrelationEngine>     engine_;
  std::shared_ptr<significance::SignificanceEvaluator> evaluator_;
  std::shared_ptr<pattern::PatternLibrary>            patterns_;
  stream::TimelineAligner                             aligner_;
};

} // namespace sensorweave::core
