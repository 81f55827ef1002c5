#include "correlation_pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/capability_registry.hpp"
#include "internal/util/errors.hpp"

namespace sensorweave::core {

using namespace sensorweave::v1;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

std::string DomainName(SensingDomain domain) {
  std::string name = SensingDomain_Name(domain);
  const std::string prefix = "SENSING_DOMAIN_";
  if (name.rfind(prefix, 0) == 0) name.erase(0, prefix.size());
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return name;
}

} // namespace

CorrelationPipeline::CorrelationPipeline(std::string agent_id, std::shared_ptr<registry::CapabilityRegistry> registry,
                                         std::shared_ptr<stream::SessionManager> sessions, std::shared_ptr<correlation::CorrelationEngine> engine,
                                         std::shared_ptr<significance::SignificanceEvaluator> evaluator,
                                         std::shared_ptr<pattern::PatternLibrary>             patterns)
    : agent_id_(std::move(agent_id)),
      registry_(std::move(registry)),
      sessions_(std::move(sessions)),
      engine_(std::move(engine)),
      evaluator_(std::move(evaluator)),
      patterns_(std::move(patterns)) {
  if (agent_id_.empty()) throw std::invalid_argument("correlation pipeline requires an agent id");
  if (!registry_ || !sessions_ || !engine_ || !evaluator_) throw std::invalid_argument("correlation pipeline is missing a component");
}

std::vector<ScoredBridge> CorrelationPipeline::Discover(const DiscoveryQuery& query) const {
  return registry_->Discover(query);
}

std::shared_ptr<stream::StreamSession> CorrelationPipeline::Subscribe(const std::string& uri, const stream::SubscribeParams& params) {
  return sessions_->Subscribe(uri, params);
}

std::vector<correlation::SourceSignal> CorrelationPipeline::CollectAligned(const std::vector<std::string>& session_ids, std::size_t max_packets,
                                                                           std::chrono::milliseconds wait) {
  std::vector<stream::TimedSeries>    series;
  std::vector<correlation::SourceSignal> sources;

  for (const auto& id : session_ids) {
    auto session = sessions_->Get(id);

    std::vector<stream::SensorPacketPtr> packets;
    if (session->queued() == 0 && wait.count() > 0) {
      if (auto first = session->Next(wait)) packets.push_back(*first);
    }
    auto rest = session->Drain(max_packets - std::min(max_packets, packets.size()));
    packets.insert(packets.end(), rest.begin(), rest.end());
    if (packets.empty()) {
      throw util::CorrelationError(util::CorrelationErrorCode::kInsufficientData, "no packets buffered",
                                   {.bridge_id = session->request().capability.bridge_id(), .stream_id = id});
    }

    series.push_back(stream::TimedSeries::FromPackets(packets));

    const auto&               capability = session->request().capability;
    correlation::SourceSignal source;
    source.stream_id    = series.back().stream_id.empty() ? id : series.back().stream_id;
    source.bridge_id    = capability.bridge_id();
    source.site_id      = capability.site_id();
    source.trust_domain = capability.trust_domain();
    source.domain       = capability.domain();
    sources.push_back(std::move(source));
  }

  auto aligned = aligner_.Align(series);
  for (std::size_t i = 0; i < sources.size(); ++i) {
    sources[i].sample_rate = aligned.sample_rate;
    sources[i].samples     = aligned.series[i].Values();
  }
  return sources;
}

PipelineOutcome CorrelationPipeline::Correlate(const correlation::CorrelationRequest& request, correlation::ComputeContext context) {
  observability::SpanScope span("pipeline.correlate");
  span.SetAttribute("agent_id", agent_id_);

  PipelineOutcome outcome;
  outcome.result = engine_->Compute(request, std::move(context));

  const auto& a = request.sources[outcome.result.peak.first];
  const auto& b = request.sources[outcome.result.peak.second];
  outcome.significance = evaluator_->Evaluate(outcome.result, a, b);
  observability::Metrics::Instance().RecordSignificance(outcome.significance.meaningful, static_cast<int>(outcome.significance.pass_count));

  if (outcome.significance.meaningful && patterns_) {
    Pattern draft;
    draft.set_name(DomainName(a.domain) + "-" + DomainName(b.domain) + " " + correlation::ToString(request.operation));
    draft.set_domain_a(a.domain);
    draft.set_domain_b(b.domain);
    draft.set_operation(request.operation);
    draft.set_mechanism(outcome.significance.mechanism.empty() ? "empirical" : outcome.significance.mechanism);

    PatternEvidence evidence;
    evidence.set_agent_id(agent_id_);
    evidence.set_lag_s(outcome.result.peak.lag_s);
    evidence.set_strength(outcome.result.peak.strength);
    evidence.set_confidence(outcome.significance.confidence);
    evidence.set_pass_count(outcome.significance.pass_count);

    outcome.published = patterns_->Publish(draft, evidence);
    observability::Metrics::Instance().RecordPatternEvent(outcome.published->created ? "created" : "confirmed");
  }

  SENSORWEAVE_LOG_INFO("correlation evaluated", {StringField("request_id", request.request_id), StringField("mode", correlation::ToString(outcome.result.mode_used)),
                                                 IntField("pass_count", outcome.significance.pass_count),
                                                 BoolField("meaningful", outcome.significance.meaningful)});
  return outcome;
}

} // namespace sensorweave::core
