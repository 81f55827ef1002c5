#include "pattern_service.hpp"

#include "internal/pattern/pattern_library.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace sensorweave::service {

using namespace sensorweave::v1;

namespace {

ListPatternsResponse ToListResponse(std::vector<Pattern> patterns) {
  ListPatternsResponse resp;
  for (auto& pattern : patterns) {
    *resp.add_patterns() = std::move(pattern);
  }
  return resp;
}

} // namespace

PatternService::PatternService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::string PatternService::Authenticate(std::string_view rpc, const Caller& caller, const google::protobuf::Message& req) {
  if (!ctx_.callers) {
    throw sensorweave::util::InvalidState(std::string(rpc) + ": caller authentication is not configured");
  }
  return ctx_.callers->Authenticate(rpc, caller, req, sensorweave::util::Now());
}

PublishPatternResponse PatternService::Publish(const Caller& caller, const PublishPatternRequest& req) {
  return ObserveRpc("PatternService.Publish", "agent.id", req.evidence().agent_id(), [&] {
    const auto agent_id = BindCaller(Authenticate("PatternService.Publish", caller, req), req.evidence().agent_id(), "agent_id");
    if (!req.has_draft() || !req.has_evidence()) {
      throw sensorweave::util::InvalidArgument("publish pattern: draft and evidence are required");
    }
    auto evidence = req.evidence();
    evidence.set_agent_id(agent_id);
    auto outcome = ctx_.patterns->Publish(req.draft(), evidence);

    PublishPatternResponse resp;
    *resp.mutable_pattern() = std::move(outcome.pattern);
    resp.set_created(outcome.created);
    return resp;
  });
}

Pattern PatternService::ReportFalsePositive(const Caller& caller, const ReportFalsePositiveRequest& req) {
  return ObserveRpc("PatternService.ReportFalsePositive", "pattern.id", req.pattern_id(), [&] {
    const auto reporter_id =
        BindCaller(Authenticate("PatternService.ReportFalsePositive", caller, req), req.reporter_id(), "reporter_id");
    auto pattern = ctx_.patterns->ReportFalsePositive(req.pattern_id(), reporter_id);
    if (pattern.status() == PATTERN_STATUS_RETIRED) {
      sensorweave::observability::Metrics::Instance().RecordPatternEvent("retired");
    }
    return pattern;
  });
}

Pattern PatternService::GetPattern(const GetPatternRequest& req) {
  return ObserveRpc("PatternService.GetPattern", "pattern.id", req.pattern_id(), [&] { return ctx_.patterns->Get(req.pattern_id()); });
}

ListPatternsResponse PatternService::ListPatterns(const ListPatternsRequest& req) {
  return ObserveRpc("PatternService.ListPatterns", "pattern.id", "",
                    [&] { return ToListResponse(ctx_.patterns->List(req.include_retired())); });
}

ListPatternsResponse PatternService::MatchPatterns(const MatchPatternsRequest& req) {
  return ObserveRpc("PatternService.MatchPatterns", "pattern.id", "", [&] {
    return ToListResponse(ctx_.patterns->MatchPatterns(req.domain_a(), req.domain_b(), req.operation(), req.lag_s()));
  });
}

MergePatternsResponse PatternService::MergePatterns(const MergePatternsRequest& req) {
  return ObserveRpc("PatternService.MergePatterns", "pattern.id", "", [&] {
    MergePatternsResponse resp;
    uint32_t merged = 0;
    for (const auto& remote : req.patterns()) {
      ctx_.patterns->Merge(remote);
      sensorweave::observability::Metrics::Instance().RecordPatternEvent("merged");
      ++merged;
    }
    resp.set_merged(merged);
    return resp;
  });
}

} // namespace sensorweave::service
