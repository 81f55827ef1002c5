#pragma once

#include <optional>

#include "caller_auth.hpp"
#include "service_context.hpp"
#include "sensorweave/v1.hpp"

namespace sensorweave::service {

class PatternService {
public:
  using Caller = std::optional<CallerCredentials>;

  explicit PatternService(ServiceContext ctx);

  sensorweave::v1::PublishPatternResponse Publish(const Caller& caller, const sensorweave::v1::PublishPatternRequest& req);

  sensorweave::v1::Pattern ReportFalsePositive(const Caller& caller, const sensorweave::v1::ReportFalsePositiveRequest& req);

  sensorweave::v1::Pattern GetPattern(const sensorweave::v1::GetPatternRequest& req);

  sensorweave::v1::ListPatternsResponse ListPatterns(const sensorweave::v1::ListPatternsRequest& req);

  sensorweave::v1::ListPatternsResponse MatchPatterns(const sensorweave::v1::MatchPatternsRequest& req);

  sensorweave::v1::MergePatternsResponse MergePatterns(const sensorweave::v1::MergePatternsRequest& req);

private:
  ServiceContext ctx_;

  std::string Authenticate(std::string_view rpc, const Caller& caller, const google::protobuf::Message& req);
};

}
