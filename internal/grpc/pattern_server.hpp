#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/pattern_service.hpp"
#include "sensorweave/v1.hpp"

namespace sensorweave::grpc {

class PatternServer final : public sensorweave::v1::PatternService::Service {
public:
  explicit PatternServer(std::shared_ptr<sensorweave::service::PatternService> svc);

  ::grpc::Status Publish(::grpc::ServerContext*,
                  const sensorweave::v1::PublishPatternRequest*,
                  sensorweave::v1::PublishPatternResponse*) override;

  ::grpc::Status ReportFalsePositive(::grpc::ServerContext*,
                  const sensorweave::v1::ReportFalsePositiveRequest*,
                  sensorweave::v1::Pattern*) override;

  ::grpc::Status GetPattern(::grpc::ServerContext*,
                  const sensorweave::v1::GetPatternRequest*,
                  sensorweave::v1::Pattern*) override;

  ::grpc::Status ListPatterns(::grpc::ServerContext*,
                  const sensorweave::v1::ListPatternsRequest*,
                  sensorweave::v1::ListPatternsResponse*) override;

  ::grpc::Status MatchPatterns(::grpc::ServerContext*,
                  const sensorweave::v1::MatchPatternsRequest*,
                  sensorweave::v1::ListPatternsResponse*) override;

  ::grpc::Status MergePatterns(::grpc::ServerContext*,
                  const sensorweave::v1::MergePatternsRequest*,
                  sensorweave::v1::MergePatternsResponse*) override;

private:
  std::shared_ptr<sensorweave::service::PatternService> service_;
};

}
