#include "pattern_server.hpp"
#include "caller_metadata.hpp"
#include "grpc_error.hpp"

namespace sensorweave::grpc {

PatternServer::PatternServer(std::shared_ptr<sensorweave::service::PatternService> svc)
    : service_(std::move(svc)) {}

::grpc::Status PatternServer::Publish(::grpc::ServerContext* ctx,
                               const sensorweave::v1::PublishPatternRequest* req,
                               sensorweave::v1::PublishPatternResponse* resp) {
  try {
    *resp = service_->Publish(CallerFromMetadata(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PatternServer::ReportFalsePositive(::grpc::ServerContext* ctx,
                               const sensorweave::v1::ReportFalsePositiveRequest* req,
                               sensorweave::v1::Pattern* resp) {
  try {
    *resp = service_->ReportFalsePositive(CallerFromMetadata(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PatternServer::GetPattern(::grpc::ServerContext*,
                               const sensorweave::v1::GetPatternRequest* req,
                               sensorweave::v1::Pattern* resp) {
  try {
    *resp = service_->GetPattern(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PatternServer::ListPatterns(::grpc::ServerContext*,
                               const sensorweave::v1::ListPatternsRequest* req,
                               sensorweave::v1::ListPatternsResponse* resp) {
  try {
    *resp = service_->ListPatterns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PatternServer::MatchPatterns(::grpc::ServerContext*,
                               const sensorweave::v1::MatchPatternsRequest* req,
                               sensorweave::v1::ListPatternsResponse* resp) {
  try {
    *resp = service_->MatchPatterns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PatternServer::MergePatterns(::grpc::ServerContext*,
                               const sensorweave::v1::MergePatternsRequest* req,
                               sensorweave::v1::MergePatternsResponse* resp) {
  try {
    *resp = service_->MergePatterns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
