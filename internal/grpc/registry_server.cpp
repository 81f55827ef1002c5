#include "registry_server.hpp"
#include "caller_metadata.hpp"
#include "grpc_error.hpp"

namespace sensorweave::grpc {

RegistryServer::RegistryServer(std::shared_ptr<sensorweave::service::RegistryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RegistryServer::Register(::grpc::ServerContext* ctx,
                               const sensorweave::v1::RegisterBridgeRequest* req,
                               sensorweave::v1::RegisterBridgeResponse* resp) {
  try {
    *resp = service_->Register(CallerFromMetadata(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Heartbeat(::grpc::ServerContext* ctx,
                               const sensorweave::v1::HeartbeatRequest* req,
                               sensorweave::v1::HeartbeatResponse* resp) {
  try {
    *resp = service_->Heartbeat(CallerFromMetadata(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Discover(::grpc::ServerContext*,
                               const sensorweave::v1::DiscoverRequest* req,
                               sensorweave::v1::DiscoverResponse* resp) {
  try {
    *resp = service_->Discover(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Unregister(::grpc::ServerContext* ctx,
                               const sensorweave::v1::UnregisterBridgeRequest* req,
                               google::protobuf::Empty*) {
  try {
    service_->Unregister(CallerFromMetadata(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetBridge(::grpc::ServerContext*,
                               const sensorweave::v1::GetBridgeRequest* req,
                               sensorweave::v1::BridgeCapability* resp) {
  try {
    *resp = service_->GetBridge(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::IssueChallenge(::grpc::ServerContext* ctx,
                               const sensorweave::v1::IssueChallengeRequest* req,
                               sensorweave::v1::IssueChallengeResponse* resp) {
  try {
    *resp = service_->IssueChallenge(CallerFromMetadata(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::CompleteChallenge(::grpc::ServerContext*,
                               const sensorweave::v1::CompleteChallengeRequest* req,
                               sensorweave::v1::CompleteChallengeResponse* resp) {
  try {
    *resp = service_->CompleteChallenge(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Rate(::grpc::ServerContext* ctx,
                               const sensorweave::v1::RateBridgeRequest* req,
                               sensorweave::v1::RateBridgeResponse* resp) {
  try {
    *resp = service_->Rate(CallerFromMetadata(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::RegisterStream(::grpc::ServerContext* ctx,
                               const sensorweave::v1::RegisterStreamRequest* req,
                               sensorweave::v1::StreamDescriptor* resp) {
  try {
    *resp = service_->RegisterStream(CallerFromMetadata(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::ListStreams(::grpc::ServerContext*,
                               const sensorweave::v1::ListStreamsRequest* req,
                               sensorweave::v1::ListStreamsResponse* resp) {
  try {
    *resp = service_->ListStreams(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
