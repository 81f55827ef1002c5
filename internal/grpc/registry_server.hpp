#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/registry_service.hpp"
#include "sensorweave/v1.hpp"

namespace sensorweave::grpc {

class RegistryServer final : public sensorweave::v1::RegistryService::Service {
public:
  explicit RegistryServer(std::shared_ptr<sensorweave::service::RegistryService> svc);

  ::grpc::Status Register(::grpc::ServerContext*,
                  const sensorweave::v1::RegisterBridgeRequest*,
                  sensorweave::v1::RegisterBridgeResponse*) override;

  ::grpc::Status Heartbeat(::grpc::ServerContext*,
                  const sensorweave::v1::HeartbeatRequest*,
                  sensorweave::v1::HeartbeatResponse*) override;

  ::grpc::Status Discover(::grpc::ServerContext*,
                  const sensorweave::v1::DiscoverRequest*,
                  sensorweave::v1::DiscoverResponse*) override;

  ::grpc::Status Unregister(::grpc::ServerContext*,
                  const sensorweave::v1::UnregisterBridgeRequest*,
                  google::protobuf::Empty*) override;

  ::grpc::Status GetBridge(::grpc::ServerContext*,
                  const sensorweave::v1::GetBridgeRequest*,
                  sensorweave::v1::BridgeCapability*) override;

  ::grpc::Status IssueChallenge(::grpc::ServerContext*,
                  const sensorweave::v1::IssueChallengeRequest*,
                  sensorweave::v1::IssueChallengeResponse*) override;

  ::grpc::Status CompleteChallenge(::grpc::ServerContext*,
                  const sensorweave::v1::CompleteChallengeRequest*,
                  sensorweave::v1::CompleteChallengeResponse*) override;

  ::grpc::Status Rate(::grpc::ServerContext*,
                  const sensorweave::v1::RateBridgeRequest*,
                  sensorweave::v1::RateBridgeResponse*) override;

  ::grpc::Status RegisterStream(::grpc::ServerContext*,
                  const sensorweave::v1::RegisterStreamRequest*,
                  sensorweave::v1::StreamDescriptor*) override;

  ::grpc::Status ListStreams(::grpc::ServerContext*,
                  const sensorweave::v1::ListStreamsRequest*,
                  sensorweave::v1::ListStreamsResponse*) override;

private:
  std::shared_ptr<sensorweave::service::RegistryService> service_;
};

}
