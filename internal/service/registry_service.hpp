#pragma once

#include <optional>

#include "caller_auth.hpp"
#include "service_context.hpp"
#include "sensorweave/v1.hpp"

namespace sensorweave::service {

/*
  Mutating calls take the caller's signed credentials. The acting
  identity is the verified one; ids in the request body must be empty
  or name that same identity.
*/
class RegistryService {
public:
  using Caller = std::optional<CallerCredentials>;

  explicit RegistryService(ServiceContext ctx);

  sensorweave::v1::RegisterBridgeResponse Register(const Caller& caller, const sensorweave::v1::RegisterBridgeRequest& req);

  sensorweave::v1::HeartbeatResponse Heartbeat(const Caller& caller, const sensorweave::v1::HeartbeatRequest& req);

  sensorweave::v1::DiscoverResponse Discover(const sensorweave::v1::DiscoverRequest& req);

  void Unregister(const Caller& caller, const sensorweave::v1::UnregisterBridgeRequest& req);

  sensorweave::v1::BridgeCapability GetBridge(const sensorweave::v1::GetBridgeRequest& req);

  sensorweave::v1::IssueChallengeResponse IssueChallenge(const Caller& caller, const sensorweave::v1::IssueChallengeRequest& req);

  sensorweave::v1::CompleteChallengeResponse CompleteChallenge(const sensorweave::v1::CompleteChallengeRequest& req);

  sensorweave::v1::RateBridgeResponse Rate(const Caller& caller, const sensorweave::v1::RateBridgeRequest& req);

  sensorweave::v1::StreamDescriptor RegisterStream(const Caller& caller, const sensorweave::v1::RegisterStreamRequest& req);

  sensorweave::v1::ListStreamsResponse ListStreams(const sensorweave::v1::ListStreamsRequest& req);

private:
  ServiceContext ctx_;

  std::string Authenticate(std::string_view rpc, const Caller& caller, const google::protobuf::Message& req);
};

}
