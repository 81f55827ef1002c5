#include "registry_service.hpp"

#include "internal/registry/capability_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace sensorweave::service {

using namespace sensorweave::v1;

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::string RegistryService::Authenticate(std::string_view rpc, const Caller& caller, const google::protobuf::Message& req) {
  if (!ctx_.callers) {
    throw sensorweave::util::InvalidState(std::string(rpc) + ": caller authentication is not configured");
  }
  return ctx_.callers->Authenticate(rpc, caller, req, sensorweave::util::Now());
}

RegisterBridgeResponse RegistryService::Register(const Caller& caller, const RegisterBridgeRequest& req) {
  return ObserveRpc("RegistryService.Register", "bridge.id", req.capability().bridge_id(), [&] {
    const auto caller_id = BindCaller(Authenticate("RegistryService.Register", caller, req), req.caller_id(), "caller_id");
    if (!req.has_capability()) {
      throw sensorweave::util::InvalidArgument("register bridge: capability is required");
    }
    RegisterBridgeResponse resp;
    *resp.mutable_capability() = ctx_.registry->Register(caller_id, req.capability());
    return resp;
  });
}

HeartbeatResponse RegistryService::Heartbeat(const Caller& caller, const HeartbeatRequest& req) {
  return ObserveRpc("RegistryService.Heartbeat", "bridge.id", req.bridge_id(), [&] {
    const auto caller_id = BindCaller(Authenticate("RegistryService.Heartbeat", caller, req), req.caller_id(), "caller_id");
    HeartbeatResponse resp;
    *resp.mutable_last_seen() = sensorweave::util::ToProto(ctx_.registry->Heartbeat(caller_id, req.bridge_id()));
    return resp;
  });
}

DiscoverResponse RegistryService::Discover(const DiscoverRequest& req) {
  return ObserveRpc("RegistryService.Discover", "bridge.id", "", [&] {
    DiscoverResponse resp;
    for (auto& scored : ctx_.registry->Discover(req.query())) {
      *resp.add_bridges() = std::move(scored);
    }
    return resp;
  });
}

void RegistryService::Unregister(const Caller& caller, const UnregisterBridgeRequest& req) {
  ObserveRpc("RegistryService.Unregister", "bridge.id", req.bridge_id(), [&] {
    const auto caller_id = BindCaller(Authenticate("RegistryService.Unregister", caller, req), req.caller_id(), "caller_id");
    ctx_.registry->Unregister(caller_id, req.bridge_id());
  });
}

BridgeCapability RegistryService::GetBridge(const GetBridgeRequest& req) {
  return ObserveRpc("RegistryService.GetBridge", "bridge.id", req.bridge_id(), [&] { return ctx_.registry->Get(req.bridge_id()); });
}

IssueChallengeResponse RegistryService::IssueChallenge(const Caller& caller, const IssueChallengeRequest& req) {
  return ObserveRpc("RegistryService.IssueChallenge", "bridge.id", req.bridge_id(), [&] {
    const auto requester_id =
        BindCaller(Authenticate("RegistryService.IssueChallenge", caller, req), req.requester_id(), "requester_id");
    const auto challenge = ctx_.registry->IssueChallenge(requester_id, req.bridge_id());

    IssueChallengeResponse resp;
    resp.set_challenge_id(challenge.challenge_id);
    resp.set_nonce(challenge.nonce);
    resp.set_timestamp_ms(challenge.timestamp_ms);
    *resp.mutable_expires_at() = sensorweave::util::ToProto(challenge.expires_at);
    return resp;
  });
}

CompleteChallengeResponse RegistryService::CompleteChallenge(const CompleteChallengeRequest& req) {
  return ObserveRpc("RegistryService.CompleteChallenge", "challenge.id", req.challenge_id(), [&] {
    const auto challenge = ctx_.registry->CompleteChallenge(req.challenge_id(), req.signature());

    CompleteChallengeResponse resp;
    resp.set_bridge_id(challenge.bridge_id);
    resp.set_requester_id(challenge.requester_id);
    *resp.mutable_verified_at() = sensorweave::util::ToProto(sensorweave::util::Now());
    return resp;
  });
}

RateBridgeResponse RegistryService::Rate(const Caller& caller, const RateBridgeRequest& req) {
  return ObserveRpc("RegistryService.Rate", "bridge.id", req.bridge_id(), [&] {
    const auto rater_id = BindCaller(Authenticate("RegistryService.Rate", caller, req), req.rater_id(), "rater_id");
    RateBridgeResponse resp;
    resp.set_reputation(ctx_.registry->Rate(rater_id, req.bridge_id(), req.score()));
    return resp;
  });
}

StreamDescriptor RegistryService::RegisterStream(const Caller& caller, const RegisterStreamRequest& req) {
  return ObserveRpc("RegistryService.RegisterStream", "bridge.id", req.stream().bridge_id(), [&] {
    const auto caller_id = BindCaller(Authenticate("RegistryService.RegisterStream", caller, req), req.caller_id(), "caller_id");
    return ctx_.registry->RegisterStream(caller_id, req.stream());
  });
}

ListStreamsResponse RegistryService::ListStreams(const ListStreamsRequest& req) {
  return ObserveRpc("RegistryService.ListStreams", "bridge.id", req.bridge_id(), [&] {
    ListStreamsResponse resp;
    for (auto& stream : ctx_.registry->ListStreams(req.bridge_id())) {
      *resp.add_streams() = std::move(stream);
    }
    return resp;
  });
}

} // namespace sensorweave::service
