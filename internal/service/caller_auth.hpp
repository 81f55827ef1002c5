#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <google/protobuf/message.h>

#include "internal/util/time.hpp"

namespace sensorweave::identity { class IdentityDirectory; }

namespace sensorweave::service {

// gRPC metadata keys carrying the caller's signed identity.
inline constexpr char kIdentityHeader[]  = "x-sensorweave-identity";
inline constexpr char kTimestampHeader[] = "x-sensorweave-timestamp-ms";
inline constexpr char kSignatureHeader[] = "x-sensorweave-signature";

struct CallerCredentials {
  std::string identity;
  uint64_t    timestamp_ms = 0;
  std::string signature;
};

// Bytes a caller signs: rpc '\n' identity '\n' timestamp_ms '\n' hex(sha256(deterministic request bytes))
std::string CallerMessage(std::string_view rpc, const std::string& identity, uint64_t timestamp_ms,
                          const google::protobuf::Message& request);

CallerCredentials SignCall(std::string_view rpc, const std::string& identity, const std::string& private_key,
                           const google::protobuf::Message& request, util::TimePoint now);

/*
  Verifies that a mutating call was signed by the identity it names.

  The signature covers the route and the request body, so a captured
  signature cannot be moved onto another call. Timestamps outside
  max_skew are rejected and a signature is accepted at most once inside
  that window.
*/
class CallerAuthenticator {
 public:
  CallerAuthenticator(std::shared_ptr<identity::IdentityDirectory> identities, std::chrono::milliseconds max_skew);

  // Returns the verified identity. Throws DiscoveryError(kAuthFailed).
  std::string Authenticate(std::string_view rpc, const std::optional<CallerCredentials>& credentials,
                           const google::protobuf::Message& request, util::TimePoint now);

 private:
  std::shared_ptr<identity::IdentityDirectory> identities_;
  std::chrono::milliseconds                    max_skew_;

  std::mutex                                       mutex_;
  std::unordered_map<std::string, util::TimePoint> seen_;

  void Remember(const std::string& signature, util::TimePoint now);
};

// The id named in a request body must be empty or equal the verified caller.
std::string BindCaller(const std::string& verified, const std::string& claimed, std::string_view field);

} // namespace sensorweave::service
