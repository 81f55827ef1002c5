#include "caller_auth.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "internal/crypto/crypto.hpp"
#include "internal/identity/identity_directory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sensorweave::service {

namespace {

using sensorweave::observability::StringField;
using sensorweave::util::DiscoveryError;
using sensorweave::util::DiscoveryErrorCode;

std::string DeterministicBytes(const google::protobuf::Message& message) {
  std::string out;
  {
    google::protobuf::io::StringOutputStream stream(&out);
    google::protobuf::io::CodedOutputStream  coded(&stream);
    coded.SetSerializationDeterministic(true);
    message.SerializeToCodedStream(&coded);
  }
  return out;
}

[[noreturn]] void Reject(const std::string& reason, std::string_view rpc) {
  throw DiscoveryError(DiscoveryErrorCode::kAuthFailed, std::string(rpc) + ": " + reason);
}

} // namespace

std::string CallerMessage(std::string_view rpc, const std::string& identity, uint64_t timestamp_ms,
                          const google::protobuf::Message& request) {
  std::string message(rpc);
  message += '\n';
  message += identity;
  message += '\n';
  message += std::to_string(timestamp_ms);
  message += '\n';
  message += crypto::Sha256Hex(DeterministicBytes(request));
  return message;
}

CallerCredentials SignCall(std::string_view rpc, const std::string& identity, const std::string& private_key,
                           const google::protobuf::Message& request, util::TimePoint now) {
  CallerCredentials credentials;
  credentials.identity     = identity;
  credentials.timestamp_ms = util::ToUnixMillis(now);
  credentials.signature =
      crypto::SignEd25519(private_key, CallerMessage(rpc, identity, credentials.timestamp_ms, request));
  return credentials;
}

CallerAuthenticator::CallerAuthenticator(std::shared_ptr<identity::IdentityDirectory> identities,
                                         std::chrono::milliseconds max_skew)
    : identities_(std::move(identities)), max_skew_(max_skew) {
}

std::string CallerAuthenticator::Authenticate(std::string_view rpc, const std::optional<CallerCredentials>& credentials,
                                              const google::protobuf::Message& request, util::TimePoint now) {
  if (!credentials || credentials->identity.empty()) Reject("caller credentials are required", rpc);

  const auto signed_at = util::FromUnixMillis(credentials->timestamp_ms);
  const auto skew      = signed_at > now ? signed_at - now : now - signed_at;
  if (skew > max_skew_) Reject("stale or future timestamp", rpc);

  const auto public_key = identities_ ? identities_->PublicKeyFor(credentials->identity) : std::nullopt;
  if (!public_key) Reject("unknown identity " + credentials->identity, rpc);

  const auto message = CallerMessage(rpc, credentials->identity, credentials->timestamp_ms, request);
  if (!crypto::VerifyEd25519(*public_key, message, credentials->signature)) {
    SENSORWEAVE_LOG_WARN("caller signature rejected", {StringField("route", rpc), StringField("identity", credentials->identity)});
    Reject("signature does not verify", rpc);
  }

  Remember(credentials->signature, now);
  return credentials->identity;
}

void CallerAuthenticator::Remember(const std::string& signature, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  for (auto it = seen_.begin(); it != seen_.end();) {
    if (now - it->second > 2 * max_skew_) {
      it = seen_.erase(it);
    } else {
      ++it;
    }
  }
  if (!seen_.emplace(signature, now).second) {
    throw DiscoveryError(DiscoveryErrorCode::kAuthFailed, "replayed caller signature");
  }
}

std::string BindCaller(const std::string& verified, const std::string& claimed, std::string_view field) {
  if (!claimed.empty() && claimed != verified) {
    throw util::PermissionDenied(std::string(field) + " " + claimed + " does not match authenticated caller " + verified);
  }
  return verified;
}

} // namespace sensorweave::service
