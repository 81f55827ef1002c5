#include "caller_metadata.hpp"

#include <charconv>
#include <stdexcept>
#include <string>

#include "internal/crypto/crypto.hpp"
#include "internal/util/errors.hpp"

namespace sensorweave::grpc {

namespace {

using sensorweave::util::DiscoveryError;
using sensorweave::util::DiscoveryErrorCode;

std::optional<std::string> Header(const ::grpc::ServerContext& ctx, const char* key) {
  const auto& metadata = ctx.client_metadata();
  const auto  it       = metadata.find(key);
  if (it == metadata.end()) return std::nullopt;
  return std::string(it->second.data(), it->second.size());
}

} // namespace

std::optional<sensorweave::service::CallerCredentials> CallerFromMetadata(const ::grpc::ServerContext& ctx) {
  auto identity = Header(ctx, sensorweave::service::kIdentityHeader);
  if (!identity) return std::nullopt;

  sensorweave::service::CallerCredentials credentials;
  credentials.identity = std::move(*identity);

  const auto timestamp = Header(ctx, sensorweave::service::kTimestampHeader).value_or("");
  const auto* end      = timestamp.data() + timestamp.size();
  const auto  parsed   = std::from_chars(timestamp.data(), end, credentials.timestamp_ms);
  if (timestamp.empty() || parsed.ec != std::errc() || parsed.ptr != end) {
    throw DiscoveryError(DiscoveryErrorCode::kAuthFailed, "malformed caller timestamp");
  }

  try {
    credentials.signature = sensorweave::crypto::FromHex(Header(ctx, sensorweave::service::kSignatureHeader).value_or(""));
  } catch (const std::invalid_argument& e) {
    throw DiscoveryError(DiscoveryErrorCode::kAuthFailed, std::string("malformed caller signature: ") + e.what());
  }
  return credentials;
}

}
