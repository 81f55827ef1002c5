#pragma once

#include <optional>

#include <grpcpp/grpcpp.h>

#include "internal/service/caller_auth.hpp"

namespace sensorweave::grpc {

// Reads the caller headers. Absent identity yields nullopt; a malformed
// timestamp or signature throws DiscoveryError(kAuthFailed).
std::optional<sensorweave::service::CallerCredentials> CallerFromMetadata(const ::grpc::ServerContext& ctx);

}
