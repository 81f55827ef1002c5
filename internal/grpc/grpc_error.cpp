#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace sensorweave::grpc {

namespace {

using namespace sensorweave::util;

::grpc::StatusCode CodeFor(DiscoveryErrorCode code) {
  switch (code) {
    case DiscoveryErrorCode::kNotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case DiscoveryErrorCode::kAuthFailed:
      return ::grpc::StatusCode::UNAUTHENTICATED;
    case DiscoveryErrorCode::kRateLimited:
      return ::grpc::StatusCode::RESOURCE_EXHAUSTED;
  }
  return ::grpc::StatusCode::INTERNAL;
}

::grpc::StatusCode CodeFor(StreamErrorCode code) {
  switch (code) {
    case StreamErrorCode::kTimeout:
      return ::grpc::StatusCode::DEADLINE_EXCEEDED;
    case StreamErrorCode::kOverrun:
      return ::grpc::StatusCode::RESOURCE_EXHAUSTED;
    case StreamErrorCode::kSyncLost:
      return ::grpc::StatusCode::UNAVAILABLE;
    case StreamErrorCode::kRejectedParams:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
  }
  return ::grpc::StatusCode::INTERNAL;
}

::grpc::StatusCode CodeFor(CorrelationErrorCode code) {
  switch (code) {
    case CorrelationErrorCode::kInsufficientData:
    case CorrelationErrorCode::kConstraintUnsatisfiable:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case CorrelationErrorCode::kModeUnavailable:
      return ::grpc::StatusCode::UNAVAILABLE;
    case CorrelationErrorCode::kDeadlineExceeded:
      return ::grpc::StatusCode::DEADLINE_EXCEEDED;
    case CorrelationErrorCode::kCancelled:
      return ::grpc::StatusCode::CANCELLED;
  }
  return ::grpc::StatusCode::INTERNAL;
}

::grpc::StatusCode CodeFor(SignificanceErrorCode) {
  return ::grpc::StatusCode::FAILED_PRECONDITION;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* err = dynamic_cast<const DiscoveryError*>(&e)) {
    return {CodeFor(err->code()), e.what()};
  }
  if (const auto* err = dynamic_cast<const StreamError*>(&e)) {
    return {CodeFor(err->code()), e.what()};
  }
  if (const auto* err = dynamic_cast<const CorrelationError*>(&e)) {
    return {CodeFor(err->code()), e.what()};
  }
  if (const auto* err = dynamic_cast<const SignificanceError*>(&e)) {
    return {CodeFor(err->code()), e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace sensorweave::grpc
