#include "errors.hpp"

namespace sensorweave::util {

std::string FormatWithContext(const std::string& msg, const ErrorContext& context) {
  std::string out = msg;
  if (!context.bridge_id.empty()) {
    out += " bridge_id=" + context.bridge_id;
  }
  if (!context.stream_id.empty()) {
    out += " stream_id=" + context.stream_id;
  }
  if (!context.request_id.empty()) {
    out += " request_id=" + context.request_id;
  }
  return out;
}

const char* ToString(DiscoveryErrorCode code) {
  switch (code) {
    case DiscoveryErrorCode::kNotFound:
      return "not_found";
    case DiscoveryErrorCode::kAuthFailed:
      return "auth_failed";
    case DiscoveryErrorCode::kRateLimited:
      return "rate_limited";
  }
  return "unknown";
}

const char* ToString(StreamErrorCode code) {
  switch (code) {
    case StreamErrorCode::kTimeout:
      return "timeout";
    case StreamErrorCode::kOverrun:
      return "overrun";
    case StreamErrorCode::kSyncLost:
      return "sync_lost";
    case StreamErrorCode::kRejectedParams:
      return "rejected_params";
  }
  return "unknown";
}

const char* ToString(CorrelationErrorCode code) {
  switch (code) {
    case CorrelationErrorCode::kInsufficientData:
      return "insufficient_data";
    case CorrelationErrorCode::kModeUnavailable:
      return "mode_unavailable";
    case CorrelationErrorCode::kConstraintUnsatisfiable:
      return "constraint_unsatisfiable";
    case CorrelationErrorCode::kDeadlineExceeded:
      return "deadline_exceeded";
    case CorrelationErrorCode::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

const char* ToString(SignificanceErrorCode code) {
  switch (code) {
    case SignificanceErrorCode::kInsufficientSamples:
      return "insufficient_samples";
  }
  return "unknown";
}

} // namespace sensorweave::util
