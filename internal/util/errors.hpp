#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sensorweave::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Domain errors carry a code plus the ids a caller needs to decide
  between retry, abandon and fallback.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct ErrorContext {
  std::string bridge_id;
  std::string stream_id;
  std::string request_id;
};

std::string FormatWithContext(const std::string& msg, const ErrorContext& context);

template <typename CodeT>
class CodedError : public std::runtime_error {
 public:
  using Code = CodeT;

  CodedError(Code code, const std::string& msg, ErrorContext context = {})
      : std::runtime_error(FormatWithContext(msg, context)), code_(code), context_(std::move(context)) {
  }

  Code code() const {
    return code_;
  }

  const ErrorContext& context() const {
    return context_;
  }

 private:
  Code         code_;
  ErrorContext context_;
};

enum class DiscoveryErrorCode {
  kNotFound,
  kAuthFailed,
  kRateLimited,
};

enum class StreamErrorCode {
  kTimeout,
  kOverrun,
  kSyncLost,
  kRejectedParams,
};

enum class CorrelationErrorCode {
  kInsufficientData,
  kModeUnavailable,
  kConstraintUnsatisfiable,
  kDeadlineExceeded,
  kCancelled,
};

enum class SignificanceErrorCode {
  kInsufficientSamples,
};

class DiscoveryError : public CodedError<DiscoveryErrorCode> {
 public:
  using CodedError::CodedError;
};

class StreamError : public CodedError<StreamErrorCode> {
 public:
  using CodedError::CodedError;
};

class CorrelationError : public CodedError<CorrelationErrorCode> {
 public:
  using CodedError::CodedError;
};

class SignificanceError : public CodedError<SignificanceErrorCode> {
 public:
  using CodedError::CodedError;
};

const char* ToString(DiscoveryErrorCode code);
const char* ToString(StreamErrorCode code);
const char* ToString(CorrelationErrorCode code);
const char* ToString(SignificanceErrorCode code);

} // namespace sensorweave::util
