#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "cancel_token.hpp"
#include "sensorweave/v1/types.pb.h"

namespace sensorweave::correlation {

enum class ExecutionMode {
  kAdaptive,
  kLocal,
  kRemote,
  kPrivacyPreserving,
};

enum class PrivacyLevel {
  kPublic,
  kSensitive,
  kCritical,
};

enum class ComputeBudget {
  kNormal,
  kLow,
};

const char* ToString(ExecutionMode mode);
const char* ToString(sensorweave::v1::MixingOperation op);

// One input stream, already aligned onto the common timeline.
struct SourceSignal {
  std::string                    stream_id;
  std::string                    bridge_id;
  std::string                    site_id;
  std::string                    trust_domain;
  sensorweave::v1::SensingDomain domain = sensorweave::v1::SENSING_DOMAIN_UNSPECIFIED;
  double                         sample_rate = 0.0;
  std::vector<double>            samples;
};

struct Constraints {
  // below the router threshold on co-located sources only local mode may run
  std::optional<std::chrono::microseconds> max_latency;
  PrivacyLevel                             privacy = PrivacyLevel::kPublic;
  ComputeBudget                            budget  = ComputeBudget::kNormal;
};

struct CorrelationRequest {
  std::string                      request_id;
  std::vector<SourceSignal>        sources;
  sensorweave::v1::MixingOperation operation = sensorweave::v1::MIXING_OPERATION_CROSS_CORRELATION;
  ExecutionMode                    mode      = ExecutionMode::kAdaptive;
  Constraints                      constraints;
  // lags searched are [-max_lag, max_lag]; default N/4
  std::optional<std::size_t> max_lag;
  // name of a registered function for MIXING_OPERATION_CUSTOM
  std::string custom_name;
};

struct PairPeak {
  std::size_t first  = 0;
  std::size_t second = 1;
  int64_t     lag_samples = 0;
  double      lag_s       = 0.0;
  double      strength    = 0.0;
};

struct CorrelationResult {
  std::string                      request_id;
  sensorweave::v1::MixingOperation operation = sensorweave::v1::MIXING_OPERATION_UNSPECIFIED;
  ExecutionMode                    mode_used = ExecutionMode::kLocal;

  // output of the primary pair; for lagged operations index i is lag (i - max_lag)
  std::vector<double> output;
  int64_t             max_lag = 0;

  // strongest pair; positive lag means the second source trails the first
  PairPeak              peak;
  std::vector<PairPeak> pairs;

  std::chrono::microseconds latency{0};
};

// Everything a strategy may consult besides the request itself.
struct ComputeContext {
  using Clock = std::chrono::steady_clock;

  std::optional<Clock::time_point> deadline;
  CancelTokenPtr                   cancel;
  // sees every value the privacy coordinator receives
  std::function<void(const std::string& party, const std::vector<uint64_t>& share)> coordinator_observer;
};

} // namespace sensorweave::correlation
