#include <cassert>
#include <cmath>
#include <iostream>
#include <numeric>
#include <random>

#include "internal/correlation/engine.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace sensorweave::correlation;
using namespace sensorweave::v1;
using sensorweave::util::CorrelationError;
using sensorweave::util::CorrelationErrorCode;

std::vector<double> Noise(std::size_t n, uint32_t seed) {
  std::mt19937                     rng(seed);
  std::normal_distribution<double> dist(0.0, 1.0);
  std::vector<double>              out(n);
  for (auto& v : out) v = dist(rng);
  return out;
}

std::vector<double> Delayed(const std::vector<double>& x, std::size_t delay, uint32_t seed) {
  auto fill = Noise(delay, seed);
  std::vector<double> out(x.size());
  for (std::size_t i = 0; i < x.size(); ++i) out[i] = i < delay ? fill[i] : x[i - delay];
  return out;
}

SourceSignal Source(std::string stream, std::string site, std::string bridge, std::vector<double> samples) {
  SourceSignal s;
  s.stream_id   = std::move(stream);
  s.site_id     = std::move(site);
  s.bridge_id   = std::move(bridge);
  s.sample_rate = 1000.0;
  s.samples     = std::move(samples);
  return s;
}

// two streams on one site, b trailing a by `delay` samples
CorrelationRequest CoLocated(std::size_t delay = 0) {
  const auto         a = Noise(256, 1);
  CorrelationRequest request;
  request.request_id = "req-local";
  request.sources.push_back(Source("mic", "site-a", "bridge-1", a));
  request.sources.push_back(Source("accel", "site-a", "bridge-1", delay == 0 ? a : Delayed(a, delay, 9)));
  return request;
}

CorrelationRequest CrossSite() {
  const auto         a = Noise(256, 2);
  CorrelationRequest request;
  request.request_id = "req-cross";
  request.sources.push_back(Source("mic", "site-a", "bridge-1", a));
  request.sources.push_back(Source("seismic", "site-b", "bridge-2", Delayed(a, 3, 11)));
  request.sources[0].trust_domain = "org-a";
  request.sources[1].trust_domain = "org-b";
  return request;
}

template <typename Fn>
CorrelationErrorCode ExpectCorrelationError(Fn&& fn) {
  try {
    fn();
  } catch (const CorrelationError& e) {
    return e.code();
  }
  assert(false && "expected CorrelationError");
  return CorrelationErrorCode::kInsufficientData;
}

void TestSelfCorrelationPeaksAtZeroLag() {
  CorrelationEngine engine;
  auto              request = CoLocated();
  request.mode              = ExecutionMode::kLocal;

  const auto result = engine.Compute(request);
  assert(result.mode_used == ExecutionMode::kLocal);
  assert(result.peak.lag_samples == 0);
  assert(std::abs(result.peak.strength - 1.0) < 1e-9);
  assert(result.max_lag == 64);
  assert(result.output.size() == 129);
  assert(result.pairs.size() == 1);
}

void TestDelayedCopyGivesPositiveLag() {
  CorrelationEngine engine;
  auto              request = CoLocated(7);

  const auto result = engine.Compute(request);
  assert(result.mode_used == ExecutionMode::kRemote);
  assert(result.peak.lag_samples == 7);
  assert(std::abs(result.peak.lag_s - 0.007) < 1e-12);
  assert(result.peak.strength > 0.9);

  // swapping the sources flips the sign
  std::swap(request.sources[0], request.sources[1]);
  assert(engine.Compute(request).peak.lag_samples == -7);
}

void TestIndependentNoiseIsWeak() {
  CorrelationEngine  engine;
  CorrelationRequest request;
  request.sources.push_back(Source("a", "s", "b", Noise(2048, 21)));
  request.sources.push_back(Source("b", "s", "b", Noise(2048, 22)));

  const auto result = engine.Compute(request);
  assert(result.peak.strength < 0.15);
}

void TestNoisePeakShrinksWithWindowLength() {
  CorrelationEngine engine;
  std::vector<double> mean_peak;
  uint32_t            seed = 300;
  for (std::size_t n : {256, 1024, 4096}) {
    double sum = 0.0;
    for (int t = 0; t < 20; ++t, seed += 2) {
      CorrelationRequest request;
      request.sources.push_back(Source("a", "s", "b", Noise(n, seed)));
      request.sources.push_back(Source("b", "s", "b", Noise(n, seed + 1)));
      sum += engine.Compute(request).peak.strength;
    }
    const double mean = sum / 20.0;
    // the largest of the searched lags stays a few standard errors out
    assert(mean * std::sqrt(static_cast<double>(n)) > 1.0);
    assert(mean * std::sqrt(static_cast<double>(n)) < 5.0);
    mean_peak.push_back(mean);
  }
  assert(mean_peak[1] < mean_peak[0] / 1.5);
  assert(mean_peak[2] < mean_peak[1] / 1.5);
}

void TestStrongestPairIsPrimary() {
  CorrelationEngine engine;
  auto              request = CoLocated(4);
  request.sources.push_back(Source("noise", "site-a", "bridge-1", Noise(256, 5)));

  const auto result = engine.Compute(request);
  assert(result.pairs.size() == 3);
  assert(result.peak.first == 0);
  assert(result.peak.second == 1);
  assert(result.peak.lag_samples == 4);
}

void TestNeedsTwoSourcesWithSamples() {
  CorrelationEngine engine;
  auto              request = CoLocated();
  request.sources.pop_back();
  assert(ExpectCorrelationError([&] { engine.Compute(request); }) == CorrelationErrorCode::kInsufficientData);

  request = CoLocated();
  request.sources[1].samples = {1.0};
  assert(ExpectCorrelationError([&] { engine.Compute(request); }) == CorrelationErrorCode::kInsufficientData);
}

void TestAdaptiveRouting() {
  CorrelationEngine engine;

  // tight latency on co-located sources runs locally
  auto fast                   = CoLocated();
  fast.constraints.max_latency = std::chrono::microseconds(5000);
  assert(engine.Resolve(fast) == ExecutionMode::kLocal);

  // cross-site sources have no local option
  auto cross                    = CrossSite();
  cross.constraints.max_latency = std::chrono::microseconds(5000);
  assert(engine.Resolve(cross) == ExecutionMode::kRemote);

  // a latency loose enough for remote goes by the remaining rules
  auto relaxed                    = CoLocated();
  relaxed.operation               = MIXING_OPERATION_COHERENCE;
  relaxed.constraints.max_latency = std::chrono::microseconds(50000);
  assert(engine.Resolve(relaxed) == ExecutionMode::kRemote);

  auto critical                  = CrossSite();
  critical.constraints.privacy   = PrivacyLevel::kCritical;
  assert(engine.Resolve(critical) == ExecutionMode::kPrivacyPreserving);

  critical.operation = MIXING_OPERATION_COHERENCE;
  assert(ExpectCorrelationError([&] { engine.Resolve(critical); }) == CorrelationErrorCode::kConstraintUnsatisfiable);

  auto critical_local                = CoLocated();
  critical_local.constraints.privacy = PrivacyLevel::kCritical;
  assert(engine.Resolve(critical_local) == ExecutionMode::kLocal);
  critical_local.operation = MIXING_OPERATION_SPECTRAL;
  assert(ExpectCorrelationError([&] { engine.Resolve(critical_local); }) == CorrelationErrorCode::kConstraintUnsatisfiable);

  auto sensitive                = CrossSite();
  sensitive.constraints.privacy = PrivacyLevel::kSensitive;
  assert(engine.Resolve(sensitive) == ExecutionMode::kPrivacyPreserving);

  auto cheap               = CoLocated();
  cheap.constraints.budget = ComputeBudget::kLow;
  assert(engine.Resolve(cheap) == ExecutionMode::kLocal);
  auto cheap_remote               = CrossSite();
  cheap_remote.constraints.budget = ComputeBudget::kLow;
  assert(engine.Resolve(cheap_remote) == ExecutionMode::kRemote);

  assert(engine.Resolve(CrossSite()) == ExecutionMode::kRemote);
}

void TestLatencyBoundNeverFallsBackToRemote() {
  CorrelationEngine engine;

  auto request                    = CoLocated();
  request.constraints.max_latency = std::chrono::microseconds(5000);
  assert(engine.Resolve(request) == ExecutionMode::kLocal);

  // local mode has no coherence
  auto coherence      = request;
  coherence.operation = MIXING_OPERATION_COHERENCE;
  assert(ExpectCorrelationError([&] { engine.Resolve(coherence); }) == CorrelationErrorCode::kConstraintUnsatisfiable);
  assert(ExpectCorrelationError([&] { engine.Compute(coherence); }) == CorrelationErrorCode::kConstraintUnsatisfiable);

  // more samples than local mode accepts
  auto long_window = request;
  const auto a     = Noise(5000, 3);
  long_window.sources[0].samples = a;
  long_window.sources[1].samples = a;
  assert(ExpectCorrelationError([&] { engine.Resolve(long_window); }) == CorrelationErrorCode::kConstraintUnsatisfiable);

  // the same request without a bound is free to run remotely
  long_window.constraints.max_latency.reset();
  assert(engine.Resolve(long_window) == ExecutionMode::kRemote);
}

void TestExplicitModesAreValidated() {
  CorrelationEngine engine;

  auto local = CrossSite();
  local.mode = ExecutionMode::kLocal;
  assert(ExpectCorrelationError([&] { engine.Resolve(local); }) == CorrelationErrorCode::kModeUnavailable);

  auto remote                = CrossSite();
  remote.mode                = ExecutionMode::kRemote;
  remote.constraints.privacy = PrivacyLevel::kCritical;
  assert(ExpectCorrelationError([&] { engine.Resolve(remote); }) == CorrelationErrorCode::kConstraintUnsatisfiable);

  auto fast_remote                    = CoLocated();
  fast_remote.mode                    = ExecutionMode::kRemote;
  fast_remote.constraints.max_latency = std::chrono::microseconds(1000);
  assert(ExpectCorrelationError([&] { engine.Resolve(fast_remote); }) == CorrelationErrorCode::kConstraintUnsatisfiable);

  // one site, two trust domains: shares would never leave the site
  auto same_site                    = CoLocated();
  same_site.mode                    = ExecutionMode::kPrivacyPreserving;
  same_site.sources[0].trust_domain = "org-a";
  same_site.sources[1].trust_domain = "org-b";
  assert(ExpectCorrelationError([&] { engine.Resolve(same_site); }) == CorrelationErrorCode::kModeUnavailable);

  auto unsupported      = CrossSite();
  unsupported.mode      = ExecutionMode::kPrivacyPreserving;
  unsupported.operation = MIXING_OPERATION_HILBERT_ENVELOPE;
  assert(ExpectCorrelationError([&] { engine.Resolve(unsupported); }) == CorrelationErrorCode::kModeUnavailable);
}

void TestLocalSampleLimit() {
  EngineOptions options;
  options.local.max_samples = 128;
  CorrelationEngine engine(options);

  auto request = CoLocated();
  assert(engine.Resolve(request) == ExecutionMode::kRemote);
  request.constraints.budget = ComputeBudget::kLow;
  assert(engine.Resolve(request) == ExecutionMode::kRemote);
  request.mode = ExecutionMode::kLocal;
  assert(ExpectCorrelationError([&] { engine.Resolve(request); }) == CorrelationErrorCode::kModeUnavailable);
}

void TestLocalDeadlineIsEnforced() {
  CorrelationEngine engine;
  auto              request = CoLocated();
  request.mode              = ExecutionMode::kLocal;

  ComputeContext context;
  context.deadline = ComputeContext::Clock::now() - std::chrono::seconds(1);
  assert(ExpectCorrelationError([&] { engine.Compute(request, context); }) == CorrelationErrorCode::kDeadlineExceeded);
}

void TestRemoteCancellation() {
  CorrelationEngine engine;
  auto              request = CrossSite();
  request.operation         = MIXING_OPERATION_HILBERT_ENVELOPE;

  ComputeContext context;
  context.cancel = CancelToken::Create();
  context.cancel->Cancel();
  assert(ExpectCorrelationError([&] { engine.Compute(request, context); }) == CorrelationErrorCode::kCancelled);
}

void TestRemoteOperations() {
  CorrelationEngine engine;
  auto              request = CoLocated();

  request.operation = MIXING_OPERATION_MULTIPLICATION;
  auto product      = engine.Compute(request);
  assert(product.output.size() == 256);
  assert(std::abs(product.peak.strength - 1.0) < 1e-9);

  request.operation = MIXING_OPERATION_CONVOLUTION;
  assert(engine.Compute(request).output.size() == 511);

  request.operation = MIXING_OPERATION_COHERENCE;
  auto coherence    = engine.Compute(request);
  assert(!coherence.output.empty());
  for (double c : coherence.output) assert(c >= 0.0 && c <= 1.0 + 1e-9);
  assert(coherence.peak.strength > 0.99);

  request.operation = MIXING_OPERATION_HILBERT_ENVELOPE;
  assert(engine.Compute(request).peak.lag_samples == 0);

  request.operation = MIXING_OPERATION_SPECTRAL;
  auto spectral     = engine.Compute(request);
  assert(std::abs(spectral.peak.strength - 1.0) < 1e-9);
}

void TestCustomOperation() {
  CorrelationEngine engine;
  engine.custom_operations().Register("dot", [](const std::vector<double>& a, const std::vector<double>& b) {
    return std::vector<double>{0.0, std::inner_product(a.begin(), a.end(), b.begin(), 0.0), 0.0};
  });
  assert(engine.custom_operations().Contains("dot"));

  auto request        = CoLocated();
  request.operation   = MIXING_OPERATION_CUSTOM;
  request.custom_name = "dot";
  const auto result   = engine.Compute(request);
  assert(result.mode_used == ExecutionMode::kRemote);
  assert(result.max_lag == 1);
  assert(result.peak.lag_samples == 0);
  assert(std::abs(result.peak.strength - 1.0) < 1e-9);

  request.custom_name = "missing";
  bool threw          = false;
  try {
    engine.Compute(request);
  } catch (const sensorweave::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSelfCorrelationPeaksAtZeroLag();
  TestDelayedCopyGivesPositiveLag();
  TestIndependentNoiseIsWeak();
  TestNoisePeakShrinksWithWindowLength();
  TestStrongestPairIsPrimary();
  TestNeedsTwoSourcesWithSamples();
  TestAdaptiveRouting();
  TestLatencyBoundNeverFallsBackToRemote();
  TestExplicitModesAreValidated();
  TestLocalSampleLimit();
  TestLocalDeadlineIsEnforced();
  TestRemoteCancellation();
  TestRemoteOperations();
  TestCustomOperation();
  std::cout << "correlation_engine_test: pass" << std::endl;
  return 0;
}
