#include "remote_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <numeric>

#include "internal/util/errors.hpp"
#include "signal_ops.hpp"

namespace sensorweave::correlation {

using namespace sensorweave::v1;

void CustomOperationRegistry::Register(const std::string& name, CustomOperation op) {
  if (name.empty() || !op) throw util::InvalidArgument("custom operation needs a name and a function");
  std::unique_lock lock(mutex_);
  ops_[name] = std::move(op);
}

bool CustomOperationRegistry::Contains(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return ops_.contains(name);
}

CustomOperation CustomOperationRegistry::Get(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto             it = ops_.find(name);
  if (it == ops_.end()) throw util::InvalidArgument("unknown custom operation '" + name + "'");
  return it->second;
}

RemoteStrategy::RemoteStrategy(RemoteOptions options, std::shared_ptr<CustomOperationRegistry> custom)
    : options_(options), custom_(custom ? std::move(custom) : std::make_shared<CustomOperationRegistry>()) {
}

bool RemoteStrategy::Supports(MixingOperation op) const {
  return op != MIXING_OPERATION_UNSPECIFIED;
}

CorrelationResult RemoteStrategy::Compute(const CorrelationRequest& request, const ComputeContext& context) const {
  const util::ErrorContext ctx{.request_id = request.request_id};
  auto                     checkpoint = [&](const char* stage) {
    if (context.cancel && context.cancel->IsCancelled()) {
      throw util::CorrelationError(util::CorrelationErrorCode::kCancelled, std::string("remote correlation cancelled at ") + stage, ctx);
    }
  };

  if (!Supports(request.operation)) throw util::InvalidArgument("correlation operation is unspecified");

  CustomOperation custom;
  if (request.operation == MIXING_OPERATION_CUSTOM) custom = custom_->Get(request.custom_name);

  checkpoint("start");
  return ComputePairs(request, ExecutionMode::kRemote, [&](std::size_t first, std::size_t second, std::size_t max_lag) {
    const auto& a = request.sources[first].samples;
    const auto& b = request.sources[second].samples;
    auto         ca    = RemoveMean(a);
    auto         cb    = RemoveMean(b);
    const double norms = Norm(ca) * Norm(cb);
    checkpoint("prepare");

    // the dominant lag always comes from the time-domain correlation
    auto lagged = CrossCorrelate(ca, cb, max_lag);
    auto peak   = FindLaggedPeak(lagged, max_lag, norms);
    checkpoint("correlate");

    PairOutput out;
    out.peak    = peak;
    out.max_lag = static_cast<int64_t>(max_lag);

    switch (request.operation) {
      case MIXING_OPERATION_CROSS_CORRELATION:
        out.output = std::move(lagged);
        break;

      case MIXING_OPERATION_MULTIPLICATION: {
        out.output        = Multiply(ca, cb);
        out.max_lag       = 0;
        const double sum  = std::accumulate(out.output.begin(), out.output.end(), 0.0);
        out.peak.strength = norms > 0.0 ? std::min(1.0, std::abs(sum) / norms) : 0.0;
        out.peak.lag_samples = 0;
        break;
      }

      case MIXING_OPERATION_CONVOLUTION:
        out.output = Convolve(ca, cb);
        out.max_lag = 0;
        break;

      case MIXING_OPERATION_COHERENCE: {
        out.output        = WelchCoherence(ca, cb, std::min(options_.coherence_segment, NextPowerOfTwo(ca.size() / 4 + 1)));
        out.max_lag       = 0;
        out.peak.strength = out.output.empty() ? 0.0 : *std::max_element(out.output.begin(), out.output.end());
        break;
      }

      case MIXING_OPERATION_HILBERT_ENVELOPE: {
        auto ea = RemoveMean(HilbertEnvelope(ca));
        checkpoint("envelope");
        auto eb    = RemoveMean(HilbertEnvelope(cb));
        out.output = CrossCorrelate(ea, eb, max_lag);
        out.peak   = FindLaggedPeak(out.output, max_lag, Norm(ea) * Norm(eb));
        break;
      }

      case MIXING_OPERATION_SPECTRAL: {
        out.output     = CrossSpectrum(ca, cb);
        out.max_lag    = 0;
        const auto fa  = CrossSpectrum(ca, ca);
        const auto fb  = CrossSpectrum(cb, cb);
        double     num = std::accumulate(out.output.begin(), out.output.end(), 0.0);
        double     den = std::sqrt(std::accumulate(fa.begin(), fa.end(), 0.0) * std::accumulate(fb.begin(), fb.end(), 0.0));
        out.peak.strength = den > 0.0 ? std::clamp(num / den, 0.0, 1.0) : 0.0;
        break;
      }

      case MIXING_OPERATION_CUSTOM: {
        out.output = custom(ca, cb);
        const auto centre = out.output.empty() ? 0 : (out.output.size() - 1) / 2;
        out.max_lag       = static_cast<int64_t>(centre);
        out.peak          = FindLaggedPeak(out.output, centre, norms);
        break;
      }

      default:
        throw util::InvalidArgument("unsupported correlation operation");
    }

    checkpoint("finish");
    return out;
  });
}

} // namespace sensorweave::correlation
