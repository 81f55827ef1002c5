#include "local_strategy.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"
#include "signal_ops.hpp"

namespace sensorweave::correlation {

using namespace sensorweave::v1;

namespace {

void CheckDeadline(const CorrelationRequest& request, const ComputeContext& context, const char* stage) {
  if (context.deadline && ComputeContext::Clock::now() > *context.deadline) {
    throw util::CorrelationError(util::CorrelationErrorCode::kDeadlineExceeded, std::string("local correlation exceeded its deadline at ") + stage,
                                 {.request_id = request.request_id});
  }
}

} // namespace

bool LocalStrategy::Supports(MixingOperation op) const {
  return op == MIXING_OPERATION_CROSS_CORRELATION || op == MIXING_OPERATION_MULTIPLICATION;
}

bool LocalStrategy::Available(const CorrelationRequest& request) const {
  if (!Supports(request.operation) || !SameSource(request.sources)) return false;
  for (const auto& s : request.sources) {
    if (s.samples.size() > options_.max_samples) return false;
  }
  return true;
}

CorrelationResult LocalStrategy::Compute(const CorrelationRequest& request, const ComputeContext& context) const {
  if (!Available(request)) {
    throw util::CorrelationError(util::CorrelationErrorCode::kModeUnavailable,
                                 std::string("local mode cannot run ") + ToString(request.operation) + " for these sources",
                                 {.request_id = request.request_id});
  }
  CheckDeadline(request, context, "start");

  return ComputePairs(request, ExecutionMode::kLocal, [&](std::size_t first, std::size_t second, std::size_t max_lag) {
    const auto& a = request.sources[first].samples;
    const auto& b = request.sources[second].samples;
    auto ca = RemoveMean(a);
    auto cb = RemoveMean(b);
    const double norms = Norm(ca) * Norm(cb);
    CheckDeadline(request, context, "prepare");

    PairOutput out;
    if (request.operation == MIXING_OPERATION_MULTIPLICATION) {
      out.output = Multiply(ca, cb);
      double sum = 0.0;
      for (double v : out.output) sum += v;
      out.peak.strength = norms > 0.0 ? std::min(1.0, std::abs(sum) / norms) : 0.0;
      CheckDeadline(request, context, "multiply");
      return out;
    }

    out.output  = CrossCorrelate(ca, cb, max_lag);
    out.max_lag = static_cast<int64_t>(max_lag);
    CheckDeadline(request, context, "transform");
    out.peak = FindLaggedPeak(out.output, max_lag, norms);
    return out;
  });
}

} // namespace sensorweave::correlation
