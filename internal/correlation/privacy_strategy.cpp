#include "privacy_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "internal/crypto/crypto.hpp"
#include "internal/util/errors.hpp"
#include "signal_ops.hpp"

namespace sensorweave::correlation {

using namespace sensorweave::v1;

namespace {

Share RandomShare(std::size_t n) {
  Share out(n);
  if (n > 0) crypto::RandomFill(out.data(), n * sizeof(uint64_t));
  return out;
}

Share Sub(const Share& x, const Share& y) {
  Share out(x.size());
  for (std::size_t i = 0; i < x.size(); ++i) out[i] = x[i] - y[i];
  return out;
}

// splits x into two additive shares
std::pair<Share, Share> Split(const Share& x) {
  auto r = RandomShare(x.size());
  return {r, Sub(x, r)};
}

Share Encode(const std::vector<double>& x, uint32_t fraction_bits) {
  auto         centred = RemoveMean(x);
  const double norm    = Norm(centred);
  const double scale   = std::ldexp(1.0, static_cast<int>(fraction_bits));

  Share out(x.size());
  for (std::size_t i = 0; i < x.size(); ++i) {
    const double v = norm > 0.0 ? centred[i] / norm : 0.0;
    out[i]         = static_cast<uint64_t>(static_cast<int64_t>(std::llround(v * scale)));
  }
  return out;
}

// For lagged outputs index j is lag j - max_lag; for products max_lag is 0 and
// every sum has one term.
struct Shape {
  bool        lagged  = true;
  std::size_t n       = 0;
  std::size_t max_lag = 0;

  std::size_t size() const {
    return lagged ? 2 * max_lag + 1 : n;
  }

  // calls f(n1, n2) for every pair of indexes contributing x[n1]*y[n2] to output j
  template <typename F>
  void ForEachTerm(std::size_t j, F&& f) const {
    if (!lagged) {
      f(j, j);
      return;
    }
    const auto k = static_cast<int64_t>(j) - static_cast<int64_t>(max_lag);
    for (std::size_t i = 0; i < n; ++i) {
      const auto t = static_cast<int64_t>(i) + k;
      if (t < 0 || t >= static_cast<int64_t>(n)) continue;
      f(i, static_cast<std::size_t>(t));
    }
  }

  Share Combine(const Share& x, const Share& y) const {
    Share out(size(), 0);
    for (std::size_t j = 0; j < out.size(); ++j) {
      uint64_t acc = 0;
      ForEachTerm(j, [&](std::size_t p, std::size_t q) { acc += x[p] * y[q]; });
      out[j] = acc;
    }
    return out;
  }
};

struct PartyMaterial {
  Share u_share, v_share, w_share;
};

} // namespace

void ShareCoordinator::AddShare(const std::string& party, Share share) {
  shares_[party] = std::move(share);
}

std::vector<int64_t> ShareCoordinator::Reconstruct() const {
  if (shares_.size() < 2) {
    throw util::CorrelationError(util::CorrelationErrorCode::kInsufficientData,
                                 "reconstruction needs shares from two parties, have " + std::to_string(shares_.size()));
  }

  const std::size_t n = shares_.begin()->second.size();
  Share             sum(n, 0);
  for (const auto& [party, share] : shares_) {
    if (share.size() != n) throw util::InvalidArgument("share from " + party + " has a mismatched length");
    for (std::size_t i = 0; i < n; ++i) sum[i] += share[i];
  }

  std::vector<int64_t> out(n);
  for (std::size_t i = 0; i < n; ++i) out[i] = static_cast<int64_t>(sum[i]);
  return out;
}

std::string PartyOf(const SourceSignal& source) {
  return source.trust_domain.empty() ? source.bridge_id : source.trust_domain;
}

bool PrivacyPreservingStrategy::Supports(MixingOperation op) const {
  return op == MIXING_OPERATION_CROSS_CORRELATION || op == MIXING_OPERATION_MULTIPLICATION;
}

bool PrivacyPreservingStrategy::Available(const CorrelationRequest& request) const {
  if (!Supports(request.operation)) return false;
  std::set<std::string> parties;
  for (const auto& s : request.sources) {
    if (s.samples.size() > options_.max_samples) return false;
    parties.insert(PartyOf(s));
  }
  return parties.size() == request.sources.size() && !parties.contains("");
}

CorrelationResult PrivacyPreservingStrategy::Compute(const CorrelationRequest& request, const ComputeContext& context) const {
  if (!Available(request)) {
    throw util::CorrelationError(util::CorrelationErrorCode::kModeUnavailable,
                                 std::string("privacy-preserving mode cannot run ") + ToString(request.operation) + " for these sources",
                                 {.request_id = request.request_id});
  }

  return ComputePairs(request, ExecutionMode::kPrivacyPreserving, [&](std::size_t first, std::size_t second, std::size_t max_lag) {
    return SharedPair(request, first, second, max_lag, context);
  });
}

PairOutput PrivacyPreservingStrategy::SharedPair(const CorrelationRequest& request, std::size_t first, std::size_t second, std::size_t max_lag,
                                                 const ComputeContext& context) const {
  auto checkpoint = [&](const char* round) {
    if (context.cancel && context.cancel->IsCancelled()) {
      throw util::CorrelationError(util::CorrelationErrorCode::kCancelled, std::string("privacy-preserving correlation cancelled at ") + round,
                                   {.request_id = request.request_id});
    }
  };

  const auto&       a      = request.sources[first].samples;
  const auto&       b      = request.sources[second].samples;
  const std::size_t n      = std::min(a.size(), b.size());
  const bool        lagged = request.operation == MIXING_OPERATION_CROSS_CORRELATION;
  const Shape       shape{lagged, n, lagged ? max_lag : 0};

  // each party encodes its own segment
  const auto xa = Encode(std::vector<double>(a.begin(), a.begin() + n), options_.fraction_bits);
  const auto xb = Encode(std::vector<double>(b.begin(), b.begin() + n), options_.fraction_bits);

  // dealer round: masks and shares of their mixed product
  const auto u  = RandomShare(n);
  const auto v  = RandomShare(n);
  auto [u0, u1] = Split(u);
  auto [v0, v1] = Split(v);
  auto [w0, w1] = Split(shape.Combine(u, v));
  const PartyMaterial material[2] = {{u0, v0, w0}, {u1, v1, w1}};
  checkpoint("deal");

  // opening round, exchanged between the parties only
  const auto d = Sub(xa, u);
  const auto e = Sub(xb, v);
  checkpoint("open");

  ShareCoordinator  coordinator;
  const std::string parties[2] = {PartyOf(request.sources[first]), PartyOf(request.sources[second])};
  for (int p = 0; p < 2; ++p) {
    auto       z  = material[p].w_share;
    const auto dv = shape.Combine(d, material[p].v_share);
    const auto ue = shape.Combine(material[p].u_share, e);
    for (std::size_t k = 0; k < z.size(); ++k) z[k] += dv[k] + ue[k];
    if (p == 0) {
      const auto de = shape.Combine(d, e);
      for (std::size_t k = 0; k < z.size(); ++k) z[k] += de[k];
    }
    checkpoint("share");

    if (context.coordinator_observer) context.coordinator_observer(parties[p], z);
    coordinator.AddShare(parties[p], std::move(z));
  }

  const auto   raw  = coordinator.Reconstruct();
  const double unit = std::ldexp(1.0, static_cast<int>(2 * options_.fraction_bits));

  PairOutput out;
  out.max_lag = static_cast<int64_t>(shape.max_lag);
  out.output.resize(raw.size());
  for (std::size_t k = 0; k < raw.size(); ++k) out.output[k] = static_cast<double>(raw[k]) / unit;

  // inputs were unit-normalised, so the output is already a correlation coefficient
  if (lagged) {
    out.peak = FindLaggedPeak(out.output, shape.max_lag, 1.0);
  } else {
    double sum = 0.0;
    for (double value : out.output) sum += value;
    out.peak.strength = std::clamp(std::abs(sum), 0.0, 1.0);
  }
  return out;
}

} // namespace sensorweave::correlation
