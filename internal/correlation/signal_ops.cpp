#include "signal_ops.hpp"

#include <unsupported/Eigen/FFT>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>

#include "internal/util/errors.hpp"

namespace sensorweave::correlation {

using sensorweave::v1::MixingOperation;

const char* ToString(ExecutionMode mode) {
  switch (mode) {
    case ExecutionMode::kAdaptive:
      return "adaptive";
    case ExecutionMode::kLocal:
      return "local";
    case ExecutionMode::kRemote:
      return "remote";
    case ExecutionMode::kPrivacyPreserving:
      return "privacy_preserving";
  }
  return "unknown";
}

const char* ToString(MixingOperation op) {
  switch (op) {
    case sensorweave::v1::MIXING_OPERATION_MULTIPLICATION:
      return "multiplication";
    case sensorweave::v1::MIXING_OPERATION_CONVOLUTION:
      return "convolution";
    case sensorweave::v1::MIXING_OPERATION_CROSS_CORRELATION:
      return "cross_correlation";
    case sensorweave::v1::MIXING_OPERATION_COHERENCE:
      return "coherence";
    case sensorweave::v1::MIXING_OPERATION_HILBERT_ENVELOPE:
      return "hilbert_envelope";
    case sensorweave::v1::MIXING_OPERATION_SPECTRAL:
      return "spectral";
    case sensorweave::v1::MIXING_OPERATION_CUSTOM:
      return "custom";
    default:
      return "unspecified";
  }
}

std::vector<double> RemoveMean(const std::vector<double>& x) {
  if (x.empty()) return {};
  const double mean = std::accumulate(x.begin(), x.end(), 0.0) / static_cast<double>(x.size());

  std::vector<double> out(x.size());
  std::transform(x.begin(), x.end(), out.begin(), [mean](double v) { return v - mean; });
  return out;
}

double Norm(const std::vector<double>& x) {
  return std::sqrt(std::inner_product(x.begin(), x.end(), x.begin(), 0.0));
}

std::size_t NextPowerOfTwo(std::size_t n) {
  std::size_t p = 1;
  while (p < n) p <<= 1;
  return p;
}

std::vector<std::complex<double>> Forward(const std::vector<double>& x, std::size_t size) {
  std::vector<double> padded(size, 0.0);
  std::copy_n(x.begin(), std::min(x.size(), size), padded.begin());

  Eigen::FFT<double>                fft;
  std::vector<std::complex<double>> spectrum;
  fft.fwd(spectrum, padded);
  return spectrum;
}

std::vector<double> Inverse(const std::vector<std::complex<double>>& spectrum) {
  Eigen::FFT<double>  fft;
  std::vector<double> out;
  fft.inv(out, spectrum);
  return out;
}

std::vector<double> CrossCorrelate(const std::vector<double>& a, const std::vector<double>& b, std::size_t max_lag) {
  const std::size_t n = std::min(a.size(), b.size());
  max_lag             = std::min(max_lag, n > 0 ? n - 1 : 0);
  const std::size_t m = NextPowerOfTwo(2 * n - 1);

  auto fa = Forward(a, m);
  auto fb = Forward(b, m);
  for (std::size_t i = 0; i < m; ++i) fa[i] = std::conj(fa[i]) * fb[i];
  const auto circular = Inverse(fa);

  // negative lags wrap to the tail of the circular result
  std::vector<double> lagged(2 * max_lag + 1);
  for (std::size_t i = 0; i < lagged.size(); ++i) {
    const auto k = static_cast<int64_t>(i) - static_cast<int64_t>(max_lag);
    lagged[i]    = circular[k >= 0 ? static_cast<std::size_t>(k) : m - static_cast<std::size_t>(-k)];
  }
  return lagged;
}

std::vector<double> Multiply(const std::vector<double>& a, const std::vector<double>& b) {
  const std::size_t   n = std::min(a.size(), b.size());
  std::vector<double> out(n);
  for (std::size_t i = 0; i < n; ++i) out[i] = a[i] * b[i];
  return out;
}

std::vector<double> Convolve(const std::vector<double>& a, const std::vector<double>& b) {
  if (a.empty() || b.empty()) return {};
  const std::size_t full = a.size() + b.size() - 1;
  const std::size_t m    = NextPowerOfTwo(full);

  auto fa = Forward(a, m);
  auto fb = Forward(b, m);
  for (std::size_t i = 0; i < m; ++i) fa[i] *= fb[i];
  auto out = Inverse(fa);
  out.resize(full);
  return out;
}

std::vector<double> WelchCoherence(const std::vector<double>& a, const std::vector<double>& b, std::size_t segment) {
  const std::size_t n = std::min(a.size(), b.size());
  segment             = std::max<std::size_t>(8, std::min(segment, n));
  const std::size_t step = segment / 2;
  const std::size_t bins = segment / 2 + 1;

  std::vector<double> window(segment);
  for (std::size_t i = 0; i < segment; ++i) {
    window[i] = 0.5 - 0.5 * std::cos(2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(segment - 1));
  }

  std::vector<double>               paa(bins, 0.0), pbb(bins, 0.0);
  std::vector<std::complex<double>> pab(bins, {0.0, 0.0});
  std::vector<double>               sa(segment), sb(segment);

  for (std::size_t start = 0; start + segment <= n; start += step) {
    for (std::size_t i = 0; i < segment; ++i) {
      sa[i] = a[start + i] * window[i];
      sb[i] = b[start + i] * window[i];
    }
    const auto fa = Forward(sa, segment);
    const auto fb = Forward(sb, segment);
    for (std::size_t k = 0; k < bins; ++k) {
      paa[k] += std::norm(fa[k]);
      pbb[k] += std::norm(fb[k]);
      pab[k] += std::conj(fa[k]) * fb[k];
    }
  }

  std::vector<double> coherence(bins, 0.0);
  for (std::size_t k = 0; k < bins; ++k) {
    const double denom = paa[k] * pbb[k];
    coherence[k]       = denom > 0.0 ? std::clamp(std::norm(pab[k]) / denom, 0.0, 1.0) : 0.0;
  }
  return coherence;
}

std::vector<double> HilbertEnvelope(const std::vector<double>& x) {
  const std::size_t n = x.size();
  if (n == 0) return {};

  Eigen::FFT<double>                fft;
  std::vector<double>               input(x);
  std::vector<std::complex<double>> spectrum;
  fft.fwd(spectrum, input);

  // analytic signal: keep DC and Nyquist, double positive, zero negative frequencies
  for (std::size_t k = 1; k < n; ++k) {
    if (2 * k < n) {
      spectrum[k] *= 2.0;
    } else if (2 * k > n) {
      spectrum[k] = 0.0;
    }
  }

  std::vector<std::complex<double>> analytic;
  fft.inv(analytic, spectrum);

  std::vector<double> envelope(n);
  for (std::size_t i = 0; i < n; ++i) envelope[i] = std::abs(analytic[i]);
  return envelope;
}

std::vector<double> CrossSpectrum(const std::vector<double>& a, const std::vector<double>& b) {
  const std::size_t n = std::min(a.size(), b.size());
  const auto        fa = Forward(a, n);
  const auto        fb = Forward(b, n);

  std::vector<double> out(n / 2 + 1);
  for (std::size_t k = 0; k < out.size(); ++k) out[k] = std::abs(std::conj(fa[k]) * fb[k]);
  return out;
}

PairPeak FindLaggedPeak(const std::vector<double>& lagged, std::size_t max_lag, double norm_product) {
  PairPeak peak;
  if (lagged.empty()) return peak;

  std::size_t best = 0;
  for (std::size_t i = 1; i < lagged.size(); ++i) {
    // ties resolve toward the smaller |lag|
    const double cur = std::abs(lagged[i]);
    const double top = std::abs(lagged[best]);
    const auto   dist = [&](std::size_t j) { return std::abs(static_cast<int64_t>(j) - static_cast<int64_t>(max_lag)); };
    if (cur > top || (cur == top && dist(i) < dist(best))) best = i;
  }

  peak.lag_samples = static_cast<int64_t>(best) - static_cast<int64_t>(max_lag);
  peak.strength    = norm_product > 0.0 ? std::clamp(std::abs(lagged[best]) / norm_product, 0.0, 1.0) : 0.0;
  return peak;
}

std::size_t DefaultMaxLag(const CorrelationRequest& request, std::size_t n) {
  const std::size_t lag = request.max_lag ? *request.max_lag : n / 4;
  return std::min(lag, n > 0 ? n - 1 : 0);
}

bool SameSource(const std::vector<SourceSignal>& sources) {
  if (sources.empty()) return false;

  const auto& first   = sources.front();
  bool        site    = !first.site_id.empty();
  bool        bridge  = !first.bridge_id.empty();
  for (const auto& s : sources) {
    site   = site && s.site_id == first.site_id;
    bridge = bridge && s.bridge_id == first.bridge_id;
  }
  return site || bridge;
}

CorrelationResult ComputePairs(const CorrelationRequest& request, ExecutionMode mode, const PairFn& fn) {
  const util::ErrorContext ctx{.request_id = request.request_id};
  if (request.sources.size() < 2) {
    throw util::CorrelationError(util::CorrelationErrorCode::kInsufficientData, "correlation needs at least two sources", ctx);
  }
  for (const auto& s : request.sources) {
    if (s.samples.size() < 2) {
      throw util::CorrelationError(util::CorrelationErrorCode::kInsufficientData, "source " + s.stream_id + " has fewer than two samples", ctx);
    }
  }

  CorrelationResult result;
  result.request_id = request.request_id;
  result.operation  = request.operation;
  result.mode_used  = mode;

  const double rate = request.sources.front().sample_rate;
  bool         have = false;
  for (std::size_t i = 0; i < request.sources.size(); ++i) {
    for (std::size_t j = i + 1; j < request.sources.size(); ++j) {
      const auto&       a = request.sources[i].samples;
      const auto&       b = request.sources[j].samples;
      const std::size_t n = std::min(a.size(), b.size());

      auto pair         = fn(i, j, DefaultMaxLag(request, n));
      pair.peak.first   = i;
      pair.peak.second  = j;
      pair.peak.lag_s   = rate > 0.0 ? static_cast<double>(pair.peak.lag_samples) / rate : 0.0;
      result.pairs.push_back(pair.peak);

      if (!have || pair.peak.strength > result.peak.strength) {
        result.peak    = pair.peak;
        result.output  = std::move(pair.output);
        result.max_lag = pair.max_lag;
        have           = true;
      }
    }
  }
  return result;
}

} // namespace sensorweave::correlation
