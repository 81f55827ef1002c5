#pragma once

#include <complex>
#include <cstdint>
#include <functional>
#include <vector>

#include "types.hpp"

namespace sensorweave::correlation {

/*
  Real-valued signal primitives shared by every strategy.

  Lagged outputs follow one convention: r[k] = sum_n a[n] * b[n + k] for
  k in [-max_lag, max_lag], stored at index k + max_lag. A positive k at
  the peak means b trails a.
*/

std::vector<double> RemoveMean(const std::vector<double>& x);
double              Norm(const std::vector<double>& x);
std::size_t         NextPowerOfTwo(std::size_t n);

std::vector<std::complex<double>> Forward(const std::vector<double>& x, std::size_t size);
std::vector<double>               Inverse(const std::vector<std::complex<double>>& spectrum);

std::vector<double> CrossCorrelate(const std::vector<double>& a, const std::vector<double>& b, std::size_t max_lag);
std::vector<double> Multiply(const std::vector<double>& a, const std::vector<double>& b);
// full linear convolution, length 2N-1
std::vector<double> Convolve(const std::vector<double>& a, const std::vector<double>& b);
// magnitude-squared coherence per frequency bin, Hann windows with 50% overlap
std::vector<double> WelchCoherence(const std::vector<double>& a, const std::vector<double>& b, std::size_t segment);
std::vector<double> HilbertEnvelope(const std::vector<double>& x);
// |conj(A) B| per bin up to Nyquist
std::vector<double> CrossSpectrum(const std::vector<double>& a, const std::vector<double>& b);

// peak of a lagged output, normalised by the product of the input norms
PairPeak FindLaggedPeak(const std::vector<double>& lagged, std::size_t max_lag, double norm_product);

std::size_t DefaultMaxLag(const CorrelationRequest& request, std::size_t n);

// Result of one source pair.
struct PairOutput {
  std::vector<double> output;
  int64_t             max_lag = 0;
  PairPeak            peak;
};

// called with the indexes of the two sources
using PairFn = std::function<PairOutput(std::size_t first, std::size_t second, std::size_t max_lag)>;

// Checks the sources, runs fn on every pair and selects the strongest as primary.
// throws util::CorrelationError(kInsufficientData)
CorrelationResult ComputePairs(const CorrelationRequest& request, ExecutionMode mode, const PairFn& fn);

// true when every source is on one site or one bridge
bool SameSource(const std::vector<SourceSignal>& sources);

} // namespace sensorweave::correlation
