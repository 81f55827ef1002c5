#pragma once

#include <cstdint>
#include <vector>

namespace sensorweave::significance {

// a[n] paired with b[n + lag] over the overlapping range
struct LaggedPair {
  std::vector<double> a;
  std::vector<double> b;
};

LaggedPair AlignAtLag(const std::vector<double>& a, const std::vector<double>& b, int64_t lag);

double Pearson(const double* a, const double* b, std::size_t n);

// equal-width bin index per sample over the signal's own range
std::vector<uint32_t> Quantize(const std::vector<double>& x, uint32_t levels);

} // namespace sensorweave::significance
