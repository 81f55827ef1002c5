#include "signals.hpp"

#include <algorithm>
#include <cmath>

namespace sensorweave::significance {

LaggedPair AlignAtLag(const std::vector<double>& a, const std::vector<double>& b, int64_t lag) {
  LaggedPair out;
  const auto na = static_cast<int64_t>(a.size());
  const auto nb = static_cast<int64_t>(b.size());

  const int64_t begin = std::max<int64_t>(0, -lag);
  const int64_t end   = std::min(na, nb - lag);
  for (int64_t n = begin; n < end; ++n) {
    out.a.push_back(a[n]);
    out.b.push_back(b[n + lag]);
  }
  return out;
}

double Pearson(const double* a, const double* b, std::size_t n) {
  if (n < 2) return 0.0;

  double ma = 0.0, mb = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    ma += a[i];
    mb += b[i];
  }
  ma /= static_cast<double>(n);
  mb /= static_cast<double>(n);

  double sab = 0.0, saa = 0.0, sbb = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double da = a[i] - ma;
    const double db = b[i] - mb;
    sab += da * db;
    saa += da * da;
    sbb += db * db;
  }
  const double denom = std::sqrt(saa * sbb);
  return denom > 0.0 ? sab / denom : 0.0;
}

std::vector<uint32_t> Quantize(const std::vector<double>& x, uint32_t levels) {
  std::vector<uint32_t> out(x.size(), 0);
  if (x.empty() || levels < 2) return out;

  const auto [lo_it, hi_it] = std::minmax_element(x.begin(), x.end());
  const double lo           = *lo_it;
  const double span         = *hi_it - lo;
  if (span <= 0.0) return out;

  for (std::size_t i = 0; i < x.size(); ++i) {
    const auto bin = static_cast<uint32_t>((x[i] - lo) / span * levels);
    out[i]         = std::min(bin, levels - 1);
  }
  return out;
}

} // namespace sensorweave::significance
