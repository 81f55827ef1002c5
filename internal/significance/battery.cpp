#include "battery.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace sensorweave::significance {

namespace {

template <typename Key>
double MillerMadowEntropy(const std::map<Key, uint32_t>& counts, std::size_t n) {
  double h = 0.0;
  for (const auto& [_, c] : counts) {
    const double p = static_cast<double>(c) / static_cast<double>(n);
    h -= p * std::log(p);
  }
  return h + static_cast<double>(counts.size() - 1) / (2.0 * static_cast<double>(n));
}

double ResidualSumOfSquares(const Eigen::MatrixXd& x, const Eigen::VectorXd& y) {
  const Eigen::VectorXd beta = x.colPivHouseholderQr().solve(y);
  return (y - x * beta).squaredNorm();
}

// p-value that the past of `cause` improves prediction of `effect`
double GrangerPValue(const std::vector<double>& cause, const std::vector<double>& effect, uint32_t order) {
  const std::size_t n    = effect.size();
  const std::size_t rows = n - order;
  const std::size_t df2  = rows - (2 * order + 1);

  Eigen::MatrixXd restricted(rows, order + 1);
  Eigen::MatrixXd full(rows, 2 * order + 1);
  Eigen::VectorXd y(rows);

  for (std::size_t r = 0; r < rows; ++r) {
    const std::size_t t = r + order;
    y(r)                = effect[t];
    restricted(r, 0)    = 1.0;
    full(r, 0)          = 1.0;
    for (uint32_t i = 1; i <= order; ++i) {
      restricted(r, i)     = effect[t - i];
      full(r, i)           = effect[t - i];
      full(r, order + i)   = cause[t - i];
    }
  }

  const double rss_r = ResidualSumOfSquares(restricted, y);
  const double rss_u = ResidualSumOfSquares(full, y);
  if (rss_u <= std::numeric_limits<double>::min()) return rss_r > rss_u ? 0.0 : 1.0;

  const double f = std::max(0.0, (rss_r - rss_u) / order) / (rss_u / static_cast<double>(df2));
  return FSurvival(f, order, static_cast<double>(df2));
}

} // namespace

InformationGain MeasureInformationGain(const LaggedPair& pair) {
  InformationGain out;
  const std::size_t n = std::min(pair.a.size(), pair.b.size());
  if (n == 0) return out;

  const auto bins = static_cast<uint32_t>(std::clamp<long>(std::lround(std::cbrt(static_cast<double>(n))), 4, 16));
  const auto qa   = Quantize(pair.a, bins);
  const auto qb   = Quantize(pair.b, bins);

  std::map<uint32_t, uint32_t> ca, cb, cj;
  for (std::size_t i = 0; i < n; ++i) {
    ++ca[qa[i]];
    ++cb[qb[i]];
    ++cj[qa[i] * bins + qb[i]];
  }

  out.entropy_a = MillerMadowEntropy(ca, n);
  out.entropy_b = MillerMadowEntropy(cb, n);
  out.joint     = MillerMadowEntropy(cj, n);
  return out;
}

double FSurvival(double f, double d1, double d2) {
  if (f <= 0.0) return 1.0;

  // Paulson's normal approximation to the F distribution
  const double a = 2.0 / (9.0 * d1);
  const double b = 2.0 / (9.0 * d2);
  const double c = std::cbrt(f);
  const double z = ((1.0 - b) * c - (1.0 - a)) / std::sqrt(a + c * c * b);
  return 0.5 * std::erfc(z / std::sqrt(2.0));
}

PredictivePower MeasurePredictivePower(const LaggedPair& pair, uint32_t max_order) {
  PredictivePower out;
  const std::size_t n = std::min(pair.a.size(), pair.b.size());

  for (uint32_t order = 1; order <= max_order; ++order) {
    // need enough rows for a meaningful residual degree of freedom
    if (n < 4 * order + 8) break;
    for (bool a_leads : {true, false}) {
      const double p = a_leads ? GrangerPValue(pair.a, pair.b, order) : GrangerPValue(pair.b, pair.a, order);
      ++out.tests;
      if (p < out.min_p_value) {
        out.min_p_value = p;
        out.best_order  = order;
        out.a_leads     = a_leads;
      }
    }
  }
  return out;
}

Stability MeasureStability(const LaggedPair& pair, uint32_t windows) {
  Stability out;
  const std::size_t n = std::min(pair.a.size(), pair.b.size());
  if (windows == 0 || n / windows < 4) {
    out.cv = std::numeric_limits<double>::infinity();
    return out;
  }

  const std::size_t len = n / windows;
  for (uint32_t w = 0; w < windows; ++w) {
    out.window_r.push_back(Pearson(pair.a.data() + w * len, pair.b.data() + w * len, len));
  }

  double sum = 0.0;
  for (double r : out.window_r) sum += r;
  out.mean = sum / windows;

  double var = 0.0;
  for (double r : out.window_r) var += (r - out.mean) * (r - out.mean);
  const double stddev = std::sqrt(var / windows);

  out.cv = std::abs(out.mean) > 1e-12 ? stddev / std::abs(out.mean) : std::numeric_limits<double>::infinity();
  return out;
}

} // namespace sensorweave::significance
