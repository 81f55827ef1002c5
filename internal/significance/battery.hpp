#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "signals.hpp"

namespace sensorweave::significance {

/*
  The statistical tests of the significance battery.

  Every test takes the two signals already paired at the correlation's
  peak lag. Each returns its raw statistic; thresholds live in the
  evaluator.
*/

struct InformationGain {
  double entropy_a = 0.0;
  double entropy_b = 0.0;
  double joint     = 0.0;

  double mutual() const {
    return entropy_a + entropy_b - joint;
  }
};

// histogram entropies in nats with the Miller-Madow correction
InformationGain MeasureInformationGain(const LaggedPair& pair);

struct PredictivePower {
  // smallest p-value over all lag orders and both directions
  double   min_p_value = 1.0;
  uint32_t best_order  = 0;
  bool     a_leads     = true;
  uint32_t tests       = 0;
};

// Granger-style F tests for lag orders 1..max_order in both directions
PredictivePower MeasurePredictivePower(const LaggedPair& pair, uint32_t max_order);

// upper tail of the F(d1, d2) distribution
double FSurvival(double f, double d1, double d2);

struct Stability {
  std::vector<double> window_r;
  double              mean = 0.0;
  double              cv   = 0.0;
};

Stability MeasureStability(const LaggedPair& pair, uint32_t windows);

struct Compressibility {
  int64_t size_joint    = 0;
  // mean size of the joint stream with b shuffled against a
  int64_t size_separate = 0;

  double ratio() const {
    return size_separate > 0 ? static_cast<double>(size_joint) / static_cast<double>(size_separate) : 1.0;
  }
};

// Quantises both signals to 16 levels and compresses the paired stream with
// an Arrow codec, against surrogates that carry no shared structure.
Compressibility MeasureCompressibility(const LaggedPair& pair, const std::string& codec);

} // namespace sensorweave::significance
