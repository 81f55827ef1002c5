#pragma once

#include <string>
#include <vector>

#include "sensorweave/v1/types.pb.h"

namespace sensorweave::significance {

struct PatternMatch {
  std::string id;
  std::string mechanism;
  double      confidence  = 0.0;
  bool        established = false;
};

// Read side of the pattern library as the evaluator sees it.
class PatternMatcher {
 public:
  virtual ~PatternMatcher() = default;

  virtual std::vector<PatternMatch> Match(sensorweave::v1::SensingDomain a, sensorweave::v1::SensingDomain b, sensorweave::v1::MixingOperation op,
                                          double lag_s) const = 0;
};

} // namespace sensorweave::significance
