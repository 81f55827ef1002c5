#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/correlation/types.hpp"
#include "mechanism_table.hpp"
#include "pattern_matcher.hpp"

namespace sensorweave::runtime::config {
class SignificanceConfig;
}

namespace sensorweave::significance {

struct SignificanceOptions {
  uint32_t    min_samples                   = 64;
  uint32_t    min_passes                    = 2;
  double      causation_min_strength        = 0.3;
  double      information_gain_ratio        = 0.10;
  double      predictive_alpha              = 0.05;
  uint32_t    predictive_max_lag            = 8;
  uint32_t    stability_windows             = 8;
  double      stability_max_cv              = 0.3;
  double      compression_ratio             = 0.9;
  std::string compression_codec             = "zstd";
  double      pass_weight                   = 0.75;
  double      causation_bonus               = 0.10;
  double      pattern_bonus                 = 0.15;
  uint32_t    pattern_reference_min_matches = 2;
  double      shortcircuit_min_strength     = 0.5;

  static SignificanceOptions FromConfig(const sensorweave::runtime::config::SignificanceConfig& config);
};

struct TestOutcome {
  bool   passed = false;
  double score  = 0.0;
};

struct SignificanceScore {
  TestOutcome causation;
  TestOutcome information_gain;
  TestOutcome predictive_power;
  TestOutcome temporal_stability;
  TestOutcome compressibility;

  uint32_t pass_count = 0;
  bool     meaningful = false;
  double   confidence = 0.0;

  std::string                mechanism;
  std::optional<std::string> pattern_id;
  // decided by an established pattern without running the battery
  bool short_circuited = false;
};

/*
  Decides whether a correlation reflects a real relationship.

  Five tests run on the pair at the peak lag; the result is meaningful
  when at least min_passes of them pass. A matching established pattern
  settles the verdict without the battery.
*/
class SignificanceEvaluator {
 public:
  explicit SignificanceEvaluator(SignificanceOptions options = {}, std::shared_ptr<const PatternMatcher> patterns = nullptr,
                                 MechanismTable mechanisms = MechanismTable::Default());

  // throws util::SignificanceError(kInsufficientSamples)
  SignificanceScore Evaluate(const correlation::CorrelationResult& result, const correlation::SourceSignal& a,
                             const correlation::SourceSignal& b) const;

 private:
  SignificanceOptions                   options_;
  std::shared_ptr<const PatternMatcher> patterns_;
  MechanismTable                        mechanisms_;
};

} // namespace sensorweave::significance
