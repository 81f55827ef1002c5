#include "evaluator.hpp"

#include <algorithm>
#include <cmath>

#include "battery.hpp"
#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sensorweave::significance {

using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

// weights of the five tests in the pass fraction
constexpr double kCausationWeight   = 0.25;
constexpr double kInformationWeight = 0.20;
constexpr double kPredictiveWeight  = 0.20;
constexpr double kStabilityWeight   = 0.20;
constexpr double kCompressionWeight = 0.15;

} // namespace

SignificanceOptions SignificanceOptions::FromConfig(const sensorweave::runtime::config::SignificanceConfig& config) {
  SignificanceOptions o;
  if (config.min_samples() > 0) o.min_samples = config.min_samples();
  if (config.min_passes() > 0) o.min_passes = config.min_passes();
  if (config.causation_min_strength() > 0) o.causation_min_strength = config.causation_min_strength();
  if (config.information_gain_ratio() > 0) o.information_gain_ratio = config.information_gain_ratio();
  if (config.predictive_alpha() > 0) o.predictive_alpha = config.predictive_alpha();
  if (config.predictive_max_lag() > 0) o.predictive_max_lag = config.predictive_max_lag();
  if (config.stability_windows() > 0) o.stability_windows = config.stability_windows();
  if (config.stability_max_cv() > 0) o.stability_max_cv = config.stability_max_cv();
  if (config.compression_ratio() > 0) o.compression_ratio = config.compression_ratio();
  if (!config.compression_codec().empty()) o.compression_codec = config.compression_codec();
  if (config.pass_weight() > 0) o.pass_weight = config.pass_weight();
  if (config.causation_bonus() > 0) o.causation_bonus = config.causation_bonus();
  if (config.pattern_bonus() > 0) o.pattern_bonus = config.pattern_bonus();
  if (config.pattern_reference_min_matches() > 0) o.pattern_reference_min_matches = config.pattern_reference_min_matches();
  if (config.shortcircuit_min_strength() > 0) o.shortcircuit_min_strength = config.shortcircuit_min_strength();

  if (o.min_passes > 5) throw util::InvalidArgument("significance.min_passes must be at most 5");
  if (o.stability_windows < 2) throw util::InvalidArgument("significance.stability_windows must be at least 2");
  return o;
}

SignificanceEvaluator::SignificanceEvaluator(SignificanceOptions options, std::shared_ptr<const PatternMatcher> patterns,
                                             MechanismTable mechanisms)
    : options_(std::move(options)), patterns_(std::move(patterns)), mechanisms_(std::move(mechanisms)) {
}

SignificanceScore SignificanceEvaluator::Evaluate(const correlation::CorrelationResult& result, const correlation::SourceSignal& a,
                                                  const correlation::SourceSignal& b) const {
  const auto pair = AlignAtLag(a.samples, b.samples, result.peak.lag_samples);
  if (pair.a.size() < options_.min_samples) {
    throw util::SignificanceError(util::SignificanceErrorCode::kInsufficientSamples,
                                  "significance needs " + std::to_string(options_.min_samples) + " aligned samples, have " +
                                      std::to_string(pair.a.size()),
                                  {.request_id = result.request_id});
  }

  SignificanceScore score;
  const double      strength = result.peak.strength;
  const double      lag_s    = result.peak.lag_s;

  std::vector<PatternMatch> matches;
  if (patterns_) matches = patterns_->Match(a.domain, b.domain, result.operation, lag_s);
  std::sort(matches.begin(), matches.end(), [](const auto& x, const auto& y) { return x.confidence > y.confidence; });

  // an established pattern already settles the question
  for (const auto& m : matches) {
    if (m.established && strength >= options_.shortcircuit_min_strength) {
      score.meaningful      = true;
      score.short_circuited = true;
      score.confidence      = std::clamp(m.confidence, 0.0, 1.0);
      score.pattern_id      = m.id;
      score.mechanism       = m.mechanism;
      SENSORWEAVE_LOG_DEBUG("significance settled by established pattern",
                            {StringField("request_id", result.request_id), StringField("pattern_id", m.id)});
      return score;
    }
  }

  // 1. causation
  if (auto mechanism = mechanisms_.Find(a.domain, b.domain)) {
    score.mechanism        = mechanism->label;
    score.causation.score  = strength;
    score.causation.passed = std::abs(lag_s) <= mechanism->max_lag_s && strength >= options_.causation_min_strength;
  }

  // 2. information gain
  const auto info                = MeasureInformationGain(pair);
  const double max_entropy       = std::max(info.entropy_a, info.entropy_b);
  score.information_gain.score   = max_entropy > 0.0 ? info.mutual() / max_entropy : 0.0;
  score.information_gain.passed  = info.mutual() > options_.information_gain_ratio * max_entropy;

  // 3. predictive power, Bonferroni-corrected over every test run
  const auto predictive         = MeasurePredictivePower(pair, options_.predictive_max_lag);
  score.predictive_power.score  = predictive.min_p_value;
  score.predictive_power.passed = predictive.tests > 0 && predictive.min_p_value < options_.predictive_alpha / predictive.tests;

  // 4. temporal stability
  const auto stability            = MeasureStability(pair, options_.stability_windows);
  score.temporal_stability.score  = stability.cv;
  score.temporal_stability.passed = stability.cv < options_.stability_max_cv;

  // 5. compressibility
  const auto compression       = MeasureCompressibility(pair, options_.compression_codec);
  score.compressibility.score  = compression.ratio();
  score.compressibility.passed = compression.ratio() < options_.compression_ratio;

  double weighted = 0.0;
  for (const auto& [outcome, weight] : {std::pair{&score.causation, kCausationWeight}, std::pair{&score.information_gain, kInformationWeight},
                                        std::pair{&score.predictive_power, kPredictiveWeight},
                                        std::pair{&score.temporal_stability, kStabilityWeight},
                                        std::pair{&score.compressibility, kCompressionWeight}}) {
    if (outcome->passed) {
      ++score.pass_count;
      weighted += weight;
    }
  }
  score.meaningful = score.pass_count >= options_.min_passes;

  double confidence = options_.pass_weight * weighted;
  if (score.causation.passed) confidence += options_.causation_bonus;
  if (!matches.empty()) confidence += options_.pattern_bonus * matches.front().confidence;
  score.confidence = std::clamp(confidence, 0.0, 1.0);

  if (matches.size() >= options_.pattern_reference_min_matches) score.pattern_id = matches.front().id;

  SENSORWEAVE_LOG_DEBUG("significance evaluated",
                        {StringField("request_id", result.request_id), IntField("pass_count", score.pass_count),
                         BoolField("meaningful", score.meaningful), DoubleField("confidence", score.confidence)});
  return score;
}

} // namespace sensorweave::significance
