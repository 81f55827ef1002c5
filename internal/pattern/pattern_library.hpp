#pragma once

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/significance/pattern_matcher.hpp"
#include "internal/util/time.hpp"
#include "sensorweave/v1/pattern.pb.h"

namespace sensorweave::runtime::config {
class PatternConfig;
}

namespace sensorweave::pattern {

struct PatternOptions {
  uint32_t establish_threshold = 10;
  double   retire_fraction     = 0.5;
  double   lag_tolerance_s     = 0.01;
  bool     seed_known_patterns = false;

  std::function<util::TimePoint()> clock;

  static PatternOptions FromConfig(const sensorweave::runtime::config::PatternConfig& config);
};

struct PublishOutcome {
  sensorweave::v1::Pattern pattern;
  bool                     created = false;
};

/*
  Replicated library of validated cross-domain patterns.

  Each pattern carries two grow-only sets: confirmations keyed by agent
  and false-positive reporters. Everything else visible on a pattern
  (counts, confidence, status, typical lag) is derived from those sets,
  so Merge is a set union and replicas converge regardless of the order
  updates arrive in. Patterns are never deleted; a pattern whose
  reporters outweigh its confirmations is retired.

  Domain pairs are stored in ascending enum order; lags are flipped to
  match when a caller names the pair the other way round.
*/
class PatternLibrary : public significance::PatternMatcher {
 public:
  PatternLibrary(std::shared_ptr<db::Repository> repository, PatternOptions options = {});

  void Hydrate();

  // throws util::InvalidArgument on an incomplete draft
  PublishOutcome Publish(const sensorweave::v1::Pattern& draft, const sensorweave::v1::PatternEvidence& evidence);

  // throws util::NotFound
  sensorweave::v1::Pattern ReportFalsePositive(const std::string& pattern_id, const std::string& reporter_id);
  sensorweave::v1::Pattern Get(const std::string& pattern_id) const;

  std::vector<sensorweave::v1::Pattern> List(bool include_retired = true) const;
  std::vector<sensorweave::v1::Pattern> Export() const;

  // replication join; returns the merged state
  sensorweave::v1::Pattern Merge(const sensorweave::v1::Pattern& remote);

  std::vector<sensorweave::v1::Pattern> MatchPatterns(sensorweave::v1::SensingDomain a, sensorweave::v1::SensingDomain b,
                                                      sensorweave::v1::MixingOperation op, double lag_s) const;

  std::vector<significance::PatternMatch> Match(sensorweave::v1::SensingDomain a, sensorweave::v1::SensingDomain b,
                                                sensorweave::v1::MixingOperation op, double lag_s) const override;

  std::size_t Size() const;

  static std::string ContentId(sensorweave::v1::SensingDomain a, sensorweave::v1::SensingDomain b, sensorweave::v1::MixingOperation op,
                               const std::string& mechanism);

 private:
  // rebuilds every derived field from the two sets
  void Recompute(sensorweave::v1::Pattern& pattern) const;
  bool LagMatches(const sensorweave::v1::Pattern& pattern, double lag_s) const;
  void PersistLocked(const sensorweave::v1::Pattern& pattern);

  std::shared_ptr<db::Repository> repository_;
  PatternOptions                  options_;

  mutable std::shared_mutex                       mutex_;
  std::map<std::string, sensorweave::v1::Pattern> patterns_;
};

} // namespace sensorweave::pattern
