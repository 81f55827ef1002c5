#include "pattern_library.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <set>
#include <stdexcept>
#include <tuple>
#include <utility>

#include "config/config.pb.h"
#include "internal/crypto/crypto.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sensorweave::pattern {

using namespace sensorweave::v1;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

struct OrderedPair {
  SensingDomain lo;
  SensingDomain hi;
  double        lag_s;
};

// lag is measured from the first named domain to the second
OrderedPair Normalize(SensingDomain a, SensingDomain b, double lag_s) {
  if (a <= b) return {a, b, lag_s};
  return {b, a, -lag_s};
}

bool Earlier(const google::protobuf::Timestamp& x, const google::protobuf::Timestamp& y) {
  return std::pair(x.seconds(), x.nanos()) < std::pair(y.seconds(), y.nanos());
}

// deterministic winner between two confirmations from the same agent
const PatternConfirmation& Stronger(const PatternConfirmation& x, const PatternConfirmation& y) {
  if (x.confidence() != y.confidence()) return x.confidence() > y.confidence() ? x : y;
  if (Earlier(x.confirmed_at(), y.confirmed_at())) return x;
  if (Earlier(y.confirmed_at(), x.confirmed_at())) return y;
  return x.lag_s() <= y.lag_s() ? x : y;
}

// true when x was discovered first, ties broken on origin then name
bool DiscoveredFirst(const Pattern& x, const Pattern& y) {
  if (Earlier(x.discovered_at(), y.discovered_at())) return true;
  if (Earlier(y.discovered_at(), x.discovered_at())) return false;
  return std::tie(x.origin_agent(), x.name()) <= std::tie(y.origin_agent(), y.name());
}

Pattern Join(const Pattern& x, const Pattern& y) {
  Pattern out = DiscoveredFirst(x, y) ? x : y;

  std::map<std::string, PatternConfirmation> confirmations;
  for (const auto* p : {&x, &y}) {
    for (const auto& c : p->confirmations()) {
      auto it = confirmations.find(c.agent_id());
      if (it == confirmations.end()) {
        confirmations.emplace(c.agent_id(), c);
      } else {
        it->second = Stronger(it->second, c);
      }
    }
  }

  std::set<std::string> reporters(x.false_positive_reporters().begin(), x.false_positive_reporters().end());
  reporters.insert(y.false_positive_reporters().begin(), y.false_positive_reporters().end());

  out.clear_confirmations();
  for (auto& [_, c] : confirmations) *out.add_confirmations() = c;
  out.clear_false_positive_reporters();
  for (const auto& r : reporters) out.add_false_positive_reporters(r);
  return out;
}

void Validate(const Pattern& draft, const PatternEvidence& evidence) {
  if (draft.name().empty()) throw util::InvalidArgument("pattern name is required");
  if (draft.domain_a() == SENSING_DOMAIN_UNSPECIFIED || draft.domain_b() == SENSING_DOMAIN_UNSPECIFIED) {
    throw util::InvalidArgument("pattern needs two sensing domains");
  }
  if (draft.operation() == MIXING_OPERATION_UNSPECIFIED) throw util::InvalidArgument("pattern operation is required");
  if (draft.mechanism().empty()) throw util::InvalidArgument("pattern mechanism is required");
  if (evidence.agent_id().empty()) throw util::InvalidArgument("pattern evidence needs an agent");
  if (!std::isfinite(evidence.lag_s()) || !std::isfinite(evidence.confidence())) {
    throw util::InvalidArgument("pattern evidence must be finite");
  }
}

} // namespace

PatternOptions PatternOptions::FromConfig(const sensorweave::runtime::config::PatternConfig& config) {
  PatternOptions options;
  if (config.establish_threshold() > 0) options.establish_threshold = config.establish_threshold();
  if (config.retire_fraction() > 0) options.retire_fraction = config.retire_fraction();
  if (config.lag_tolerance_s() > 0) options.lag_tolerance_s = config.lag_tolerance_s();
  options.seed_known_patterns = config.seed_known_patterns();
  return options;
}

PatternLibrary::PatternLibrary(std::shared_ptr<db::Repository> repository, PatternOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
  if (!repository_) throw std::invalid_argument("pattern library requires a repository");
  if (!options_.clock) options_.clock = [] { return util::Now(); };
}

std::string PatternLibrary::ContentId(SensingDomain a, SensingDomain b, MixingOperation op, const std::string& mechanism) {
  const auto pair = Normalize(a, b, 0.0);
  return crypto::Sha256Hex(std::to_string(pair.lo) + "|" + std::to_string(pair.hi) + "|" + std::to_string(op) + "|" + mechanism);
}

void PatternLibrary::Recompute(Pattern& pattern) const {
  const auto rep = static_cast<uint32_t>(pattern.confirmations_size());
  const auto fp  = static_cast<uint32_t>(pattern.false_positive_reporters_size());
  pattern.set_replication_count(rep);
  pattern.set_false_positive_count(fp);

  if (rep == 0) {
    pattern.set_confidence(std::clamp(pattern.prior_confidence(), 0.0, 1.0));
  } else {
    double confidence = 0.0, lag = 0.0;
    for (const auto& c : pattern.confirmations()) {
      confidence += c.confidence();
      lag += c.lag_s();
    }
    pattern.set_typical_lag_s(lag / rep);
    pattern.set_confidence(std::clamp(confidence / rep * rep / static_cast<double>(rep + fp), 0.0, 1.0));
  }

  if (fp > 0 && fp > options_.retire_fraction * rep) {
    pattern.set_status(PATTERN_STATUS_RETIRED);
  } else if (rep >= options_.establish_threshold) {
    pattern.set_status(PATTERN_STATUS_ESTABLISHED);
  } else {
    pattern.set_status(PATTERN_STATUS_CANDIDATE);
  }
}

bool PatternLibrary::LagMatches(const Pattern& pattern, double lag_s) const {
  const double tolerance = std::max(options_.lag_tolerance_s, 0.1 * std::abs(pattern.typical_lag_s()));
  return std::abs(pattern.typical_lag_s() - lag_s) <= tolerance;
}

void PatternLibrary::PersistLocked(const Pattern& pattern) {
  db::model::PatternRecord record;
  record.id            = pattern.id();
  record.updated_at_ms = util::ToUnixMillis(options_.clock());
  if (!pattern.SerializeToString(&record.body)) throw std::runtime_error("pattern " + pattern.id() + " failed to serialize");

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertPattern(*tx, record), "persist pattern");
  tx->Commit();
}

void PatternLibrary::Hydrate() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListPatterns(*tx);
  tx->Commit();

  std::map<std::string, Pattern> loaded;
  for (const auto& record : records) {
    Pattern pattern;
    if (!pattern.ParseFromString(record.body)) throw std::runtime_error("pattern hydrate: corrupt record " + record.id);
    Recompute(pattern);
    loaded.emplace(record.id, std::move(pattern));
  }

  std::unique_lock lock(mutex_);
  patterns_ = std::move(loaded);
  SENSORWEAVE_LOG_INFO("pattern library hydrated", {IntField("patterns", static_cast<int64_t>(patterns_.size()))});
}

PublishOutcome PatternLibrary::Publish(const Pattern& draft, const PatternEvidence& evidence) {
  Validate(draft, evidence);

  const auto pair = Normalize(draft.domain_a(), draft.domain_b(), evidence.lag_s());
  const auto id   = ContentId(pair.lo, pair.hi, draft.operation(), draft.mechanism());
  const auto now  = options_.clock();

  std::unique_lock lock(mutex_);

  Pattern* existing = nullptr;
  if (auto it = patterns_.find(id); it != patterns_.end()) {
    existing = &it->second;
  } else {
    for (auto& [_, p] : patterns_) {
      if (p.domain_a() == pair.lo && p.domain_b() == pair.hi && p.operation() == draft.operation() && LagMatches(p, pair.lag_s)) {
        existing = &p;
        break;
      }
    }
  }

  PublishOutcome outcome;
  Pattern        updated;
  if (existing) {
    updated = *existing;
  } else {
    updated = draft;
    updated.set_id(id);
    updated.set_domain_a(pair.lo);
    updated.set_domain_b(pair.hi);
    updated.set_origin_agent(evidence.agent_id());
    *updated.mutable_discovered_at() = util::ToProto(now);
    updated.set_typical_lag_s(pair.lag_s);
    updated.clear_confirmations();
    updated.clear_false_positive_reporters();
    outcome.created = true;
  }

  PatternConfirmation confirmation;
  confirmation.set_agent_id(evidence.agent_id());
  confirmation.set_confidence(std::clamp(evidence.confidence(), 0.0, 1.0));
  confirmation.set_lag_s(pair.lag_s);
  confirmation.set_strength(evidence.strength());
  *confirmation.mutable_confirmed_at() = util::ToProto(now);

  Pattern single;
  *single.add_confirmations() = confirmation;
  updated                     = Join(updated, single);
  Recompute(updated);

  PersistLocked(updated);
  patterns_[updated.id()] = updated;
  outcome.pattern         = updated;

  SENSORWEAVE_LOG_INFO(outcome.created ? "pattern discovered" : "pattern confirmed",
                       {StringField("pattern_id", updated.id()), StringField("agent_id", evidence.agent_id()),
                        IntField("replication_count", updated.replication_count()), DoubleField("confidence", updated.confidence())});
  return outcome;
}

Pattern PatternLibrary::ReportFalsePositive(const std::string& pattern_id, const std::string& reporter_id) {
  if (reporter_id.empty()) throw util::InvalidArgument("false-positive report needs a reporter");

  std::unique_lock lock(mutex_);
  auto             it = patterns_.find(pattern_id);
  if (it == patterns_.end()) throw util::NotFound("pattern " + pattern_id + " not found");

  Pattern report;
  report.add_false_positive_reporters(reporter_id);
  auto updated = Join(it->second, report);
  Recompute(updated);

  PersistLocked(updated);
  it->second = updated;

  if (updated.status() == PATTERN_STATUS_RETIRED) {
    SENSORWEAVE_LOG_WARN("pattern retired", {StringField("pattern_id", pattern_id), IntField("false_positive_count", updated.false_positive_count())});
  }
  return updated;
}

Pattern PatternLibrary::Get(const std::string& pattern_id) const {
  std::shared_lock lock(mutex_);
  auto             it = patterns_.find(pattern_id);
  if (it == patterns_.end()) throw util::NotFound("pattern " + pattern_id + " not found");
  return it->second;
}

std::vector<Pattern> PatternLibrary::List(bool include_retired) const {
  std::shared_lock     lock(mutex_);
  std::vector<Pattern> out;
  for (const auto& [_, p] : patterns_) {
    if (include_retired || p.status() != PATTERN_STATUS_RETIRED) out.push_back(p);
  }
  return out;
}

std::vector<Pattern> PatternLibrary::Export() const {
  return List(true);
}

Pattern PatternLibrary::Merge(const Pattern& remote) {
  if (remote.domain_a() == SENSING_DOMAIN_UNSPECIFIED || remote.domain_b() == SENSING_DOMAIN_UNSPECIFIED ||
      remote.operation() == MIXING_OPERATION_UNSPECIFIED || remote.mechanism().empty()) {
    throw util::InvalidArgument("merged pattern is incomplete");
  }
  if (remote.domain_a() > remote.domain_b()) throw util::InvalidArgument("merged pattern domains are not in canonical order");
  if (remote.id() != ContentId(remote.domain_a(), remote.domain_b(), remote.operation(), remote.mechanism())) {
    throw util::InvalidArgument("merged pattern id does not match its content");
  }

  std::unique_lock lock(mutex_);
  auto             it      = patterns_.find(remote.id());
  Pattern          updated = it == patterns_.end() ? Join(remote, remote) : Join(it->second, remote);
  Recompute(updated);

  if (it != patterns_.end() && it->second.SerializeAsString() == updated.SerializeAsString()) return updated;

  PersistLocked(updated);
  patterns_[updated.id()] = updated;
  return updated;
}

std::vector<Pattern> PatternLibrary::MatchPatterns(SensingDomain a, SensingDomain b, MixingOperation op, double lag_s) const {
  const auto pair = Normalize(a, b, lag_s);

  std::shared_lock     lock(mutex_);
  std::vector<Pattern> out;
  for (const auto& [_, p] : patterns_) {
    if (p.status() == PATTERN_STATUS_RETIRED) continue;
    if (p.domain_a() != pair.lo || p.domain_b() != pair.hi) continue;
    if (op != MIXING_OPERATION_UNSPECIFIED && p.operation() != op) continue;
    if (!LagMatches(p, pair.lag_s)) continue;
    out.push_back(p);
  }
  return out;
}

std::vector<significance::PatternMatch> PatternLibrary::Match(SensingDomain a, SensingDomain b, MixingOperation op, double lag_s) const {
  std::vector<significance::PatternMatch> out;
  for (const auto& p : MatchPatterns(a, b, op, lag_s)) {
    out.push_back({p.id(), p.mechanism(), p.confidence(), p.status() == PATTERN_STATUS_ESTABLISHED});
  }
  return out;
}

std::size_t PatternLibrary::Size() const {
  std::shared_lock lock(mutex_);
  return patterns_.size();
}

} // namespace sensorweave::pattern
