#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/pattern/known_patterns.hpp"
#include "internal/pattern/pattern_library.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace sensorweave::v1;
using sensorweave::db::memory::MemoryRepository;
using sensorweave::pattern::PatternLibrary;
using sensorweave::pattern::PatternOptions;

PatternOptions Options(uint64_t now_ms, uint32_t establish = 3) {
  PatternOptions options;
  options.establish_threshold = establish;
  options.clock               = [now_ms] { return sensorweave::util::FromUnixMillis(now_ms); };
  return options;
}

Pattern Draft(SensingDomain a = SENSING_DOMAIN_ACOUSTIC, SensingDomain b = SENSING_DOMAIN_VIBRATION) {
  Pattern draft;
  draft.set_name("pump bearing coupling");
  draft.set_domain_a(a);
  draft.set_domain_b(b);
  draft.set_operation(MIXING_OPERATION_CROSS_CORRELATION);
  draft.set_mechanism("mechanical_coupling");
  return draft;
}

PatternEvidence Evidence(const std::string& agent, double lag_s = 0.0004, double confidence = 0.8) {
  PatternEvidence evidence;
  evidence.set_agent_id(agent);
  evidence.set_lag_s(lag_s);
  evidence.set_confidence(confidence);
  evidence.set_strength(0.9);
  evidence.set_pass_count(4);
  return evidence;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestPublishIsIdempotentPerAgent() {
  PatternLibrary library(std::make_shared<MemoryRepository>(), Options(1000));

  auto first = library.Publish(Draft(), Evidence("agent-1"));
  assert(first.created);
  assert(first.pattern.id() == PatternLibrary::ContentId(SENSING_DOMAIN_ACOUSTIC, SENSING_DOMAIN_VIBRATION,
                                                         MIXING_OPERATION_CROSS_CORRELATION, "mechanical_coupling"));
  assert(first.pattern.replication_count() == 1);
  assert(first.pattern.origin_agent() == "agent-1");
  assert(first.pattern.status() == PATTERN_STATUS_CANDIDATE);

  auto again = library.Publish(Draft(), Evidence("agent-1"));
  assert(!again.created);
  assert(again.pattern.id() == first.pattern.id());
  assert(again.pattern.replication_count() == 1);
  assert(library.Size() == 1);
}

void TestReplicationEstablishesPattern() {
  PatternLibrary library(std::make_shared<MemoryRepository>(), Options(1000, 3));

  library.Publish(Draft(), Evidence("agent-1", 0.0004, 0.9));
  library.Publish(Draft(), Evidence("agent-2", 0.0006, 0.7));
  auto third = library.Publish(Draft(), Evidence("agent-3", 0.0005, 0.8)).pattern;

  assert(third.replication_count() == 3);
  assert(third.status() == PATTERN_STATUS_ESTABLISHED);
  assert(std::abs(third.confidence() - 0.8) < 1e-12);
  assert(std::abs(third.typical_lag_s() - 0.0005) < 1e-12);

  const auto matches = library.Match(SENSING_DOMAIN_ACOUSTIC, SENSING_DOMAIN_VIBRATION, MIXING_OPERATION_CROSS_CORRELATION, 0.0005);
  assert(matches.size() == 1);
  assert(matches.front().established);
  assert(matches.front().mechanism == "mechanical_coupling");
}

void TestReversedDomainsShareOnePattern() {
  PatternLibrary library(std::make_shared<MemoryRepository>(), Options(1000));

  auto forward  = library.Publish(Draft(), Evidence("agent-1", 0.05)).pattern;
  auto reversed = library.Publish(Draft(SENSING_DOMAIN_VIBRATION, SENSING_DOMAIN_ACOUSTIC), Evidence("agent-2", -0.05)).pattern;

  assert(reversed.id() == forward.id());
  assert(reversed.domain_a() == SENSING_DOMAIN_ACOUSTIC);
  assert(reversed.domain_b() == SENSING_DOMAIN_VIBRATION);
  assert(reversed.replication_count() == 2);
  assert(std::abs(reversed.typical_lag_s() - 0.05) < 1e-12);

  // a lag named from the vibration side is flipped before matching
  assert(library.MatchPatterns(SENSING_DOMAIN_VIBRATION, SENSING_DOMAIN_ACOUSTIC, MIXING_OPERATION_CROSS_CORRELATION, -0.05).size() == 1);
  assert(library.MatchPatterns(SENSING_DOMAIN_VIBRATION, SENSING_DOMAIN_ACOUSTIC, MIXING_OPERATION_CROSS_CORRELATION, 0.05).empty());
  assert(library.MatchPatterns(SENSING_DOMAIN_ACOUSTIC, SENSING_DOMAIN_VIBRATION, MIXING_OPERATION_COHERENCE, 0.05).empty());
  assert(library.MatchPatterns(SENSING_DOMAIN_ACOUSTIC, SENSING_DOMAIN_VIBRATION, MIXING_OPERATION_UNSPECIFIED, 0.05).size() == 1);
}

void TestPublishValidation() {
  PatternLibrary library(std::make_shared<MemoryRepository>(), Options(1000));

  auto unnamed = Draft();
  unnamed.clear_name();
  assert(Throws<sensorweave::util::InvalidArgument>([&] { library.Publish(unnamed, Evidence("agent-1")); }));

  auto one_domain = Draft();
  one_domain.set_domain_b(SENSING_DOMAIN_UNSPECIFIED);
  assert(Throws<sensorweave::util::InvalidArgument>([&] { library.Publish(one_domain, Evidence("agent-1")); }));

  auto no_mechanism = Draft();
  no_mechanism.clear_mechanism();
  assert(Throws<sensorweave::util::InvalidArgument>([&] { library.Publish(no_mechanism, Evidence("agent-1")); }));

  assert(Throws<sensorweave::util::InvalidArgument>([&] { library.Publish(Draft(), Evidence("")); }));
  assert(Throws<sensorweave::util::InvalidArgument>([&] { library.Publish(Draft(), Evidence("agent-1", std::nan(""))); }));
  assert(library.Size() == 0);
}

void TestFalsePositivesRetirePattern() {
  PatternLibrary library(std::make_shared<MemoryRepository>(), Options(1000, 10));
  library.Publish(Draft(), Evidence("agent-1"));
  library.Publish(Draft(), Evidence("agent-2"));
  const auto id = library.Publish(Draft(), Evidence("agent-3")).pattern.id();

  auto reported = library.ReportFalsePositive(id, "auditor-1");
  assert(reported.false_positive_count() == 1);
  assert(reported.status() == PATTERN_STATUS_CANDIDATE);
  assert(std::abs(reported.confidence() - 0.6) < 1e-12);

  // the same reporter only counts once
  reported = library.ReportFalsePositive(id, "auditor-1");
  assert(reported.false_positive_count() == 1);

  reported = library.ReportFalsePositive(id, "auditor-2");
  assert(reported.false_positive_count() == 2);
  assert(reported.status() == PATTERN_STATUS_RETIRED);

  // retired patterns are kept but never matched
  assert(library.Get(id).status() == PATTERN_STATUS_RETIRED);
  assert(library.List(true).size() == 1);
  assert(library.List(false).empty());
  assert(library.Match(SENSING_DOMAIN_ACOUSTIC, SENSING_DOMAIN_VIBRATION, MIXING_OPERATION_CROSS_CORRELATION, 0.0004).empty());

  assert(Throws<sensorweave::util::NotFound>([&] { library.ReportFalsePositive("missing", "auditor-1"); }));
  assert(Throws<sensorweave::util::InvalidArgument>([&] { library.ReportFalsePositive(id, ""); }));
  assert(Throws<sensorweave::util::NotFound>([&] { library.Get("missing"); }));
}

void TestReplicasConvergeInAnyOrder() {
  PatternLibrary left(std::make_shared<MemoryRepository>(), Options(1000));
  PatternLibrary right(std::make_shared<MemoryRepository>(), Options(5000));

  left.Publish(Draft(), Evidence("agent-1", 0.0004, 0.9));
  left.Publish(Draft(), Evidence("agent-2", 0.0006, 0.7));
  right.Publish(Draft(), Evidence("agent-2", 0.0006, 0.95));
  const auto id = right.Publish(Draft(), Evidence("agent-3", 0.0005, 0.6)).pattern.id();
  right.ReportFalsePositive(id, "auditor-1");

  const auto left_state  = left.Export();
  const auto right_state = right.Export();
  for (const auto& p : right_state) left.Merge(p);
  for (const auto& p : left_state) right.Merge(p);

  const auto merged = left.Get(id);
  assert(merged.SerializeAsString() == right.Get(id).SerializeAsString());
  assert(merged.replication_count() == 3);
  assert(merged.false_positive_count() == 1);
  // the earlier discovery wins
  assert(merged.origin_agent() == "agent-1");
  // agent-2's stronger confirmation survives the join
  for (const auto& c : merged.confirmations()) {
    if (c.agent_id() == "agent-2") assert(c.confidence() == 0.95);
  }

  // merging the same state again changes nothing
  const auto before = merged.SerializeAsString();
  assert(left.Merge(right.Get(id)).SerializeAsString() == before);
  assert(left.Size() == 1);
}

void TestMergeRejectsForeignIds() {
  PatternLibrary library(std::make_shared<MemoryRepository>(), Options(1000));

  auto pattern = library.Publish(Draft(), Evidence("agent-1")).pattern;
  pattern.set_mechanism("renamed");
  assert(Throws<sensorweave::util::InvalidArgument>([&] { library.Merge(pattern); }));

  auto flipped = library.Get(pattern.id());
  flipped.set_domain_a(SENSING_DOMAIN_VIBRATION);
  flipped.set_domain_b(SENSING_DOMAIN_ACOUSTIC);
  assert(Throws<sensorweave::util::InvalidArgument>([&] { library.Merge(flipped); }));
}

void TestHydrateRestoresLibrary() {
  auto repository = std::make_shared<MemoryRepository>();
  std::string id;
  {
    PatternLibrary library(repository, Options(1000, 2));
    library.Publish(Draft(), Evidence("agent-1"));
    id = library.Publish(Draft(), Evidence("agent-2")).pattern.id();
    library.ReportFalsePositive(id, "auditor-1");
  }

  PatternLibrary restored(repository, Options(2000, 2));
  assert(restored.Size() == 0);
  restored.Hydrate();
  assert(restored.Size() == 1);

  const auto pattern = restored.Get(id);
  assert(pattern.replication_count() == 2);
  assert(pattern.false_positive_count() == 1);
  assert(pattern.status() == PATTERN_STATUS_ESTABLISHED);
}

void TestKnownPatternsSeedOnce() {
  PatternLibrary library(std::make_shared<MemoryRepository>(), Options(1000));

  const auto known = sensorweave::pattern::KnownPatterns();
  assert(sensorweave::pattern::SeedKnownPatterns(library) == known.size());
  assert(sensorweave::pattern::SeedKnownPatterns(library) == 0);
  assert(library.Size() == known.size());

  for (const auto& p : known) {
    assert(p.domain_a() <= p.domain_b());
    assert(p.id() == PatternLibrary::ContentId(p.domain_a(), p.domain_b(), p.operation(), p.mechanism()));
  }

  // seismic leads acoustic by half a second
  assert(library.Match(SENSING_DOMAIN_SEISMIC, SENSING_DOMAIN_ACOUSTIC, MIXING_OPERATION_CROSS_CORRELATION, 0.5).size() == 1);
  assert(library.Match(SENSING_DOMAIN_ACOUSTIC, SENSING_DOMAIN_SEISMIC, MIXING_OPERATION_CROSS_CORRELATION, 0.5).empty());

  const auto prior = library.Match(SENSING_DOMAIN_ACOUSTIC, SENSING_DOMAIN_VIBRATION, MIXING_OPERATION_CROSS_CORRELATION, 0.0);
  assert(prior.size() == 1);
  assert(!prior.front().established);
  assert(std::abs(prior.front().confidence - 0.6) < 1e-12);

  // local evidence lands on the seeded pattern
  auto confirmed = library.Publish(Draft(), Evidence("agent-1", 0.0, 0.9));
  assert(!confirmed.created);
  assert(confirmed.pattern.origin_agent() == "system");
  assert(std::abs(confirmed.pattern.confidence() - 0.9) < 1e-12);
}

} // namespace

int main() {
  TestPublishIsIdempotentPerAgent();
  TestReplicationEstablishesPattern();
  TestReversedDomainsShareOnePattern();
  TestPublishValidation();
  TestFalsePositivesRetirePattern();
  TestReplicasConvergeInAnyOrder();
  TestMergeRejectsForeignIds();
  TestHydrateRestoresLibrary();
  TestKnownPatternsSeedOnce();
  std::cout << "pattern_library_test: pass" << std::endl;
  return 0;
}
