#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "internal/crypto/crypto.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/identity/identity_directory.hpp"
#include "internal/registry/capability_registry.hpp"
#include "internal/registry/discovery.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using sensorweave::registry::CapabilityRegistry;
using sensorweave::registry::RegistryOptions;
using sensorweave::util::DiscoveryError;
using sensorweave::util::DiscoveryErrorCode;
using namespace sensorweave::v1;

struct Fixture {
  std::shared_ptr<sensorweave::db::memory::MemoryRepository>           repository = std::make_shared<sensorweave::db::memory::MemoryRepository>();
  std::shared_ptr<sensorweave::identity::InMemoryIdentityDirectory>    identities = std::make_shared<sensorweave::identity::InMemoryIdentityDirectory>();
  std::shared_ptr<sensorweave::util::TimePoint>                        now        = std::make_shared<sensorweave::util::TimePoint>(sensorweave::util::FromUnixMillis(1'700'000'000'000));
  std::unique_ptr<CapabilityRegistry>                                  registry;

  Fixture() {
    registry = std::make_unique<CapabilityRegistry>(repository, identities, Options());
  }

  RegistryOptions Options() const {
    RegistryOptions options;
    options.max_ratings_per_window = 3;
    options.clock                  = [now = now] { return *now; };
    return options;
  }
};

BridgeCapability MakeBridge(const std::string& id, SensingDomain domain, double fmin, double fmax, uint32_t rate = 48000,
                            const std::string& owner = "owner-a") {
  BridgeCapability capability;
  capability.set_bridge_id(id);
  capability.set_owner(owner);
  capability.set_domain(domain);
  capability.set_freq_min_hz(fmin);
  capability.set_freq_max_hz(fmax);
  capability.set_max_sample_rate(rate);
  capability.set_channels(1);
  capability.add_transports(TRANSPORT_ETHERNET);
  return capability;
}

template <typename Fn>
bool ThrowsDiscovery(DiscoveryErrorCode code, Fn&& fn) {
  try {
    fn();
  } catch (const DiscoveryError& e) {
    return e.code() == code;
  }
  return false;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestRegisterValidatesAndRejectsDuplicates() {
  Fixture f;

  auto stored = f.registry->Register("owner-a", MakeBridge("mic-1", SENSING_DOMAIN_ACOUSTIC, 20, 20000));
  assert(stored.reputation() == 500);
  assert(f.registry->Size() == 1);

  assert(Throws<sensorweave::util::AlreadyExists>([&] { f.registry->Register("owner-a", MakeBridge("mic-1", SENSING_DOMAIN_ACOUSTIC, 20, 20000)); }));
  assert(Throws<sensorweave::util::PermissionDenied>([&] { f.registry->Register("intruder", MakeBridge("mic-2", SENSING_DOMAIN_ACOUSTIC, 20, 20000)); }));
  assert(Throws<sensorweave::util::InvalidArgument>([&] { f.registry->Register("owner-a", MakeBridge("mic-3", SENSING_DOMAIN_ACOUSTIC, 500, 20)); }));
  assert(Throws<sensorweave::util::InvalidArgument>([&] { f.registry->Register("owner-a", MakeBridge("mic-4", SENSING_DOMAIN_ACOUSTIC, 20, 200, 0)); }));
}

void TestDiscoverFiltersByDomainAndFrequencyOverlap() {
  Fixture f;
  f.registry->Register("owner-a", MakeBridge("mic", SENSING_DOMAIN_ACOUSTIC, 20, 20000));
  f.registry->Register("owner-a", MakeBridge("accel", SENSING_DOMAIN_VIBRATION, 0.5, 1600, 3200));
  f.registry->Register("owner-a", MakeBridge("sdr", SENSING_DOMAIN_RADIO_FREQUENCY, 24e6, 1.7e9, 2'400'000));

  DiscoveryQuery by_domain;
  by_domain.add_domains(SENSING_DOMAIN_VIBRATION);
  auto found = f.registry->Discover(by_domain);
  assert(found.size() == 1);
  assert(found[0].capability().bridge_id() == "accel");

  DiscoveryQuery by_band;
  by_band.set_freq_min_hz(1000);
  by_band.set_freq_max_hz(2000);
  found = f.registry->Discover(by_band);
  assert(found.size() == 2);

  DiscoveryQuery by_rate;
  by_rate.set_min_sample_rate(10000);
  found = f.registry->Discover(by_rate);
  assert(found.size() == 2);

  DiscoveryQuery limited;
  limited.set_limit(1);
  assert(f.registry->Discover(limited).size() == 1);
}

void TestDiscoverHidesBridgesOutsideHeartbeatWindow() {
  Fixture f;
  f.registry->Register("owner-a", MakeBridge("mic", SENSING_DOMAIN_ACOUSTIC, 20, 20000));
  f.registry->Register("owner-a", MakeBridge("accel", SENSING_DOMAIN_VIBRATION, 1, 1600));

  *f.now += 45s;
  f.registry->Heartbeat("owner-a", "mic");
  *f.now += 30s;

  auto found = f.registry->Discover(DiscoveryQuery{});
  assert(found.size() == 1);
  assert(found[0].capability().bridge_id() == "mic");

  assert(ThrowsDiscovery(DiscoveryErrorCode::kNotFound, [&] { f.registry->Heartbeat("owner-a", "missing"); }));
  assert(Throws<sensorweave::util::PermissionDenied>([&] { f.registry->Heartbeat("intruder", "mic"); }));
}

void TestScoreOrdersByReputationRecencyAndCost() {
  Fixture f;
  auto cheap  = MakeBridge("cheap", SENSING_DOMAIN_ACOUSTIC, 20, 20000);
  auto pricey = MakeBridge("pricey", SENSING_DOMAIN_ACOUSTIC, 20, 20000);
  pricey.set_cost_per_ks(1000);
  f.registry->Register("owner-a", cheap);
  f.registry->Register("owner-a", pricey);

  auto found = f.registry->Discover(DiscoveryQuery{});
  assert(found.size() == 2);
  assert(found[0].capability().bridge_id() == "cheap");
  assert(std::abs(found[0].score() - 0.5) < 1e-9);
  assert(std::abs(found[1].score() - 0.25) < 1e-9);
}

void TestRatingsAreRateLimitedPerRater() {
  Fixture f;
  for (const auto* id : {"b1", "b2", "b3", "b4"}) {
    f.registry->Register("owner-a", MakeBridge(id, SENSING_DOMAIN_THERMAL, 0.01, 1, 10));
  }

  assert(f.registry->Rate("rater", "b1", 100) == 1000);
  assert(ThrowsDiscovery(DiscoveryErrorCode::kRateLimited, [&] { f.registry->Rate("rater", "b1", 0); }));
  f.registry->Rate("rater", "b2", 50);
  f.registry->Rate("rater", "b3", 50);
  assert(ThrowsDiscovery(DiscoveryErrorCode::kRateLimited, [&] { f.registry->Rate("rater", "b4", 50); }));
  assert(Throws<sensorweave::util::PermissionDenied>([&] { f.registry->Rate("owner-a", "b4", 50); }));

  // a second rater averages in
  assert(f.registry->Rate("other", "b1", 0) == 500);

  *f.now += std::chrono::hours(2);
  assert(f.registry->Rate("rater", "b4", 20) == 200);
}

void TestHydrateRebuildsIndexAndReputation() {
  Fixture f;
  f.registry->Register("owner-a", MakeBridge("mic", SENSING_DOMAIN_ACOUSTIC, 20, 20000));
  f.registry->Rate("rater", "mic", 80);

  CapabilityRegistry replica(f.repository, f.identities, f.Options());
  replica.Hydrate();
  assert(replica.Size() == 1);
  assert(replica.Get("mic").reputation() == 800);
  assert(ThrowsDiscovery(DiscoveryErrorCode::kRateLimited, [&] { replica.Rate("rater", "mic", 10); }));

  f.registry->Unregister("owner-a", "mic");
  CapabilityRegistry empty(f.repository, f.identities, f.Options());
  empty.Hydrate();
  assert(empty.Size() == 0);
}

void TestChallengeResponseAuthentication() {
  Fixture f;
  const auto keys = sensorweave::crypto::GenerateEd25519KeyPair();
  f.identities->Put("owner-a", keys.public_key);
  f.registry->Register("owner-a", MakeBridge("mic", SENSING_DOMAIN_ACOUSTIC, 20, 20000));

  auto challenge = f.registry->IssueChallenge("agent-7", "mic");
  assert(challenge.nonce.size() == 32);
  const auto signature = sensorweave::crypto::SignEd25519(keys.private_key, sensorweave::registry::ChallengeMessage(challenge));
  auto       verified  = f.registry->CompleteChallenge(challenge.challenge_id, signature);
  assert(verified.bridge_id == "mic");
  assert(verified.requester_id == "agent-7");

  // single use
  assert(ThrowsDiscovery(DiscoveryErrorCode::kAuthFailed, [&] { f.registry->CompleteChallenge(challenge.challenge_id, signature); }));

  // wrong key
  const auto other = sensorweave::crypto::GenerateEd25519KeyPair();
  auto       again = f.registry->IssueChallenge("agent-7", "mic");
  assert(ThrowsDiscovery(DiscoveryErrorCode::kAuthFailed, [&] {
    f.registry->CompleteChallenge(again.challenge_id, sensorweave::crypto::SignEd25519(other.private_key, sensorweave::registry::ChallengeMessage(again)));
  }));

  // expired
  auto late = f.registry->IssueChallenge("agent-7", "mic");
  *f.now += 31s;
  assert(ThrowsDiscovery(DiscoveryErrorCode::kAuthFailed, [&] {
    f.registry->CompleteChallenge(late.challenge_id, sensorweave::crypto::SignEd25519(keys.private_key, sensorweave::registry::ChallengeMessage(late)));
  }));

  f.registry->IssueChallenge("agent-7", "mic");
  *f.now += 31s;
  assert(f.registry->PurgeExpiredChallenges() == 1);
}

void TestStreamsAreAdvertisedByOwner() {
  Fixture f;
  f.registry->Register("owner-a", MakeBridge("mic", SENSING_DOMAIN_ACOUSTIC, 20, 20000));

  StreamDescriptor descriptor;
  descriptor.set_bridge_id("mic");
  descriptor.set_sample_rate(48000);
  descriptor.set_buffer_size(1024);
  descriptor.set_format("f32");

  auto stored = f.registry->RegisterStream("owner-a", descriptor);
  assert(!stored.stream_id().empty());
  assert(stored.domain() == SENSING_DOMAIN_ACOUSTIC);

  assert(Throws<sensorweave::util::PermissionDenied>([&] { f.registry->RegisterStream("intruder", descriptor); }));
  descriptor.set_sample_rate(0);
  assert(Throws<sensorweave::util::InvalidArgument>([&] { f.registry->RegisterStream("owner-a", descriptor); }));

  auto streams = f.registry->ListStreams("mic");
  assert(streams.size() == 1);
  assert(streams[0].stream_id() == stored.stream_id());
}

void TestNonFiniteFrequenciesAreRejected() {
  Fixture f;
  const double inf = std::numeric_limits<double>::infinity();
  const double nan = std::numeric_limits<double>::quiet_NaN();

  using sensorweave::util::InvalidArgument;
  assert(Throws<InvalidArgument>([&] { f.registry->Register("owner-a", MakeBridge("wide", SENSING_DOMAIN_RADIO_FREQUENCY, 1, inf)); }));
  assert(Throws<InvalidArgument>([&] { f.registry->Register("owner-a", MakeBridge("odd", SENSING_DOMAIN_RADIO_FREQUENCY, nan, 100)); }));
  assert(Throws<InvalidArgument>([&] { f.registry->Register("owner-a", MakeBridge("odd", SENSING_DOMAIN_RADIO_FREQUENCY, 10, nan)); }));
  auto priced = MakeBridge("priced", SENSING_DOMAIN_RADIO_FREQUENCY, 10, 100);
  priced.set_cost_per_ks(nan);
  assert(Throws<InvalidArgument>([&] { f.registry->Register("owner-a", priced); }));
  assert(f.registry->Size() == 0);

  f.registry->Register("owner-a", MakeBridge("sdr", SENSING_DOMAIN_RADIO_FREQUENCY, 1e6, 6e9));
  DiscoveryQuery unbounded;
  unbounded.set_freq_max_hz(inf);
  assert(Throws<InvalidArgument>([&] { f.registry->Discover(unbounded); }));

  assert(sensorweave::registry::FrequencyBucket(inf) == sensorweave::registry::FrequencyBucket(1e300));
  assert(sensorweave::registry::FrequencyBucket(nan) == 0);
}

void TestActuatorOutputLimits() {
  Fixture f;
  using sensorweave::util::InvalidArgument;

  auto speaker = MakeBridge("speaker", SENSING_DOMAIN_ACOUSTIC, 20, 20000);
  speaker.set_max_output_level(130);
  assert(Throws<InvalidArgument>([&] { f.registry->Register("owner-a", speaker); }));
  speaker.set_max_output_level(80);
  f.registry->Register("owner-a", speaker);
  assert(f.registry->Get("speaker").max_output_level() == 80);

  auto beacon = MakeBridge("beacon", SENSING_DOMAIN_RADIO_FREQUENCY, 2.4e9, 2.5e9);
  beacon.set_max_output_level(100);
  assert(Throws<InvalidArgument>([&] { f.registry->Register("owner-a", beacon); }));
  beacon.set_max_output_level(30);
  f.registry->Register("owner-a", beacon);

  auto laser = MakeBridge("laser", SENSING_DOMAIN_OPTICAL, 4e14, 7.5e14);
  laser.set_max_output_level(2);
  assert(Throws<InvalidArgument>([&] { f.registry->Register("owner-a", laser); }));
  laser.set_max_output_level(1.5);
  f.registry->Register("owner-a", laser);

  // passive sensors declare nothing; domains without a cap take any finite level
  f.registry->Register("owner-a", MakeBridge("mic", SENSING_DOMAIN_ACOUSTIC, 20, 20000));
  auto heater = MakeBridge("heater", SENSING_DOMAIN_THERMAL, 0, 1);
  heater.set_max_output_level(500);
  f.registry->Register("owner-a", heater);
  heater.set_bridge_id("heater-2");
  heater.set_max_output_level(std::numeric_limits<double>::quiet_NaN());
  assert(Throws<InvalidArgument>([&] { f.registry->Register("owner-a", heater); }));

  assert(f.registry->Size() == 5);
}

void TestHaversine() {
  GeoLocation a;
  a.set_latitude(0);
  a.set_longitude(0);
  GeoLocation b;
  b.set_latitude(0);
  b.set_longitude(1);
  const double km = sensorweave::registry::HaversineKm(a, b);
  assert(km > 111.0 && km < 111.4);
  assert(sensorweave::registry::FrequencyBucket(0.5) == 0);
  assert(sensorweave::registry::FrequencyBucket(1024) == 10);
}

} // namespace

int main() {
  TestRegisterValidatesAndRejectsDuplicates();
  TestDiscoverFiltersByDomainAndFrequencyOverlap();
  TestDiscoverHidesBridgesOutsideHeartbeatWindow();
  TestScoreOrdersByReputationRecencyAndCost();
  TestRatingsAreRateLimitedPerRater();
  TestHydrateRebuildsIndexAndReputation();
  TestChallengeResponseAuthentication();
  TestStreamsAreAdvertisedByOwner();
  TestNonFiniteFrequenciesAreRejected();
  TestActuatorOutputLimits();
  TestHaversine();

  std::cout << "capability_registry_test: pass" << std::endl;
  return 0;
}
