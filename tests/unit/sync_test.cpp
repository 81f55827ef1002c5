#include <cassert>
#include <iostream>

#include "internal/stream/sync.hpp"

namespace {

using namespace sensorweave::stream;
using namespace sensorweave::v1;

void TestPicksStrongestAdvertisedSource() {
  BridgeCapability capability;
  capability.add_sync_sources(SYNC_SOURCE_NTP);
  capability.add_sync_sources(SYNC_SOURCE_GPS_PULSE);
  capability.add_sync_sources(SYNC_SOURCE_PEER_CLOCK);

  const auto quality = SelectSync(capability);
  assert(quality.source == SYNC_SOURCE_GPS_PULSE);
  assert(quality.confidence == 99);
  assert(quality.IsAcceptable(95));
}

void TestFallsBackToLocalClock() {
  const auto quality = SelectSync(BridgeCapability{});
  assert(quality.source == SYNC_SOURCE_LOCAL);
  assert(quality.confidence == ConfidenceFor(SYNC_SOURCE_LOCAL));
  assert(!quality.IsAcceptable(50));
}

void TestConfidenceIsMonotonicInSourceStrength() {
  static_assert(ConfidenceFor(SYNC_SOURCE_LOCAL) < ConfidenceFor(SYNC_SOURCE_PEER_CLOCK));
  static_assert(ConfidenceFor(SYNC_SOURCE_PEER_CLOCK) < ConfidenceFor(SYNC_SOURCE_NTP));
  static_assert(ConfidenceFor(SYNC_SOURCE_NTP) < ConfidenceFor(SYNC_SOURCE_GPS_PULSE));
}

void TestDriftAndConfidenceBothGate() {
  const SyncQuality steady{SYNC_SOURCE_GPS_PULSE, 99, 50'000};
  assert(steady.IsAcceptable(80, 100'000));
  assert(steady.IsAcceptable(80));

  const SyncQuality wandering{SYNC_SOURCE_NTP, 80, -2'000'000};
  assert(!wandering.IsAcceptable(80, 100'000));
  assert(wandering.IsAcceptable(80, 2'000'000));
  assert(!wandering.IsAcceptable(90, 5'000'000));
}

} // namespace

int main() {
  TestPicksStrongestAdvertisedSource();
  TestFallsBackToLocalClock();
  TestConfidenceIsMonotonicInSourceStrength();
  TestDriftAndConfidenceBothGate();

  std::cout << "sync_test: pass" << std::endl;
  return 0;
}
