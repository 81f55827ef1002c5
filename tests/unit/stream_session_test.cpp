#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/stream/stream_session.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using namespace sensorweave::stream;

class RecordingConnector final : public BridgeConnector {
 public:
  void Open(const OpenRequest&, PacketSink) override {
  }
  void SendFlowControl(const std::string&, FlowControl signal) override {
    std::lock_guard lock(mutex);
    signals.push_back(signal);
  }
  void Close(const std::string&) override {
  }
  bool Reconnect(const OpenRequest&) override {
    return true;
  }

  std::mutex               mutex;
  std::vector<FlowControl> signals;
};

SensorPacketPtr Packet(uint64_t sequence) {
  auto packet          = std::make_shared<SensorPacket>();
  packet->stream_id    = "s";
  packet->sequence     = sequence;
  packet->sample_rate  = 1000;
  packet->timestamp_ns = sequence * 1'000'000;
  return packet;
}

// 100 samples at 1 kHz per packet, starting on the clock the stream promised
SensorPacketPtr TimedPacket(uint64_t sequence, int64_t skew_ns = 0, uint8_t confidence = 99) {
  auto packet             = Packet(sequence);
  packet->sample_count    = 100;
  packet->timestamp_ns    = static_cast<uint64_t>(static_cast<int64_t>(sequence * 100'000'000) + skew_ns);
  packet->time_source     = sensorweave::v1::SYNC_SOURCE_GPS_PULSE;
  packet->sync_confidence = confidence;
  return packet;
}

std::shared_ptr<StreamSession> OpenSession(std::shared_ptr<RecordingConnector> connector, SessionOptions options, bool realtime = false,
                                           OpenRequest request = {}) {
  auto session = std::make_shared<StreamSession>("sess-1", ParseBridgeUri("bridge://mic/stream/ch0"), request, options, connector, realtime);
  session->Transition(SessionState::kNegotiating);
  session->Transition(SessionState::kOpen);
  return session;
}

void TestSequenceGapBeyondToleranceMovesToError() {
  auto           connector = std::make_shared<RecordingConnector>();
  SessionOptions options;
  options.sequence_gap_tolerance = 2;
  auto session                   = OpenSession(connector, options);

  session->Deliver(Packet(0));
  session->Deliver(Packet(3)); // gap of 2 tolerated
  assert(session->state() == SessionState::kOpen);
  assert(session->stats().lost == 2);

  session->Deliver(Packet(10));
  assert(session->state() == SessionState::kError);

  session->Deliver(Packet(11));
  assert(session->stats().discarded == 1);
  assert(session->queued() == 2);
}

void TestOlderSequencesAreDroppedNotReordered() {
  auto connector = std::make_shared<RecordingConnector>();
  auto session   = OpenSession(connector, SessionOptions{});

  session->Deliver(Packet(5));
  session->Deliver(Packet(6));
  session->Deliver(Packet(4));
  session->Deliver(Packet(6));
  session->Deliver(Packet(7));

  auto packets = session->Drain(16);
  assert(packets.size() == 3);
  assert(packets[0]->sequence == 5 && packets[1]->sequence == 6 && packets[2]->sequence == 7);
  assert(session->stats().out_of_order == 2);
}

void TestBackpressurePausesAndResumesAtWatermarks() {
  auto           connector = std::make_shared<RecordingConnector>();
  SessionOptions options;
  options.channel_capacity = 10;
  options.high_watermark   = 0.8;
  options.low_watermark    = 0.25;
  auto session             = OpenSession(connector, options);

  for (uint64_t seq = 0; seq < 7; ++seq) session->Deliver(Packet(seq));
  assert(session->state() == SessionState::kOpen);

  session->Deliver(Packet(7));
  assert(session->state() == SessionState::kPaused);
  assert(connector->signals.size() == 1 && connector->signals[0] == FlowControl::kPause);

  // still accepts what was in flight
  session->Deliver(Packet(8));
  assert(session->queued() == 9);

  session->Drain(6);
  assert(session->state() == SessionState::kPaused);
  session->Drain(1);
  assert(session->state() == SessionState::kOpen);
  assert(connector->signals.size() == 2 && connector->signals[1] == FlowControl::kResume);

  const auto stats = session->stats();
  assert(stats.pauses_sent == 1 && stats.resumes_sent == 1);
}

void TestFullChannelRaisesOverrun() {
  auto           connector = std::make_shared<RecordingConnector>();
  SessionOptions options;
  options.channel_capacity = 2;
  options.high_watermark   = 1.0;
  options.overrun_timeout  = 20ms;
  auto session             = OpenSession(connector, options);

  session->Deliver(Packet(0));
  session->Deliver(Packet(1));

  bool overrun = false;
  try {
    session->Deliver(Packet(2));
  } catch (const sensorweave::util::StreamError& e) {
    overrun = e.code() == sensorweave::util::StreamErrorCode::kOverrun;
    assert(e.context().stream_id == "sess-1");
  }
  assert(overrun);
}

void TestRealtimeOverwritesOldestAndNeverPauses() {
  auto           connector = std::make_shared<RecordingConnector>();
  SessionOptions options;
  options.channel_capacity = 3;
  auto session             = OpenSession(connector, options, true);

  for (uint64_t seq = 0; seq < 5; ++seq) session->Deliver(Packet(seq));
  assert(session->state() == SessionState::kOpen);
  assert(connector->signals.empty());
  assert(session->stats().overwritten == 2);

  auto packets = session->Drain(8);
  assert(packets.size() == 3);
  assert(packets.front()->sequence == 2 && packets.back()->sequence == 4);
}

void TestIllegalTransitionsAreRejected() {
  static_assert(CanTransition(SessionState::kError, SessionState::kNegotiating));
  static_assert(!CanTransition(SessionState::kClosed, SessionState::kOpen));
  static_assert(!CanTransition(SessionState::kError, SessionState::kOpen));

  auto connector = std::make_shared<RecordingConnector>();
  auto session   = OpenSession(connector, SessionOptions{});
  session->Transition(SessionState::kClosed);

  bool threw = false;
  try {
    session->Transition(SessionState::kPaused);
  } catch (const sensorweave::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestShutdownWakesConsumers() {
  auto connector = std::make_shared<RecordingConnector>();
  auto session   = OpenSession(connector, SessionOptions{});
  session->Shutdown();
  assert(!session->Next(1s).has_value());
}

void TestLowSyncConfidenceFaultsSession() {
  auto        connector = std::make_shared<RecordingConnector>();
  OpenRequest request;
  request.min_sync_confidence = 80;
  auto session                = OpenSession(connector, SessionOptions{}, false, request);

  std::vector<std::string> faults;
  session->SetFaultHandler([&](const std::string& id) { faults.push_back(id); });

  session->Deliver(TimedPacket(1));
  session->Deliver(TimedPacket(2, 0, 60));
  assert(session->state() == SessionState::kError);
  assert((faults == std::vector<std::string>{"sess-1"}));
  assert(session->stats().sync_faults == 1);
  assert(session->queued() == 1);
}

void TestClockDriftBeyondBoundFaultsSession() {
  auto        connector = std::make_shared<RecordingConnector>();
  OpenRequest request;
  request.max_drift_ns = 100'000;
  auto session         = OpenSession(connector, SessionOptions{}, false, request);

  int faults = 0;
  session->SetFaultHandler([&](const std::string&) { ++faults; });

  session->Deliver(TimedPacket(1));
  session->Deliver(TimedPacket(2, 40'000));
  // a tolerated gap still predicts the start from the last clock
  session->Deliver(TimedPacket(4, 40'000));
  assert(session->state() == SessionState::kOpen);
  assert(faults == 0);

  session->Deliver(TimedPacket(5, 2'000'000));
  assert(session->state() == SessionState::kError);
  assert(faults == 1);
  assert(session->queued() == 3);
}

void TestGapWithoutHandlerStillFaults() {
  auto           connector = std::make_shared<RecordingConnector>();
  SessionOptions options;
  options.sequence_gap_tolerance = 1;
  auto session                   = OpenSession(connector, options);

  session->Deliver(Packet(1));
  session->Deliver(Packet(9));
  assert(session->state() == SessionState::kError);
  assert(session->queued() == 1);
}

void TestFailedSessionDrainsThenThrows() {
  auto connector = std::make_shared<RecordingConnector>();
  auto session   = OpenSession(connector, SessionOptions{});
  session->Deliver(Packet(1));
  session->Deliver(Packet(2));

  session->Fail(sensorweave::util::StreamError(sensorweave::util::StreamErrorCode::kSyncLost, "gone", {.stream_id = "sess-1"}));
  assert(session->state() == SessionState::kClosed);

  assert(session->Next(10ms).has_value());
  assert(session->Drain(8).size() == 1);

  bool next_lost = false;
  try {
    session->Next(10ms);
  } catch (const sensorweave::util::StreamError& e) {
    next_lost = e.code() == sensorweave::util::StreamErrorCode::kSyncLost;
  }
  assert(next_lost);

  bool drain_lost = false;
  try {
    session->Drain(8);
  } catch (const sensorweave::util::StreamError& e) {
    drain_lost = e.code() == sensorweave::util::StreamErrorCode::kSyncLost;
  }
  assert(drain_lost);
}

void TestConsumerPopsCountAsActivity() {
  auto connector = std::make_shared<RecordingConnector>();
  auto session   = OpenSession(connector, SessionOptions{});
  session->Deliver(Packet(1));
  session->Deliver(Packet(2));

  const auto delivered = session->last_activity();
  std::this_thread::sleep_for(5ms);
  assert(session->Next(10ms).has_value());
  const auto popped = session->last_activity();
  assert(popped > delivered);

  std::this_thread::sleep_for(5ms);
  session->Drain(1);
  assert(session->last_activity() > popped);
}

} // namespace

int main() {
  TestSequenceGapBeyondToleranceMovesToError();
  TestOlderSequencesAreDroppedNotReordered();
  TestBackpressurePausesAndResumesAtWatermarks();
  TestFullChannelRaisesOverrun();
  TestRealtimeOverwritesOldestAndNeverPauses();
  TestIllegalTransitionsAreRejected();
  TestShutdownWakesConsumers();
  TestLowSyncConfidenceFaultsSession();
  TestClockDriftBeyondBoundFaultsSession();
  TestGapWithoutHandlerStillFaults();
  TestFailedSessionDrainsThenThrows();
  TestConsumerPopsCountAsActivity();

  std::cout << "stream_session_test: pass" << std::endl;
  return 0;
}
