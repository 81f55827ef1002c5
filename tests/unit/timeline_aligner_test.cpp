#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/stream/timeline_aligner.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace sensorweave::stream;

constexpr uint64_t kMs = 1'000'000;

TimedSeries Ramp(const std::string& id, double rate, uint64_t start_ns, std::size_t n) {
  TimedSeries series;
  series.stream_id   = id;
  series.sample_rate = rate;
  const auto step    = static_cast<uint64_t>(1e9 / rate);
  for (std::size_t i = 0; i < n; ++i) {
    series.timestamps_ns.push_back(start_ns + i * step);
    series.values.push_back(static_cast<double>(i));
  }
  return series;
}

bool Rejects(const std::vector<TimedSeries>& streams) {
  try {
    TimelineAligner{}.Align(streams);
  } catch (const sensorweave::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestResamplesToLowestRateOverOverlap() {
  const auto fast = Ramp("fast", 1000.0, 0, 100);
  const auto slow = Ramp("slow", 500.0, 10 * kMs, 50);

  const auto set = TimelineAligner{}.Align({fast, slow});
  assert(set.sample_rate == 500.0);
  assert(set.period_ns == 2 * kMs);
  assert(set.start_ns == 10 * kMs);
  assert(set.length() == 45);
  assert(set.series.size() == 2);
  assert(set.series[1].samples.size() == set.length());

  const auto& f0 = set.series[0].samples.front();
  assert(f0.count == 2);
  assert(std::abs(f0.value - 10.5) < 1e-12);
  assert(f0.first_ns == 10 * kMs && f0.last_ns == 11 * kMs);

  const auto& s0 = set.series[1].samples.front();
  assert(s0.count == 1 && s0.value == 0.0);

  const auto& f_last = set.series[0].samples.back();
  assert(std::abs(f_last.value - 98.5) < 1e-12);
  assert(set.series[1].samples.back().value == 44.0);
}

void TestEmptyBinsHoldPreviousValue() {
  auto gappy = Ramp("gappy", 1000.0, 0, 7);
  gappy.timestamps_ns.erase(gappy.timestamps_ns.begin() + 3, gappy.timestamps_ns.begin() + 5);
  gappy.values.erase(gappy.values.begin() + 3, gappy.values.begin() + 5);
  const auto dense = Ramp("dense", 1000.0, 0, 7);

  const auto set    = TimelineAligner{}.Align({gappy, dense});
  const auto values = set.series[0].Values();
  assert(set.length() == 7);
  assert((values == std::vector<double>{0, 1, 2, 2, 2, 5, 6}));
  assert(set.series[0].samples[3].count == 0);
  assert(set.series[0].samples[4].count == 0);
}

void TestRejectsDisjointOrMalformedInput() {
  assert(Rejects({}));
  assert(Rejects({Ramp("a", 1000.0, 0, 10), Ramp("b", 1000.0, 20 * kMs, 10)}));

  auto unordered = Ramp("u", 1000.0, 0, 10);
  std::swap(unordered.timestamps_ns[2], unordered.timestamps_ns[3]);
  assert(Rejects({unordered}));

  auto no_rate        = Ramp("r", 1000.0, 0, 10);
  no_rate.sample_rate = 0;
  assert(Rejects({no_rate}));

  auto mismatched = Ramp("m", 1000.0, 0, 10);
  mismatched.values.pop_back();
  assert(Rejects({mismatched}));
}

void TestFromPacketsDeinterleavesOneChannel() {
  std::vector<SensorPacketPtr> packets;
  for (uint64_t p = 0; p < 2; ++p) {
    auto packet          = std::make_shared<SensorPacket>();
    packet->stream_id    = "stereo";
    packet->sample_rate  = 1000;
    packet->channels     = 2;
    packet->sample_count = 4;
    packet->format       = SampleFormat::kFloat64;
    packet->sequence     = p;
    packet->timestamp_ns = p * 4 * kMs;
    std::vector<double> interleaved;
    for (int i = 0; i < 4; ++i) {
      interleaved.push_back(100.0 + p * 4 + i);
      interleaved.push_back(-(100.0 + p * 4 + i));
    }
    packet->payload = EncodeSamples(interleaved, SampleFormat::kFloat64);
    packets.push_back(packet);
  }

  const auto series = TimedSeries::FromPackets(packets, 1);
  assert(series.stream_id == "stereo");
  assert(series.sample_rate == 1000.0);
  assert(series.values.size() == 8);
  assert(series.values[5] == -105.0);
  assert(series.timestamps_ns[5] == 5 * kMs);

  bool threw = false;
  try {
    TimedSeries::FromPackets(packets, 2);
  } catch (const sensorweave::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestResamplesToLowestRateOverOverlap();
  TestEmptyBinsHoldPreviousValue();
  TestRejectsDisjointOrMalformedInput();
  TestFromPacketsDeinterleavesOneChannel();

  std::cout << "timeline_aligner_test: pass" << std::endl;
  return 0;
}
