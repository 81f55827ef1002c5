#include "timeline_aligner.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace sensorweave::stream {

TimedSeries TimedSeries::FromPackets(const std::vector<SensorPacketPtr>& packets, uint8_t channel) {
  TimedSeries series;
  for (const auto& packet : packets) {
    if (!packet) continue;
    if (series.stream_id.empty()) {
      series.stream_id   = packet->stream_id;
      series.sample_rate = packet->sample_rate;
    }
    if (channel >= packet->channels) {
      throw util::InvalidArgument("channel " + std::to_string(channel) + " not present in stream " + packet->stream_id);
    }

    auto values = packet->Channel(channel);
    for (std::size_t i = 0; i < values.size(); ++i) {
      series.timestamps_ns.push_back(packet->SampleTimeNs(i));
      series.values.push_back(values[i]);
    }
  }
  return series;
}

std::vector<double> AlignedSeries::Values() const {
  std::vector<double> out;
  out.reserve(samples.size());
  for (const auto& s : samples) out.push_back(s.value);
  return out;
}

AlignedSet TimelineAligner::Align(const std::vector<TimedSeries>& streams) const {
  if (streams.empty()) throw util::InvalidArgument("align: no streams");

  double   rate  = 0.0;
  uint64_t start = 0;
  uint64_t end   = UINT64_MAX;
  for (const auto& s : streams) {
    if (s.sample_rate <= 0.0) throw util::InvalidArgument("align: stream " + s.stream_id + " has no sample rate");
    if (s.timestamps_ns.empty() || s.timestamps_ns.size() != s.values.size()) {
      throw util::InvalidArgument("align: stream " + s.stream_id + " has mismatched or empty samples");
    }
    if (!std::is_sorted(s.timestamps_ns.begin(), s.timestamps_ns.end())) {
      throw util::InvalidArgument("align: stream " + s.stream_id + " timestamps are not ordered");
    }
    rate  = rate == 0.0 ? s.sample_rate : std::min(rate, s.sample_rate);
    start = std::max(start, s.timestamps_ns.front());
    end   = std::min(end, s.timestamps_ns.back());
  }
  if (start > end) throw util::InvalidArgument("align: streams do not overlap in time");

  const auto period = static_cast<uint64_t>(std::llround(1e9 / rate));
  if (period == 0) throw util::InvalidArgument("align: sample rate too high");
  const std::size_t bins = static_cast<std::size_t>((end - start) / period) + 1;

  AlignedSet out;
  out.sample_rate = rate;
  out.start_ns    = start;
  out.period_ns   = period;

  for (const auto& s : streams) {
    AlignedSeries aligned;
    aligned.stream_id = s.stream_id;
    aligned.samples.resize(bins);

    std::vector<double> sums(bins, 0.0);
    double              held = s.values.front();
    for (std::size_t i = 0; i < s.timestamps_ns.size(); ++i) {
      const auto ts = s.timestamps_ns[i];
      if (ts < start) {
        held = s.values[i];
        continue;
      }
      const auto k = static_cast<std::size_t>((ts - start) / period);
      if (k >= bins) break;

      auto& bin = aligned.samples[k];
      if (bin.count == 0) bin.first_ns = ts;
      bin.last_ns = ts;
      ++bin.count;
      sums[k] += s.values[i];
    }

    // sample-and-hold for bins no source sample fell into
    for (std::size_t k = 0; k < bins; ++k) {
      auto& bin = aligned.samples[k];
      if (bin.count > 0) {
        bin.value = sums[k] / bin.count;
        held      = bin.value;
      } else {
        bin.value = held;
      }
    }

    out.series.push_back(std::move(aligned));
  }

  return out;
}

} // namespace sensorweave::stream
