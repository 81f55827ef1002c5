#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sensor_packet.hpp"

namespace sensorweave::stream {

// Samples of one stream with their own timestamps.
struct TimedSeries {
  std::string           stream_id;
  double                sample_rate = 0.0;
  std::vector<uint64_t> timestamps_ns;
  std::vector<double>   values;

  // concatenates one channel of ordered packets
  static TimedSeries FromPackets(const std::vector<SensorPacketPtr>& packets, uint8_t channel = 0);
};

// One aligned output sample and the source samples it summarises.
struct AlignedSample {
  double   value    = 0.0;
  uint64_t first_ns = 0;
  uint64_t last_ns  = 0;
  uint32_t count    = 0;
};

struct AlignedSeries {
  std::string                stream_id;
  std::vector<AlignedSample> samples;

  std::vector<double> Values() const;
};

struct AlignedSet {
  double                     sample_rate = 0.0;
  uint64_t                   start_ns    = 0;
  uint64_t                   period_ns   = 0;
  std::vector<AlignedSeries> series;

  std::size_t length() const {
    return series.empty() ? 0 : series.front().samples.size();
  }
};

/*
  Resamples streams onto a common grid.

  The grid runs at the lowest native rate over the window every stream
  covers. Each grid bin box-averages the source samples whose timestamps
  fall into it; an empty bin holds the previous value and reports a
  count of zero. Throws util::InvalidArgument when the series do not
  overlap or are malformed.
*/
class TimelineAligner {
 public:
  AlignedSet Align(const std::vector<TimedSeries>& streams) const;
};

} // namespace sensorweave::stream
