#pragma once

#include <cstdint>
#include <cstdlib>

#include "sensorweave/v1/types.pb.h"

namespace sensorweave::stream {

struct SyncQuality {
  sensorweave::v1::SyncSource source     = sensorweave::v1::SYNC_SOURCE_LOCAL;
  uint8_t                     confidence = 0;
  // instantaneous offset from the clock the stream promised
  int64_t drift_ns = 0;

  // a max_drift_ns of zero leaves drift unbounded
  bool IsAcceptable(uint8_t min_confidence, int64_t max_drift_ns = 0) const {
    return confidence >= min_confidence && (max_drift_ns <= 0 || std::llabs(drift_ns) <= max_drift_ns);
  }
};

constexpr uint8_t ConfidenceFor(sensorweave::v1::SyncSource source) {
  switch (source) {
    case sensorweave::v1::SYNC_SOURCE_GPS_PULSE:
      return 99;
    case sensorweave::v1::SYNC_SOURCE_NTP:
      return 80;
    case sensorweave::v1::SYNC_SOURCE_PEER_CLOCK:
      return 60;
    default:
      return 30;
  }
}

// Strongest source the bridge offers; a bridge that lists none runs on its local clock.
SyncQuality SelectSync(const sensorweave::v1::BridgeCapability& capability);

} // namespace sensorweave::stream
