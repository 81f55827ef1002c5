#include "sync.hpp"

namespace sensorweave::stream {

SyncQuality SelectSync(const sensorweave::v1::BridgeCapability& capability) {
  SyncQuality best{sensorweave::v1::SYNC_SOURCE_LOCAL, ConfidenceFor(sensorweave::v1::SYNC_SOURCE_LOCAL), 0};
  for (auto raw : capability.sync_sources()) {
    const auto source     = static_cast<sensorweave::v1::SyncSource>(raw);
    const auto confidence = ConfidenceFor(source);
    if (confidence > best.confidence) best = {source, confidence, 0};
  }
  return best;
}

} // namespace sensorweave::stream
