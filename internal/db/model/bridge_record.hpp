#pragma once

#include <cstdint>
#include <string>

namespace sensorweave::db::model {

/*
  Registered bridge.

  The capability is stored as a serialized sensorweave.v1.BridgeCapability
  so new capability fields never need a schema change. Mutable state
  (last_seen, reputation) is derived from the event log, not stored here.
*/

struct BridgeRecord {
  std::string bridge_id;
  std::string owner;

  // serialized BridgeCapability
  std::string capability;

  uint64_t registered_at_ms = 0;
};

} // namespace sensorweave::db::model
