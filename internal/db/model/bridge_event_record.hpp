#pragma once

#include <cstdint>
#include <string>

namespace sensorweave::db::model {

enum class BridgeEventKind : int {
  kHeartbeat = 1,
  kRating    = 2,
};

/*
  Append-only per-bridge event.

  seq is assigned by the repository on append and is strictly increasing
  per bridge.
*/
struct BridgeEventRecord {
  std::string     bridge_id;
  uint64_t        seq  = 0;
  BridgeEventKind kind = BridgeEventKind::kHeartbeat;

  // heartbeat: owner, rating: rater
  std::string actor;

  // rating score 0..100, unused for heartbeats
  int64_t value = 0;

  uint64_t at_ms = 0;
};

} // namespace sensorweave::db::model
