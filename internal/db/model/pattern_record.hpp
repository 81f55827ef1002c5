#pragma once

#include <cstdint>
#include <string>

namespace sensorweave::db::model {

struct PatternRecord {
  // content-addressed, sha256 hex
  std::string id;

  // serialized sensorweave.v1.Pattern (merged state)
  std::string body;

  uint64_t updated_at_ms = 0;
};

} // namespace sensorweave::db::model
