#pragma once

#include <cstdint>
#include <string>

namespace sensorweave::db::model {

struct StreamRecord {
  std::string stream_id;
  std::string bridge_id;

  // serialized sensorweave.v1.StreamDescriptor
  std::string descriptor;

  uint64_t created_at_ms = 0;
};

} // namespace sensorweave::db::model
