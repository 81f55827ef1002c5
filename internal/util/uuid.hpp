#pragma once

#include <string>

namespace sensorweave::util {

// Random RFC 4122 version 4 id in canonical text form, used for session,
// challenge and stream ids.
std::string NewId();

} // namespace sensorweave::util
