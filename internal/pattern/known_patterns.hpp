#pragma once

#include <vector>

#include "sensorweave/v1/pattern.pb.h"

namespace sensorweave::pattern {

class PatternLibrary;

// Well-known cross-domain couplings, canonical and content-addressed, with
// a prior confidence and no confirmations.
std::vector<sensorweave::v1::Pattern> KnownPatterns();

// merges every known pattern into the library; returns how many were new
std::size_t SeedKnownPatterns(PatternLibrary& library);

} // namespace sensorweave::pattern
