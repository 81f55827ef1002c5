#pragma once

#include "sensorweave/v1.hpp"

namespace sensorweave::registry {

inline constexpr double kMaxSoundPressureDb = 120.0;
inline constexpr double kMaxRfEirpDbm       = 30.0;
inline constexpr int    kMaxOpticalClass    = 1;

// Throws util::InvalidArgument when an actuating bridge may emit above the
// limit for its domain. Domains without a limit accept any finite level.
void ValidateOutputLevel(double level, sensorweave::v1::SensingDomain domain);

} // namespace sensorweave::registry
