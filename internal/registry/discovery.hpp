#pragma once

#include <chrono>

#include "internal/util/time.hpp"
#include "sensorweave/v1/types.pb.h"

namespace sensorweave::registry {

inline constexpr double kEarthRadiusKm = 6371.0088;

// Great-circle distance between two points, in kilometres.
double HaversineKm(const sensorweave::v1::GeoLocation& a, const sensorweave::v1::GeoLocation& b);

// Octave bucket of a frequency: floor(log2 f), frequencies below 1 Hz share bucket 0.
int FrequencyBucket(double hz);

/*
  Static query predicate. Liveness (heartbeat window) is checked by the
  registry, which owns the clock.
*/
bool MatchesQuery(const sensorweave::v1::BridgeCapability& capability, const sensorweave::v1::DiscoveryQuery& query);

/*
  score = (reputation / 1000) * 0.5^(age / half_life) * 1 / (1 + cost / 1000)

  age is the time since last_seen, clamped at zero.
*/
double Score(const sensorweave::v1::BridgeCapability& capability, util::TimePoint now, std::chrono::milliseconds half_life);

} // namespace sensorweave::registry
