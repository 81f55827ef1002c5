#include "discovery.hpp"

#include <algorithm>
#include <cmath>

namespace sensorweave::registry {

using namespace sensorweave::v1;

namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

template <typename Repeated, typename Value>
bool Contains(const Repeated& values, Value v) {
  return std::find(values.begin(), values.end(), v) != values.end();
}

} // namespace

double HaversineKm(const GeoLocation& a, const GeoLocation& b) {
  const double lat1 = a.latitude() * kDegToRad;
  const double lat2 = b.latitude() * kDegToRad;
  const double dlat = lat2 - lat1;
  const double dlon = (b.longitude() - a.longitude()) * kDegToRad;

  const double h = std::sin(dlat / 2) * std::sin(dlat / 2) + std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
  return 2.0 * kEarthRadiusKm * std::asin(std::min(1.0, std::sqrt(h)));
}

int FrequencyBucket(double hz) {
  constexpr int kTopBucket = 64;
  if (!(hz >= 1.0)) return 0;
  if (!std::isfinite(hz)) return kTopBucket;
  return std::min(kTopBucket, static_cast<int>(std::floor(std::log2(hz))));
}

bool MatchesQuery(const BridgeCapability& capability, const DiscoveryQuery& query) {
  if (query.domains_size() > 0 && !Contains(query.domains(), capability.domain())) return false;

  if (query.freq_max_hz() > 0) {
    if (capability.freq_min_hz() > query.freq_max_hz() || capability.freq_max_hz() < query.freq_min_hz()) return false;
  } else if (query.freq_min_hz() > 0 && capability.freq_max_hz() < query.freq_min_hz()) {
    return false;
  }

  if (capability.max_sample_rate() < query.min_sample_rate()) return false;
  if (capability.reputation() < query.min_reputation()) return false;
  if (query.has_max_cost_per_ks() && capability.cost_per_ks() > query.max_cost_per_ks()) return false;

  for (auto transport : query.required_transports()) {
    if (!Contains(capability.transports(), transport)) return false;
  }

  if (query.has_geo_radius() && query.geo_radius().radius_km() > 0) {
    if (!capability.has_location()) return false;
    if (HaversineKm(capability.location(), query.geo_radius().center()) > query.geo_radius().radius_km()) return false;
  }

  return true;
}

double Score(const BridgeCapability& capability, util::TimePoint now, std::chrono::milliseconds half_life) {
  const double reputation = static_cast<double>(capability.reputation()) / 1000.0;

  const auto   last_seen = util::FromProto(capability.last_seen());
  const double age_ms    = std::max<double>(0.0, std::chrono::duration<double, std::milli>(now - last_seen).count());
  const double half_ms   = std::max<double>(1.0, static_cast<double>(half_life.count()));
  const double recency   = std::pow(0.5, age_ms / half_ms);

  const double cost = 1.0 / (1.0 + std::max(0.0, capability.cost_per_ks()) / 1000.0);
  return reputation * recency * cost;
}

} // namespace sensorweave::registry
