#include "known_patterns.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "pattern_library.hpp"

namespace sensorweave::pattern {

using namespace sensorweave::v1;

namespace {

struct Seed {
  const char*     name;
  const char*     description;
  SensingDomain   a;
  SensingDomain   b;
  MixingOperation op;
  const char*     mechanism;
  double          lag_s;
  double          prior;
};

constexpr Seed kSeeds[] = {
    {"Acoustic-Vibration Cross-Correlation", "Mechanical vibrations produce acoustic emissions", SENSING_DOMAIN_ACOUSTIC,
     SENSING_DOMAIN_VIBRATION, MIXING_OPERATION_CROSS_CORRELATION, "mechanical_coupling", 0.0, 0.6},
    {"RF-Magnetic Field Coupling", "Radio-frequency fields induce magnetic flux changes", SENSING_DOMAIN_RADIO_FREQUENCY,
     SENSING_DOMAIN_MAGNETIC, MIXING_OPERATION_COHERENCE, "electromagnetic_field_coupling", 0.0, 0.5},
    {"Thermal-Pressure Thermodynamics", "Temperature changes in a closed volume move its pressure", SENSING_DOMAIN_THERMAL,
     SENSING_DOMAIN_PRESSURE, MIXING_OPERATION_CROSS_CORRELATION, "thermodynamic_state", 5.0, 0.5},
    {"Seismic-Acoustic P-wave Detection", "Ground motion precedes its airborne acoustic signature", SENSING_DOMAIN_ACOUSTIC,
     SENSING_DOMAIN_SEISMIC, MIXING_OPERATION_CROSS_CORRELATION, "ground_air_coupling", -0.5, 0.5},
    {"Optical-Thermal Radiative Heating", "Absorbed light heats the illuminated surface", SENSING_DOMAIN_OPTICAL, SENSING_DOMAIN_THERMAL,
     MIXING_OPERATION_CROSS_CORRELATION, "radiative_heating", 10.0, 0.4},
    {"Electrical-Magnetic Induction", "Current flow produces a proportional magnetic field", SENSING_DOMAIN_MAGNETIC,
     SENSING_DOMAIN_ELECTRICAL, MIXING_OPERATION_CROSS_CORRELATION, "electromagnetic_induction", 0.0, 0.6},
    {"Pressure-Acoustic Sound Propagation", "Sound is a travelling pressure wave", SENSING_DOMAIN_ACOUSTIC, SENSING_DOMAIN_PRESSURE,
     MIXING_OPERATION_COHERENCE, "pressure_wave_propagation", 0.0, 0.6},
    {"Seismic-Vibration Ground Motion", "Structures follow the ground they stand on", SENSING_DOMAIN_VIBRATION, SENSING_DOMAIN_SEISMIC,
     MIXING_OPERATION_CROSS_CORRELATION, "ground_motion", 0.0, 0.5},
    {"Millimeter-Wave Vibrometry", "Radar phase tracks surface displacement", SENSING_DOMAIN_VIBRATION, SENSING_DOMAIN_MILLIMETER_WAVE,
     MIXING_OPERATION_CROSS_CORRELATION, "surface_displacement", 0.0, 0.4},
    {"Vibration-Thermal Friction Heating", "Sustained vibration raises bearing temperature", SENSING_DOMAIN_VIBRATION,
     SENSING_DOMAIN_THERMAL, MIXING_OPERATION_HILBERT_ENVELOPE, "friction_heating", 5.0, 0.3},
};

} // namespace

std::vector<Pattern> KnownPatterns() {
  std::vector<Pattern> out;
  for (const auto& seed : kSeeds) {
    Pattern p;
    p.set_name(seed.name);
    p.set_description(seed.description);
    p.set_domain_a(seed.a);
    p.set_domain_b(seed.b);
    p.set_operation(seed.op);
    p.set_mechanism(seed.mechanism);
    p.set_origin_agent("system");
    *p.mutable_discovered_at() = util::ToProto(util::FromUnixMillis(0));
    p.set_typical_lag_s(seed.lag_s);
    p.set_prior_confidence(seed.prior);
    p.set_id(PatternLibrary::ContentId(seed.a, seed.b, seed.op, seed.mechanism));
    out.push_back(std::move(p));
  }
  return out;
}

std::size_t SeedKnownPatterns(PatternLibrary& library) {
  const auto  before = library.Size();
  for (const auto& p : KnownPatterns()) library.Merge(p);
  const auto added = library.Size() - before;

  SENSORWEAVE_LOG_INFO("known patterns seeded", {observability::IntField("added", static_cast<int64_t>(added))});
  return added;
}

} // namespace sensorweave::pattern
