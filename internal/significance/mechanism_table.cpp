#include "mechanism_table.hpp"

namespace sensorweave::significance {

using namespace sensorweave::v1;

const MechanismTable& MechanismTable::Default() {
  static const MechanismTable table({
      {SENSING_DOMAIN_ACOUSTIC, SENSING_DOMAIN_VIBRATION, "mechanical_coupling", 0.001},
      {SENSING_DOMAIN_RADIO_FREQUENCY, SENSING_DOMAIN_MAGNETIC, "electromagnetic_field_coupling", 0.001},
      {SENSING_DOMAIN_ELECTRICAL, SENSING_DOMAIN_MAGNETIC, "electromagnetic_induction", 0.001},
      {SENSING_DOMAIN_THERMAL, SENSING_DOMAIN_PRESSURE, "thermodynamic_state", 30.0},
      {SENSING_DOMAIN_SEISMIC, SENSING_DOMAIN_ACOUSTIC, "ground_air_coupling", 2.0},
      {SENSING_DOMAIN_SEISMIC, SENSING_DOMAIN_VIBRATION, "ground_motion", 0.5},
      {SENSING_DOMAIN_OPTICAL, SENSING_DOMAIN_THERMAL, "radiative_heating", 60.0},
      {SENSING_DOMAIN_MILLIMETER_WAVE, SENSING_DOMAIN_VIBRATION, "surface_displacement", 0.005},
      {SENSING_DOMAIN_PRESSURE, SENSING_DOMAIN_ACOUSTIC, "pressure_wave_propagation", 0.05},
      {SENSING_DOMAIN_VIBRATION, SENSING_DOMAIN_THERMAL, "friction_heating", 10.0},
  });
  return table;
}

MechanismTable::MechanismTable(std::vector<Mechanism> mechanisms) : mechanisms_(std::move(mechanisms)) {
}

std::optional<Mechanism> MechanismTable::Find(SensingDomain a, SensingDomain b) const {
  for (const auto& m : mechanisms_) {
    if ((m.domain_a == a && m.domain_b == b) || (m.domain_a == b && m.domain_b == a)) return m;
  }
  return std::nullopt;
}

} // namespace sensorweave::significance
