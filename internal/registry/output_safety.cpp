#include "output_safety.hpp"

#include <cmath>
#include <string>

#include "internal/util/errors.hpp"

namespace sensorweave::registry {

using namespace sensorweave::v1;

void ValidateOutputLevel(double level, SensingDomain domain) {
  if (!std::isfinite(level)) throw util::InvalidArgument("output level must be finite");

  switch (domain) {
    case SENSING_DOMAIN_ACOUSTIC:
      if (level > kMaxSoundPressureDb) {
        throw util::InvalidArgument("output level " + std::to_string(level) + " dB SPL exceeds " + std::to_string(kMaxSoundPressureDb));
      }
      return;
    case SENSING_DOMAIN_RADIO_FREQUENCY:
      if (level > kMaxRfEirpDbm) {
        throw util::InvalidArgument("output level " + std::to_string(level) + " dBm EIRP exceeds " + std::to_string(kMaxRfEirpDbm));
      }
      return;
    case SENSING_DOMAIN_OPTICAL:
      // laser classes are whole numbers; 1M still counts as class 1
      if (std::floor(level) > kMaxOpticalClass) {
        throw util::InvalidArgument("optical output class " + std::to_string(level) + " exceeds class " + std::to_string(kMaxOpticalClass));
      }
      return;
    default:
      return;
  }
}

} // namespace sensorweave::registry
