#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sensorweave/v1/types.pb.h"

namespace sensorweave::significance {

// A physical mechanism that can couple two sensing domains.
struct Mechanism {
  sensorweave::v1::SensingDomain domain_a = sensorweave::v1::SENSING_DOMAIN_UNSPECIFIED;
  sensorweave::v1::SensingDomain domain_b = sensorweave::v1::SENSING_DOMAIN_UNSPECIFIED;
  std::string                    label;
  // largest |lag| the mechanism can explain
  double max_lag_s = 0.0;
};

// Lookup keyed by the unordered domain pair.
class MechanismTable {
 public:
  static const MechanismTable& Default();

  explicit MechanismTable(std::vector<Mechanism> mechanisms);

  std::optional<Mechanism> Find(sensorweave::v1::SensingDomain a, sensorweave::v1::SensingDomain b) const;

  const std::vector<Mechanism>& mechanisms() const {
    return mechanisms_;
  }

 private:
  std::vector<Mechanism> mechanisms_;
};

} // namespace sensorweave::significance
