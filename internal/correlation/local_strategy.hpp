#pragma once

#include <cstddef>

#include "types.hpp"

namespace sensorweave::correlation {

struct LocalOptions {
  std::size_t max_samples = 4096;
};

/*
  Co-located computation on a constrained node.

  Cross-correlation and multiplication only, all sources on one site, and
  at most max_samples per source. The context deadline is checked between
  stages; overrunning it raises CorrelationError(kDeadlineExceeded).
*/
class LocalStrategy {
 public:
  explicit LocalStrategy(LocalOptions options = {}) : options_(options) {
  }

  bool Supports(sensorweave::v1::MixingOperation op) const;
  bool Available(const CorrelationRequest& request) const;

  CorrelationResult Compute(const CorrelationRequest& request, const ComputeContext& context) const;

 private:
  LocalOptions options_;
};

} // namespace sensorweave::correlation
