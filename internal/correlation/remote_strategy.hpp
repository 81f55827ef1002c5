#pragma once

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "types.hpp"

namespace sensorweave::correlation {

// A named operation for MIXING_OPERATION_CUSTOM. The output is treated as
// lagged around its centre index.
using CustomOperation = std::function<std::vector<double>(const std::vector<double>& a, const std::vector<double>& b)>;

class CustomOperationRegistry {
 public:
  void Register(const std::string& name, CustomOperation op);
  bool Contains(const std::string& name) const;
  // throws util::InvalidArgument when unknown
  CustomOperation Get(const std::string& name) const;

 private:
  mutable std::shared_mutex               mutex_;
  std::map<std::string, CustomOperation> ops_;
};

struct RemoteOptions {
  std::size_t coherence_segment = 256;
};

/*
  Computation on a capable consumer that receives the raw streams.

  Every mixing operation is available. The cancel token is checked
  between stages and raises CorrelationError(kCancelled).
*/
class RemoteStrategy {
 public:
  explicit RemoteStrategy(RemoteOptions options = {}, std::shared_ptr<CustomOperationRegistry> custom = nullptr);

  bool Supports(sensorweave::v1::MixingOperation op) const;

  CorrelationResult Compute(const CorrelationRequest& request, const ComputeContext& context) const;

  const std::shared_ptr<CustomOperationRegistry>& custom() const {
    return custom_;
  }

 private:
  RemoteOptions                            options_;
  std::shared_ptr<CustomOperationRegistry> custom_;
};

} // namespace sensorweave::correlation
