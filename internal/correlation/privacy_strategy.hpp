#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "signal_ops.hpp"
#include "types.hpp"

namespace sensorweave::correlation {

using Share = std::vector<uint64_t>;

struct PrivacyOptions {
  std::size_t max_samples   = 4096;
  uint32_t    fraction_bits = 20;
};

/*
  Reconstructs a result from the parties' output shares.

  Shares are additive modulo 2^64. Nothing but shares ever reaches the
  coordinator; reconstruction needs shares from at least two distinct
  parties.
*/
class ShareCoordinator {
 public:
  void AddShare(const std::string& party, Share share);

  std::size_t parties() const {
    return shares_.size();
  }

  // throws util::CorrelationError(kInsufficientData)
  std::vector<int64_t> Reconstruct() const;

 private:
  std::map<std::string, Share> shares_;
};

/*
  Two-party additive secret sharing over fixed-point values.

  Each source normalises its own segment to unit norm and encodes it with
  fraction_bits of precision. A dealer hands out masks u, v and shares of
  their lagged products; the parties exchange only the masked openings
  a-u and b-v and send one output share each to the coordinator.
*/
class PrivacyPreservingStrategy {
 public:
  explicit PrivacyPreservingStrategy(PrivacyOptions options = {}) : options_(options) {
  }

  bool Supports(sensorweave::v1::MixingOperation op) const;
  bool Available(const CorrelationRequest& request) const;

  CorrelationResult Compute(const CorrelationRequest& request, const ComputeContext& context) const;

 private:
  PairOutput SharedPair(const CorrelationRequest& request, std::size_t first, std::size_t second, std::size_t max_lag,
                        const ComputeContext& context) const;

  PrivacyOptions options_;
};

// identity a source contributes shares under: trust domain, else bridge
std::string PartyOf(const SourceSignal& source);

} // namespace sensorweave::correlation
