#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace sensorweave::registry {

struct Challenge {
  std::string     challenge_id;
  std::string     requester_id;
  std::string     bridge_id;
  std::string     nonce;
  uint64_t        timestamp_ms = 0;
  util::TimePoint expires_at;
};

// Bytes the owner signs: nonce || u64le(timestamp_ms) || requester_id
std::string ChallengeMessage(const Challenge& challenge);

/*
  Outstanding authentication challenges.

  A challenge is consumed by the first Take, whether or not the response
  later verifies.
*/
class ChallengeTable {
 public:
  void Insert(const Challenge& challenge);

  // removes and returns the challenge if it exists and has not expired
  std::optional<Challenge> Take(const std::string& challenge_id, util::TimePoint now);

  std::size_t PurgeExpired(util::TimePoint now);

  std::size_t Size() const;

 private:
  mutable std::mutex                         mutex_;
  std::unordered_map<std::string, Challenge> challenges_;

  static bool IsExpired(const Challenge& challenge, util::TimePoint now);
};

} // namespace sensorweave::registry
