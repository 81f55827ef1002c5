#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "challenge_table.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/identity_directory.hpp"
#include "internal/util/time.hpp"
#include "sensorweave/v1/types.pb.h"

namespace sensorweave::runtime::config {
class RegistryConfig;
}

namespace sensorweave::registry {

struct RegistryOptions {
  std::chrono::milliseconds heartbeat_window{std::chrono::seconds(60)};
  std::chrono::milliseconds recency_half_life{std::chrono::hours(1)};
  uint32_t                  initial_reputation = 500;
  std::chrono::milliseconds challenge_ttl{std::chrono::seconds(30)};
  std::chrono::milliseconds rating_window{std::chrono::hours(1)};
  uint32_t                  max_ratings_per_window = 20;
  uint32_t                  heartbeat_history      = 16;

  // injectable for tests; defaults to util::Now
  std::function<util::TimePoint()> clock;

  static RegistryOptions FromConfig(const sensorweave::runtime::config::RegistryConfig& config);
};

/*
  Capability registry.

  The repository is the source of truth; this class keeps a materialized
  view of it:

    index_           bridge_id -> entry
    by_domain_       domain -> bridge ids
    by_freq_bucket_  octave bucket -> bridge ids

  index_mutex_ guards the three maps and is only taken exclusively by
  Register / Unregister / Hydrate. Heartbeats and ratings lock the single
  entry they touch.
*/
class CapabilityRegistry {
 public:
  CapabilityRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<identity::IdentityDirectory> identities, RegistryOptions options = {});

  void Hydrate();

  sensorweave::v1::BridgeCapability Register(const std::string& caller_id, const sensorweave::v1::BridgeCapability& capability);
  util::TimePoint                   Heartbeat(const std::string& caller_id, const std::string& bridge_id);
  void                              Unregister(const std::string& caller_id, const std::string& bridge_id);

  std::vector<sensorweave::v1::ScoredBridge> Discover(const sensorweave::v1::DiscoveryQuery& query) const;
  sensorweave::v1::BridgeCapability          Get(const std::string& bridge_id) const;
  std::size_t                                Size() const;

  Challenge IssueChallenge(const std::string& requester_id, const std::string& bridge_id);
  Challenge CompleteChallenge(const std::string& challenge_id, const std::string& signature);
  std::size_t PurgeExpiredChallenges();

  // returns the bridge's reputation after the rating
  uint32_t Rate(const std::string& rater_id, const std::string& bridge_id, uint32_t score);

  sensorweave::v1::StreamDescriptor              RegisterStream(const std::string& caller_id, const sensorweave::v1::StreamDescriptor& descriptor);
  std::vector<sensorweave::v1::StreamDescriptor> ListStreams(const std::string& bridge_id) const;

 private:
  struct Entry {
    mutable std::mutex                   mutex;
    sensorweave::v1::BridgeCapability    capability;
    std::unordered_map<std::string, int> latest_ratings;
  };

  struct RatingEvent {
    std::string     bridge_id;
    util::TimePoint at;
  };

  util::TimePoint        Now() const;
  std::shared_ptr<Entry> Find(const std::string& bridge_id) const;
  void                   IndexLocked(const std::shared_ptr<Entry>& entry);
  void                   UnindexLocked(const sensorweave::v1::BridgeCapability& capability);
  void                   RecomputeReputation(Entry& entry) const;
  void                   PruneRatings(std::deque<RatingEvent>& events, util::TimePoint now) const;

  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<identity::IdentityDirectory> identities_;
  RegistryOptions                              options_;

  mutable std::shared_mutex                                index_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> index_;
  std::unordered_map<int, std::set<std::string>>           by_domain_;
  std::map<int, std::set<std::string>>                     by_freq_bucket_;

  std::mutex                                               ratings_mutex_;
  std::unordered_map<std::string, std::deque<RatingEvent>> ratings_by_rater_;

  ChallengeTable challenges_;
};

} // namespace sensorweave::registry
