#include "capability_registry.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "config/config.pb.h"
#include "discovery.hpp"
#include "output_safety.hpp"
#include "internal/crypto/crypto.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace sensorweave::registry {

using namespace sensorweave::v1;
using observability::IntField;
using observability::StringField;

namespace {

constexpr uint32_t kMaxReputation = 1000;
constexpr uint32_t kMaxScore      = 100;
constexpr uint32_t kMaxStreamRate = 1'000'000;

util::DiscoveryError BridgeNotFound(const std::string& bridge_id) {
  return util::DiscoveryError(util::DiscoveryErrorCode::kNotFound, "bridge not registered", {.bridge_id = bridge_id});
}

util::DiscoveryError AuthFailed(const std::string& reason, const std::string& bridge_id = {}) {
  return util::DiscoveryError(util::DiscoveryErrorCode::kAuthFailed, "authentication failed: " + reason, {.bridge_id = bridge_id});
}

BridgeCapability ParseCapability(const db::model::BridgeRecord& record) {
  BridgeCapability capability;
  if (!capability.ParseFromString(record.capability)) {
    throw std::runtime_error("registry hydrate: corrupt capability for bridge " + record.bridge_id);
  }
  return capability;
}

} // namespace

RegistryOptions RegistryOptions::FromConfig(const sensorweave::runtime::config::RegistryConfig& config) {
  RegistryOptions options;
  options.heartbeat_window  = util::DurationOr(config.heartbeat_window(), options.heartbeat_window);
  options.recency_half_life = util::DurationOr(config.recency_half_life(), options.recency_half_life);
  options.challenge_ttl     = util::DurationOr(config.challenge_ttl(), options.challenge_ttl);
  options.rating_window     = util::DurationOr(config.rating_window(), options.rating_window);
  if (config.initial_reputation() > 0) options.initial_reputation = std::min(config.initial_reputation(), kMaxReputation);
  if (config.max_ratings_per_window() > 0) options.max_ratings_per_window = config.max_ratings_per_window();
  if (config.heartbeat_history() > 0) options.heartbeat_history = config.heartbeat_history();
  return options;
}

CapabilityRegistry::CapabilityRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<identity::IdentityDirectory> identities,
                                       RegistryOptions options)
    : repository_(std::move(repository)), identities_(std::move(identities)), options_(std::move(options)) {
  if (!repository_) throw std::invalid_argument("capability registry requires a repository");
  if (!options_.clock) options_.clock = [] { return util::Now(); };
}

util::TimePoint CapabilityRegistry::Now() const {
  return options_.clock();
}

std::shared_ptr<CapabilityRegistry::Entry> CapabilityRegistry::Find(const std::string& bridge_id) const {
  std::shared_lock lock(index_mutex_);
  auto             it = index_.find(bridge_id);
  if (it == index_.end()) return nullptr;
  return it->second;
}

void CapabilityRegistry::IndexLocked(const std::shared_ptr<Entry>& entry) {
  const auto& capability = entry->capability;
  const auto& id         = capability.bridge_id();

  index_[id] = entry;
  by_domain_[capability.domain()].insert(id);
  for (int b = FrequencyBucket(capability.freq_min_hz()); b <= FrequencyBucket(capability.freq_max_hz()); ++b) {
    by_freq_bucket_[b].insert(id);
  }
}

void CapabilityRegistry::UnindexLocked(const BridgeCapability& capability) {
  const auto& id = capability.bridge_id();

  index_.erase(id);
  if (auto it = by_domain_.find(capability.domain()); it != by_domain_.end()) {
    it->second.erase(id);
    if (it->second.empty()) by_domain_.erase(it);
  }
  for (int b = FrequencyBucket(capability.freq_min_hz()); b <= FrequencyBucket(capability.freq_max_hz()); ++b) {
    auto it = by_freq_bucket_.find(b);
    if (it == by_freq_bucket_.end()) continue;
    it->second.erase(id);
    if (it->second.empty()) by_freq_bucket_.erase(it);
  }
}

void CapabilityRegistry::RecomputeReputation(Entry& entry) const {
  if (entry.latest_ratings.empty()) {
    entry.capability.set_reputation(options_.initial_reputation);
    return;
  }

  double sum = 0.0;
  for (const auto& [_, score] : entry.latest_ratings) {
    sum += score;
  }
  const double mean = sum / static_cast<double>(entry.latest_ratings.size());
  entry.capability.set_reputation(std::min<uint32_t>(kMaxReputation, static_cast<uint32_t>(std::lround(mean * 10.0))));
}

void CapabilityRegistry::PruneRatings(std::deque<RatingEvent>& events, util::TimePoint now) const {
  while (!events.empty() && events.front().at + options_.rating_window <= now) {
    events.pop_front();
  }
}

// ------------------------------------------------------------------
// Hydrate
// ------------------------------------------------------------------

void CapabilityRegistry::Hydrate() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListBridges(*tx);

  std::vector<std::pair<db::model::BridgeRecord, std::vector<db::model::BridgeEventRecord>>> loaded;
  loaded.reserve(records.size());
  for (auto& record : records) {
    auto events = repository_->ListBridgeEvents(*tx, record.bridge_id);
    loaded.emplace_back(std::move(record), std::move(events));
  }
  tx->Commit();

  const auto now = Now();

  std::unordered_map<std::string, std::deque<RatingEvent>> ratings;
  std::vector<std::shared_ptr<Entry>>                      entries;
  entries.reserve(loaded.size());

  for (const auto& [record, events] : loaded) {
    auto entry        = std::make_shared<Entry>();
    entry->capability = ParseCapability(record);

    auto last_seen = util::FromUnixMillis(record.registered_at_ms);
    for (const auto& event : events) {
      const auto at = util::FromUnixMillis(event.at_ms);
      switch (event.kind) {
        case db::model::BridgeEventKind::kHeartbeat:
          last_seen = std::max(last_seen, at);
          break;
        case db::model::BridgeEventKind::kRating:
          entry->latest_ratings[event.actor] = static_cast<int>(event.value);
          if (at + options_.rating_window > now) ratings[event.actor].push_back({record.bridge_id, at});
          break;
      }
    }

    *entry->capability.mutable_last_seen() = util::ToProto(last_seen);
    RecomputeReputation(*entry);
    entries.push_back(std::move(entry));
  }

  for (auto& [_, events] : ratings) {
    std::sort(events.begin(), events.end(), [](const auto& a, const auto& b) { return a.at < b.at; });
  }

  {
    std::unique_lock lock(index_mutex_);
    index_.clear();
    by_domain_.clear();
    by_freq_bucket_.clear();
    for (const auto& entry : entries) {
      IndexLocked(entry);
    }
  }
  {
    std::lock_guard lock(ratings_mutex_);
    ratings_by_rater_ = std::move(ratings);
  }

  SENSORWEAVE_LOG_INFO("registry hydrated", {IntField("bridges", static_cast<int64_t>(entries.size()))});
}

// ------------------------------------------------------------------
// Registration
// ------------------------------------------------------------------

BridgeCapability CapabilityRegistry::Register(const std::string& caller_id, const BridgeCapability& capability) {
  if (capability.bridge_id().empty()) throw util::InvalidArgument("register bridge: bridge_id is required");
  if (capability.owner().empty()) throw util::InvalidArgument("register bridge: owner is required");
  if (capability.max_sample_rate() == 0) throw util::InvalidArgument("register bridge: max_sample_rate must be positive");
  if (!std::isfinite(capability.freq_min_hz()) || !std::isfinite(capability.freq_max_hz())) {
    throw util::InvalidArgument("register bridge: frequency range must be finite");
  }
  if (!std::isfinite(capability.cost_per_ks()) || capability.cost_per_ks() < 0) {
    throw util::InvalidArgument("register bridge: cost_per_ks must be a finite non-negative number");
  }
  if (capability.freq_min_hz() < 0 || capability.freq_max_hz() < capability.freq_min_hz()) {
    throw util::InvalidArgument("register bridge: frequency range is inverted or negative");
  }
  if (capability.has_max_output_level()) ValidateOutputLevel(capability.max_output_level(), capability.domain());
  if (caller_id != capability.owner()) throw util::PermissionDenied("register bridge: caller is not the declared owner");

  const auto now = Now();

  auto stored = capability;
  stored.clear_reputation();
  stored.clear_last_seen();

  db::model::BridgeRecord record;
  record.bridge_id        = stored.bridge_id();
  record.owner            = stored.owner();
  record.capability       = stored.SerializeAsString();
  record.registered_at_ms = util::ToUnixMillis(now);

  auto entry        = std::make_shared<Entry>();
  entry->capability = stored;
  entry->capability.set_reputation(options_.initial_reputation);
  *entry->capability.mutable_last_seen() = util::ToProto(now);

  std::unique_lock lock(index_mutex_);
  if (index_.contains(record.bridge_id)) throw util::AlreadyExists("register bridge: " + record.bridge_id + " is already registered");

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertBridge(*tx, record), "register bridge");
  tx->Commit();

  IndexLocked(entry);

  SENSORWEAVE_LOG_INFO("bridge registered", {StringField("bridge_id", record.bridge_id), StringField("owner", record.owner),
                                             IntField("domain", static_cast<int64_t>(stored.domain()))});
  return entry->capability;
}

util::TimePoint CapabilityRegistry::Heartbeat(const std::string& caller_id, const std::string& bridge_id) {
  auto entry = Find(bridge_id);
  if (!entry) throw BridgeNotFound(bridge_id);

  {
    std::lock_guard lock(entry->mutex);
    if (entry->capability.owner() != caller_id) throw util::PermissionDenied("heartbeat: only the owner may heartbeat bridge " + bridge_id);
  }

  const auto now = Now();

  db::model::BridgeEventRecord event;
  event.bridge_id = bridge_id;
  event.kind      = db::model::BridgeEventKind::kHeartbeat;
  event.actor     = caller_id;
  event.at_ms     = util::ToUnixMillis(now);

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->AppendBridgeEvent(*tx, event), "heartbeat");
  db::ThrowIfDbError(repository_->TrimBridgeEvents(*tx, bridge_id, db::model::BridgeEventKind::kHeartbeat, options_.heartbeat_history),
                     "heartbeat trim");
  tx->Commit();

  std::lock_guard lock(entry->mutex);
  const auto      previous = util::FromProto(entry->capability.last_seen());
  const auto      latest   = std::max(previous, now);
  *entry->capability.mutable_last_seen() = util::ToProto(latest);
  return latest;
}

void CapabilityRegistry::Unregister(const std::string& caller_id, const std::string& bridge_id) {
  std::unique_lock lock(index_mutex_);

  auto it = index_.find(bridge_id);
  if (it == index_.end()) throw BridgeNotFound(bridge_id);

  BridgeCapability capability;
  {
    std::lock_guard entry_lock(it->second->mutex);
    capability = it->second->capability;
  }
  if (capability.owner() != caller_id) throw util::PermissionDenied("unregister: only the owner may remove bridge " + bridge_id);

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteBridge(*tx, bridge_id), "unregister bridge");
  tx->Commit();

  UnindexLocked(capability);
  SENSORWEAVE_LOG_INFO("bridge unregistered", {StringField("bridge_id", bridge_id)});
}

// ------------------------------------------------------------------
// Discovery
// ------------------------------------------------------------------

std::vector<ScoredBridge> CapabilityRegistry::Discover(const DiscoveryQuery& query) const {
  if (!std::isfinite(query.freq_min_hz()) || !std::isfinite(query.freq_max_hz())) {
    throw util::InvalidArgument("discover: frequency bounds must be finite");
  }
  const auto now = Now();

  std::vector<BridgeCapability> candidates;
  {
    std::shared_lock lock(index_mutex_);

    std::set<std::string> ids;
    if (query.domains_size() > 0) {
      for (auto domain : query.domains()) {
        if (auto it = by_domain_.find(domain); it != by_domain_.end()) ids.insert(it->second.begin(), it->second.end());
      }
    } else if (query.freq_max_hz() > 0) {
      auto first = by_freq_bucket_.lower_bound(FrequencyBucket(query.freq_min_hz()));
      auto last  = by_freq_bucket_.upper_bound(FrequencyBucket(query.freq_max_hz()));
      for (auto it = first; it != last; ++it) {
        ids.insert(it->second.begin(), it->second.end());
      }
    } else {
      for (const auto& [id, _] : index_) {
        ids.insert(id);
      }
    }

    candidates.reserve(ids.size());
    for (const auto& id : ids) {
      const auto&     entry = index_.at(id);
      std::lock_guard entry_lock(entry->mutex);
      candidates.push_back(entry->capability);
    }
  }

  std::vector<ScoredBridge> results;
  for (auto& capability : candidates) {
    if (now - util::FromProto(capability.last_seen()) > options_.heartbeat_window) continue;
    if (!MatchesQuery(capability, query)) continue;

    ScoredBridge scored;
    scored.set_score(Score(capability, now, options_.recency_half_life));
    *scored.mutable_capability() = std::move(capability);
    results.push_back(std::move(scored));
  }

  std::sort(results.begin(), results.end(), [](const ScoredBridge& a, const ScoredBridge& b) {
    if (a.score() != b.score()) return a.score() > b.score();
    return a.capability().bridge_id() < b.capability().bridge_id();
  });

  if (query.limit() > 0 && results.size() > query.limit()) results.resize(query.limit());
  return results;
}

BridgeCapability CapabilityRegistry::Get(const std::string& bridge_id) const {
  auto entry = Find(bridge_id);
  if (!entry) throw BridgeNotFound(bridge_id);

  std::lock_guard lock(entry->mutex);
  return entry->capability;
}

std::size_t CapabilityRegistry::Size() const {
  std::shared_lock lock(index_mutex_);
  return index_.size();
}

// ------------------------------------------------------------------
// Authentication
// ------------------------------------------------------------------

Challenge CapabilityRegistry::IssueChallenge(const std::string& requester_id, const std::string& bridge_id) {
  if (requester_id.empty()) throw util::InvalidArgument("issue challenge: requester_id is required");
  if (!Find(bridge_id)) throw BridgeNotFound(bridge_id);

  const auto now = Now();

  Challenge challenge;
  challenge.challenge_id = util::NewId();
  challenge.requester_id = requester_id;
  challenge.bridge_id    = bridge_id;
  challenge.nonce        = crypto::RandomBytes(32);
  challenge.timestamp_ms = util::ToUnixMillis(now);
  challenge.expires_at   = now + options_.challenge_ttl;

  challenges_.Insert(challenge);
  return challenge;
}

Challenge CapabilityRegistry::CompleteChallenge(const std::string& challenge_id, const std::string& signature) {
  auto challenge = challenges_.Take(challenge_id, Now());
  if (!challenge) throw AuthFailed("unknown, expired or already used challenge");

  auto entry = Find(challenge->bridge_id);
  if (!entry) throw AuthFailed("bridge no longer registered", challenge->bridge_id);

  std::string owner;
  {
    std::lock_guard lock(entry->mutex);
    owner = entry->capability.owner();
  }

  const auto public_key = identities_ ? identities_->PublicKeyFor(owner) : std::nullopt;
  if (!public_key) throw AuthFailed("no public key for owner " + owner, challenge->bridge_id);

  if (!crypto::VerifyEd25519(*public_key, ChallengeMessage(*challenge), signature)) {
    SENSORWEAVE_LOG_WARN("challenge signature rejected",
                         {StringField("bridge_id", challenge->bridge_id), StringField("requester_id", challenge->requester_id)});
    throw AuthFailed("signature does not verify", challenge->bridge_id);
  }
  return *challenge;
}

std::size_t CapabilityRegistry::PurgeExpiredChallenges() {
  return challenges_.PurgeExpired(Now());
}

// ------------------------------------------------------------------
// Reputation
// ------------------------------------------------------------------

uint32_t CapabilityRegistry::Rate(const std::string& rater_id, const std::string& bridge_id, uint32_t score) {
  if (rater_id.empty()) throw util::InvalidArgument("rate bridge: rater_id is required");
  if (score > kMaxScore) throw util::InvalidArgument("rate bridge: score must be within 0..100");

  auto entry = Find(bridge_id);
  if (!entry) throw BridgeNotFound(bridge_id);
  {
    std::lock_guard lock(entry->mutex);
    if (entry->capability.owner() == rater_id) throw util::PermissionDenied("rate bridge: owners may not rate their own bridge");
  }

  const auto now = Now();

  std::lock_guard ratings_lock(ratings_mutex_);
  auto&           history = ratings_by_rater_[rater_id];
  PruneRatings(history, now);

  const bool rated_this_bridge = std::any_of(history.begin(), history.end(), [&](const RatingEvent& e) { return e.bridge_id == bridge_id; });
  if (rated_this_bridge) {
    throw util::DiscoveryError(util::DiscoveryErrorCode::kRateLimited, "rater already rated this bridge in the current window", {.bridge_id = bridge_id});
  }
  if (history.size() >= options_.max_ratings_per_window) {
    throw util::DiscoveryError(util::DiscoveryErrorCode::kRateLimited, "rater exceeded ratings per window", {.bridge_id = bridge_id});
  }

  db::model::BridgeEventRecord event;
  event.bridge_id = bridge_id;
  event.kind      = db::model::BridgeEventKind::kRating;
  event.actor     = rater_id;
  event.value     = score;
  event.at_ms     = util::ToUnixMillis(now);

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->AppendBridgeEvent(*tx, event), "rate bridge");
  tx->Commit();

  history.push_back({bridge_id, now});

  std::lock_guard lock(entry->mutex);
  entry->latest_ratings[rater_id] = static_cast<int>(score);
  RecomputeReputation(*entry);
  return entry->capability.reputation();
}

// ------------------------------------------------------------------
// Advertised streams
// ------------------------------------------------------------------

StreamDescriptor CapabilityRegistry::RegisterStream(const std::string& caller_id, const StreamDescriptor& descriptor) {
  if (descriptor.sample_rate() == 0 || descriptor.sample_rate() > kMaxStreamRate) {
    throw util::InvalidArgument("register stream: sample_rate must be within 1..1000000");
  }
  if (descriptor.buffer_size() == 0) throw util::InvalidArgument("register stream: buffer_size must be positive");

  auto entry = Find(descriptor.bridge_id());
  if (!entry) throw BridgeNotFound(descriptor.bridge_id());

  auto stored = descriptor;
  {
    std::lock_guard lock(entry->mutex);
    if (entry->capability.owner() != caller_id) throw util::PermissionDenied("register stream: only the owner may advertise streams");
    if (stored.domain() == SENSING_DOMAIN_UNSPECIFIED) stored.set_domain(entry->capability.domain());
  }
  if (stored.stream_id().empty()) stored.set_stream_id(util::NewId());

  db::model::StreamRecord record;
  record.stream_id     = stored.stream_id();
  record.bridge_id     = stored.bridge_id();
  record.descriptor    = stored.SerializeAsString();
  record.created_at_ms = util::ToUnixMillis(Now());

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertStream(*tx, record), "register stream");
  tx->Commit();
  return stored;
}

std::vector<StreamDescriptor> CapabilityRegistry::ListStreams(const std::string& bridge_id) const {
  if (!Find(bridge_id)) throw BridgeNotFound(bridge_id);

  auto tx      = repository_->Begin();
  auto records = repository_->ListStreams(*tx, bridge_id);
  tx->Commit();

  std::vector<StreamDescriptor> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    StreamDescriptor descriptor;
    if (!descriptor.ParseFromString(record.descriptor)) throw std::runtime_error("list streams: corrupt descriptor " + record.stream_id);
    out.push_back(std::move(descriptor));
  }
  return out;
}

} // namespace sensorweave::registry
