#include "challenge_table.hpp"

namespace sensorweave::registry {

std::string ChallengeMessage(const Challenge& challenge) {
  std::string message = challenge.nonce;
  for (int i = 0; i < 8; ++i) {
    message.push_back(static_cast<char>((challenge.timestamp_ms >> (8 * i)) & 0xff));
  }
  message += challenge.requester_id;
  return message;
}

bool ChallengeTable::IsExpired(const Challenge& challenge, util::TimePoint now) {
  return challenge.expires_at <= now;
}

void ChallengeTable::Insert(const Challenge& challenge) {
  std::lock_guard lock(mutex_);
  challenges_[challenge.challenge_id] = challenge;
}

std::optional<Challenge> ChallengeTable::Take(const std::string& challenge_id, util::TimePoint now) {
  std::lock_guard lock(mutex_);

  auto it = challenges_.find(challenge_id);
  if (it == challenges_.end()) return std::nullopt;

  Challenge challenge = std::move(it->second);
  challenges_.erase(it);
  if (IsExpired(challenge, now)) return std::nullopt;
  return challenge;
}

std::size_t ChallengeTable::PurgeExpired(util::TimePoint now) {
  std::lock_guard lock(mutex_);

  std::size_t purged = 0;
  for (auto it = challenges_.begin(); it != challenges_.end();) {
    if (IsExpired(it->second, now)) {
      it = challenges_.erase(it);
      ++purged;
    } else {
      ++it;
    }
  }
  return purged;
}

std::size_t ChallengeTable::Size() const {
  std::lock_guard lock(mutex_);
  return challenges_.size();
}

} // namespace sensorweave::registry
