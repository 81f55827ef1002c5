#include "identity_directory.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace sensorweave::identity {

void InMemoryIdentityDirectory::Put(const std::string& identity, std::string public_key) {
  if (identity.empty()) {
    throw util::InvalidArgument("identity must not be empty");
  }
  if (public_key.size() != 32) {
    throw util::InvalidArgument("ed25519 public key must be 32 bytes for identity " + identity);
  }
  std::unique_lock lock(mutex_);
  keys_[identity] = std::move(public_key);
}

void InMemoryIdentityDirectory::Remove(const std::string& identity) {
  std::unique_lock lock(mutex_);
  keys_.erase(identity);
}

std::optional<std::string> InMemoryIdentityDirectory::PublicKeyFor(const std::string& identity) const {
  std::shared_lock lock(mutex_);
  auto             it = keys_.find(identity);
  if (it == keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace sensorweave::identity
