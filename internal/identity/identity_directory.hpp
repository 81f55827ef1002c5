#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace sensorweave::identity {

/*
  Resolves an agent or owner identity to its Ed25519 public key.

  Backed by the external identity substrate in production; the in-memory
  directory serves single-node deployments and tests.
*/
class IdentityDirectory {
 public:
  virtual ~IdentityDirectory() = default;

  virtual std::optional<std::string> PublicKeyFor(const std::string& identity) const = 0;
};

class InMemoryIdentityDirectory final : public IdentityDirectory {
 public:
  void Put(const std::string& identity, std::string public_key);
  void Remove(const std::string& identity);

  std::optional<std::string> PublicKeyFor(const std::string& identity) const override;

 private:
  mutable std::shared_mutex                    mutex_;
  std::unordered_map<std::string, std::string> keys_;
};

} // namespace sensorweave::identity
