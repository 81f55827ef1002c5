#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sensorweave::crypto {

/*
  OpenSSL-backed primitives.

  Keys and signatures are raw byte strings:
    Ed25519 public key  32 bytes
    Ed25519 private key 32 bytes (seed)
    signature           64 bytes

  Failures inside OpenSSL throw std::runtime_error. A signature that does
  not verify is not an error: VerifyEd25519 returns false.
*/

std::string RandomBytes(std::size_t size);
void        RandomFill(void* out, std::size_t size);

std::string Sha256(std::string_view data);
std::string Sha256Hex(std::string_view data);
std::string ToHex(std::string_view bytes);
// throws std::invalid_argument on malformed input
std::string FromHex(std::string_view hex);

struct Ed25519KeyPair {
  std::string public_key;
  std::string private_key;
};

Ed25519KeyPair GenerateEd25519KeyPair();

std::string SignEd25519(const std::string& private_key, std::string_view message);
bool        VerifyEd25519(const std::string& public_key, std::string_view message, std::string_view signature);

} // namespace sensorweave::crypto
