#include "crypto.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <stdexcept>

namespace sensorweave::crypto {

namespace {

constexpr std::size_t kEd25519KeySize       = 32;
constexpr std::size_t kEd25519SignatureSize = 64;

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
  }
};

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const {
    EVP_PKEY_CTX_free(ctx);
  }
};

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using PkeyPtr    = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr   = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

[[noreturn]] void ThrowOpenSsl(const char* what) {
  char buf[256] = {0};
  ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
  throw std::runtime_error(std::string(what) + ": " + buf);
}

const unsigned char* Bytes(std::string_view data) {
  return reinterpret_cast<const unsigned char*>(data.data());
}

} // namespace

void RandomFill(void* out, std::size_t size) {
  auto* cursor = static_cast<unsigned char*>(out);
  while (size > 0) {
    const auto chunk = static_cast<int>(std::min<std::size_t>(size, static_cast<std::size_t>(std::numeric_limits<int>::max())));
    if (RAND_bytes(cursor, chunk) != 1) {
      ThrowOpenSsl("RAND_bytes");
    }
    cursor += chunk;
    size -= static_cast<std::size_t>(chunk);
  }
}

std::string RandomBytes(std::size_t size) {
  std::string out(size, '\0');
  RandomFill(out.data(), size);
  return out;
}

std::string Sha256(std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    ThrowOpenSsl("EVP_Digest");
  }
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string ToHex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (unsigned char b : bytes) {
    out.push_back(kHex[(b >> 4) & 0x0F]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::string FromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("hex string has odd length");
  }
  const auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    throw std::invalid_argument("invalid hex digit");
  };
  std::string out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    out.push_back(static_cast<char>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
  }
  return out;
}

std::string Sha256Hex(std::string_view data) {
  return ToHex(Sha256(data));
}

Ed25519KeyPair GenerateEd25519KeyPair() {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    ThrowOpenSsl("EVP_PKEY_keygen_init");
  }

  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    ThrowOpenSsl("EVP_PKEY_keygen");
  }
  PkeyPtr key(raw);

  Ed25519KeyPair pair;
  pair.public_key.resize(kEd25519KeySize);
  pair.private_key.resize(kEd25519KeySize);

  std::size_t pub_len  = pair.public_key.size();
  std::size_t priv_len = pair.private_key.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), reinterpret_cast<unsigned char*>(pair.public_key.data()), &pub_len) != 1 ||
      EVP_PKEY_get_raw_private_key(key.get(), reinterpret_cast<unsigned char*>(pair.private_key.data()), &priv_len) != 1) {
    ThrowOpenSsl("EVP_PKEY_get_raw_key");
  }
  return pair;
}

std::string SignEd25519(const std::string& private_key, std::string_view message) {
  if (private_key.size() != kEd25519KeySize) {
    throw std::runtime_error("ed25519 private key must be 32 bytes");
  }

  PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, Bytes(private_key), private_key.size()));
  if (!key) {
    ThrowOpenSsl("EVP_PKEY_new_raw_private_key");
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    ThrowOpenSsl("EVP_DigestSignInit");
  }

  std::string signature(kEd25519SignatureSize, '\0');
  std::size_t sig_len = signature.size();
  if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(signature.data()), &sig_len, Bytes(message), message.size()) != 1) {
    ThrowOpenSsl("EVP_DigestSign");
  }
  signature.resize(sig_len);
  return signature;
}

bool VerifyEd25519(const std::string& public_key, std::string_view message, std::string_view signature) {
  if (public_key.size() != kEd25519KeySize || signature.size() != kEd25519SignatureSize) {
    return false;
  }

  PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, Bytes(public_key), public_key.size()));
  if (!key) {
    return false;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    ThrowOpenSsl("EVP_DigestVerifyInit");
  }

  const int rc = EVP_DigestVerify(ctx.get(), Bytes(signature), signature.size(), Bytes(message), message.size());
  if (rc != 1) {
    ERR_clear_error();
    return false;
  }
  return true;
}

} // namespace sensorweave::crypto
