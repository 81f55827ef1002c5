#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/crypto/crypto.hpp"

namespace {

using namespace sensorweave::crypto;

// RFC 8032 section 7.1, test 1
constexpr const char* kSecretHex = "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
constexpr const char* kPublicHex = "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";
constexpr const char* kSignatureHex =
    "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b";

void TestSha256KnownAnswers() {
  assert(Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(Sha256("abc").size() == 32);
}

void TestHexRoundTripAndRejects() {
  const std::string bytes("\x00\x7f\x80\xff", 4);
  assert(ToHex(bytes) == "007f80ff");
  assert(FromHex("007f80ff") == bytes);
  assert(FromHex("007F80FF") == bytes);
  assert(FromHex("").empty());

  for (const char* bad : {"abc", "zz", "0g"}) {
    bool threw = false;
    try {
      FromHex(bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestEd25519KnownVector() {
  const auto secret    = FromHex(kSecretHex);
  const auto public_key = FromHex(kPublicHex);

  const auto signature = SignEd25519(secret, "");
  assert(ToHex(signature) == kSignatureHex);
  assert(VerifyEd25519(public_key, "", signature));
  assert(!VerifyEd25519(public_key, "x", signature));
}

void TestEd25519GeneratedKeys() {
  const auto keys = GenerateEd25519KeyPair();
  assert(keys.public_key.size() == 32);
  assert(keys.private_key.size() == 32);

  const std::string challenge = RandomBytes(32);
  const auto        signature = SignEd25519(keys.private_key, challenge);
  assert(signature.size() == 64);
  assert(VerifyEd25519(keys.public_key, challenge, signature));

  auto tampered = signature;
  tampered[0] ^= 0x01;
  assert(!VerifyEd25519(keys.public_key, challenge, tampered));

  const auto other = GenerateEd25519KeyPair();
  assert(!VerifyEd25519(other.public_key, challenge, signature));

  // malformed keys and signatures do not verify
  assert(!VerifyEd25519("short", challenge, signature));
  assert(!VerifyEd25519(keys.public_key, challenge, "short"));
}

void TestRandomBytes() {
  const auto a = RandomBytes(32);
  const auto b = RandomBytes(32);
  assert(a.size() == 32);
  assert(a != b);
  assert(RandomBytes(0).empty());
}

} // namespace

int main() {
  TestSha256KnownAnswers();
  TestHexRoundTripAndRejects();
  TestEd25519KnownVector();
  TestEd25519GeneratedKeys();
  TestRandomBytes();
  std::cout << "crypto_test: pass" << std::endl;
  return 0;
}
