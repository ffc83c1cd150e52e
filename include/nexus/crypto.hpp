#pragma once

// nexus/crypto.hpp: Ed25519 signatures, AES-256-GCM and the CSPRNG.
//
// All primitives are OpenSSL EVP calls. Keys are raw 32-byte values; nothing
// here touches a keystore.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "nexus/types.hpp"

namespace nexus::crypto {

constexpr std::size_t kEd25519SignatureLen = 64;
constexpr std::size_t kAesGcmNonceLen = 12;
constexpr std::size_t kAesGcmTagLen = 16;

// Fills `len` bytes from the OpenSSL DRBG. Returns false if the DRBG is not
// seeded.
bool random_bytes(std::uint8_t* out, std::size_t len);
std::string random_string(std::size_t len);

// Zero a buffer in a way the optimiser cannot elide.
void secure_zero(void* ptr, std::size_t len);

// ---------------------------------------------------------------------------
// Ed25519
// ---------------------------------------------------------------------------
class SigningKey {
 public:
  SigningKey() = default;
  explicit SigningKey(const Key32& seed) : seed_(seed) {}
  SigningKey(const SigningKey&) = default;
  SigningKey& operator=(const SigningKey&) = default;
  ~SigningKey();

  // nullopt if the DRBG cannot produce a seed.
  static std::optional<SigningKey> generate();

  const Key32& seed() const { return seed_; }
  // Derived public key; nullopt only if OpenSSL rejects the seed.
  std::optional<Key32> public_key() const;
  // 64-byte signature; empty on OpenSSL failure.
  std::string sign(std::string_view message) const;

 private:
  Key32 seed_{};
};

bool ed25519_verify(const Key32& public_key, std::string_view message, std::string_view signature);

// True if the 32 bytes decode to a usable Ed25519 public key.
bool ed25519_public_key_valid(const Key32& public_key);

// ---------------------------------------------------------------------------
// AES-256-GCM
// ---------------------------------------------------------------------------
// seal: returns ciphertext || tag. open: returns plaintext, nullopt on tag
// mismatch or malformed input.
std::optional<std::string> aes256gcm_seal(const Key32& key, const std::array<std::uint8_t, kAesGcmNonceLen>& nonce,
                                          std::string_view plaintext);
std::optional<std::string> aes256gcm_open(const Key32& key, const std::array<std::uint8_t, kAesGcmNonceLen>& nonce,
                                          std::string_view ciphertext_and_tag);

}  // namespace nexus::crypto
