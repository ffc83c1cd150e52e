#pragma once

// nexus/secret_store.hpp: At-rest secret envelope.
//
// FORMAT (v1), one UTF-8 string:
//   plain:v1:<base64(codec bytes)>
//   enc:v1:<base64(nonce(12) || ciphertext || tag(16))>
//
// DESIGN:
//   StoredSecret<T, Codec> holds a plaintext value in memory and renders it
//   as a single envelope string, so it can be embedded in any config format.
//   The KeyProvider decides whether a write encrypts: a key means AES-256-GCM
//   with a fresh random nonce, no key means plaintext.
//
// INVARIANT:
//   Opening an enc: envelope without any key fails with
//   secret_key_unavailable. It never falls back to plaintext.
//   No key id and no AAD are recorded in the envelope.
//
// EXTENSION_POINT: key_rotation
//   RotatingKeyProvider seals under the current key and tries the previous
//   keys on open, so envelopes written before a rotation keep opening until
//   they are rewritten.

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "nexus/jsonlite.hpp"
#include "nexus/types.hpp"

namespace nexus::secrets {

inline constexpr std::string_view kPlainPrefix = "plain:v1:";
inline constexpr std::string_view kEncPrefix = "enc:v1:";

// ---------------------------------------------------------------------------
// KeyProvider
// ---------------------------------------------------------------------------
// key() returns the current key, or nullopt when the provider opts into
// plaintext storage. A provider that fails operationally returns nullopt and
// fills *error with secret_provider.
class KeyProvider {
 public:
  virtual ~KeyProvider() = default;
  virtual std::optional<Key32> key(Error* error) const = 0;
  // Decrypt-only keys, tried in order after key().
  virtual std::vector<Key32> fallback_keys() const { return {}; }
  virtual std::string name() const = 0;
};

class NoKeyProvider final : public KeyProvider {
 public:
  std::optional<Key32> key(Error*) const override { return std::nullopt; }
  std::string name() const override { return "none"; }
};

class StaticKeyProvider final : public KeyProvider {
 public:
  explicit StaticKeyProvider(const Key32& key) : key_(key) {}
  ~StaticKeyProvider() override;
  std::optional<Key32> key(Error*) const override { return key_; }
  std::string name() const override { return "static"; }

 private:
  Key32 key_;
};

class RotatingKeyProvider final : public KeyProvider {
 public:
  RotatingKeyProvider(const Key32& current, std::vector<Key32> previous)
      : current_(current), previous_(std::move(previous)) {}
  ~RotatingKeyProvider() override;
  std::optional<Key32> key(Error*) const override { return current_; }
  std::vector<Key32> fallback_keys() const override { return previous_; }
  std::string name() const override { return "rotating"; }

 private:
  Key32 current_;
  std::vector<Key32> previous_;
};

// Reads a hex-encoded 32-byte key from an environment variable on every
// call. An unset or empty variable means no key; a malformed value is a
// provider failure.
class EnvKeyProvider final : public KeyProvider {
 public:
  explicit EnvKeyProvider(std::string variable) : variable_(std::move(variable)) {}
  std::optional<Key32> key(Error* error) const override;
  std::string name() const override { return "env:" + variable_; }

 private:
  std::string variable_;
};

// ---------------------------------------------------------------------------
// Codecs (static policy types)
// ---------------------------------------------------------------------------
struct BytesCodec {
  using value_type = std::string;
  static std::optional<std::string> encode(const std::string& value, Error*) { return value; }
  static std::optional<std::string> decode(std::string_view bytes, Error*) { return std::string(bytes); }
};

// Canonical (key-sorted, compact) JSON text.
struct JsonCodec {
  using value_type = jsonlite::Value;
  static std::optional<std::string> encode(const jsonlite::Value& value, Error* error);
  static std::optional<jsonlite::Value> decode(std::string_view bytes, Error* error);
};

// ---------------------------------------------------------------------------
// Envelope primitives
// ---------------------------------------------------------------------------
std::optional<std::string> seal_envelope(std::string_view bytes, const KeyProvider& provider,
                                         Error* error = nullptr);
std::optional<std::string> open_envelope(std::string_view envelope, const KeyProvider& provider,
                                         Error* error = nullptr);

bool is_encrypted_envelope(std::string_view envelope);

// ---------------------------------------------------------------------------
// StoredSecret
// ---------------------------------------------------------------------------
template <class T, class Codec>
class StoredSecret {
 public:
  StoredSecret() = default;
  explicit StoredSecret(T value) : value_(std::move(value)) {}

  const T& value() const { return value_; }
  T& value() { return value_; }
  T into_inner() && { return std::move(value_); }

  std::optional<std::string> serialize(const KeyProvider& provider, Error* error = nullptr) const {
    auto bytes = Codec::encode(value_, error);
    if (!bytes) return std::nullopt;
    return seal_envelope(*bytes, provider, error);
  }

  static std::optional<StoredSecret> deserialize(std::string_view envelope, const KeyProvider& provider,
                                                 Error* error = nullptr) {
    auto bytes = open_envelope(envelope, provider, error);
    if (!bytes) return std::nullopt;
    auto value = Codec::decode(*bytes, error);
    if (!value) return std::nullopt;
    return StoredSecret(std::move(*value));
  }

  bool operator==(const StoredSecret& other) const { return value_ == other.value_; }

  friend std::ostream& operator<<(std::ostream& os, const StoredSecret&) { return os << "[REDACTED]"; }

 private:
  T value_{};
};

using JsonSecret = StoredSecret<jsonlite::Value, JsonCodec>;
using BytesSecret = StoredSecret<std::string, BytesCodec>;

}  // namespace nexus::secrets
