#include "nexus/secret_store.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>

#include "nexus/crypto.hpp"
#include "nexus/hash.hpp"
#include "nexus/observability.hpp"

namespace nexus::secrets {
namespace {

using Nonce = std::array<std::uint8_t, crypto::kAesGcmNonceLen>;

void emit(const char* action, bool ok, ErrorCode code, const std::string& provider, size_t bytes) {
  ToolkitEvent ev;
  ev.component = "secret_store";
  ev.action = action;
  ev.subject = provider;
  ev.ok = ok;
  ev.error = code;
  ev.bytes = bytes;
  emit_toolkit_event(ev);
}

std::optional<std::string> fail(Error* error, ErrorCode code, std::string message, const char* action,
                                const KeyProvider& provider) {
  emit(action, false, code, provider.name(), 0);
  set_error(error, code, std::move(message));
  return std::nullopt;
}

}  // namespace

StaticKeyProvider::~StaticKeyProvider() {
  crypto::secure_zero(key_.data(), key_.size());
}

RotatingKeyProvider::~RotatingKeyProvider() {
  crypto::secure_zero(current_.data(), current_.size());
  for (auto& k : previous_) crypto::secure_zero(k.data(), k.size());
}

std::optional<Key32> EnvKeyProvider::key(Error* error) const {
  const char* raw = std::getenv(variable_.c_str());
  if (!raw || !raw[0]) return std::nullopt;
  auto bytes = from_hex(raw);
  if (!bytes) {
    set_error(error, ErrorCode::secret_provider, variable_ + ": hex decode error");
    return std::nullopt;
  }
  if (bytes->size() != Key32{}.size()) {
    set_error(error, ErrorCode::secret_provider,
              variable_ + ": invalid master key length (expected 32 bytes, got " +
                  std::to_string(bytes->size()) + ")");
    crypto::secure_zero(bytes->data(), bytes->size());
    return std::nullopt;
  }
  Key32 out{};
  std::copy(bytes->begin(), bytes->end(), out.begin());
  crypto::secure_zero(bytes->data(), bytes->size());
  return out;
}

std::optional<std::string> JsonCodec::encode(const jsonlite::Value& value, Error*) {
  return jsonlite::to_json(value);
}

std::optional<jsonlite::Value> JsonCodec::decode(std::string_view bytes, Error* error) {
  std::optional<jsonlite::JsonError> jerr;
  jsonlite::Value v = jsonlite::parse_value(std::string(bytes), &jerr);
  if (jerr) {
    set_error(error, ErrorCode::secret_codec, "codec error: " + jerr->message);
    return std::nullopt;
  }
  return v;
}

bool is_encrypted_envelope(std::string_view envelope) {
  return envelope.substr(0, kEncPrefix.size()) == kEncPrefix;
}

std::optional<std::string> seal_envelope(std::string_view bytes, const KeyProvider& provider, Error* error) {
  Error provider_error;
  auto key = provider.key(&provider_error);
  if (provider_error.code != ErrorCode::none) {
    return fail(error, provider_error.code, "key provider failure: " + provider_error.message, "seal", provider);
  }
  if (!key) {
    emit("seal", true, ErrorCode::none, provider.name(), bytes.size());
    return std::string(kPlainPrefix) + base64_encode(bytes);
  }

  Nonce nonce{};
  if (!crypto::random_bytes(nonce.data(), nonce.size())) {
    crypto::secure_zero(key->data(), key->size());
    return fail(error, ErrorCode::secret_crypto, "cryptography failure: nonce generation", "seal", provider);
  }
  auto sealed = crypto::aes256gcm_seal(*key, nonce, bytes);
  crypto::secure_zero(key->data(), key->size());
  if (!sealed) {
    return fail(error, ErrorCode::secret_crypto, "cryptography failure: encrypt", "seal", provider);
  }

  std::string blob;
  blob.reserve(nonce.size() + sealed->size());
  blob.append(reinterpret_cast<const char*>(nonce.data()), nonce.size());
  blob += *sealed;
  emit("seal", true, ErrorCode::none, provider.name(), bytes.size());
  return std::string(kEncPrefix) + base64_encode(blob);
}

std::optional<std::string> open_envelope(std::string_view envelope, const KeyProvider& provider, Error* error) {
  if (envelope.substr(0, kPlainPrefix.size()) == kPlainPrefix) {
    auto bytes = base64_decode(envelope.substr(kPlainPrefix.size()));
    if (!bytes) return fail(error, ErrorCode::secret_base64, "base64 decode error", "open", provider);
    emit("open", true, ErrorCode::none, provider.name(), bytes->size());
    return bytes;
  }
  if (!is_encrypted_envelope(envelope)) {
    return fail(error, ErrorCode::secret_unknown_prefix, "unknown secret envelope prefix", "open", provider);
  }

  auto blob = base64_decode(envelope.substr(kEncPrefix.size()));
  if (!blob) return fail(error, ErrorCode::secret_base64, "base64 decode error", "open", provider);
  if (blob->size() < crypto::kAesGcmNonceLen + crypto::kAesGcmTagLen) {
    return fail(error, ErrorCode::secret_crypto, "cryptography failure: ciphertext too short", "open", provider);
  }

  Error provider_error;
  auto current = provider.key(&provider_error);
  if (provider_error.code != ErrorCode::none) {
    return fail(error, provider_error.code, "key provider failure: " + provider_error.message, "open", provider);
  }
  std::vector<Key32> candidates;
  if (current) candidates.push_back(*current);
  for (const auto& k : provider.fallback_keys()) candidates.push_back(k);
  if (candidates.empty()) {
    return fail(error, ErrorCode::secret_key_unavailable, "encryption key unavailable", "open", provider);
  }

  Nonce nonce{};
  std::copy(blob->begin(), blob->begin() + nonce.size(), nonce.begin());
  const std::string_view sealed = std::string_view(*blob).substr(nonce.size());

  std::optional<std::string> plain;
  for (const auto& k : candidates) {
    plain = crypto::aes256gcm_open(k, nonce, sealed);
    if (plain) break;
  }
  for (auto& k : candidates) crypto::secure_zero(k.data(), k.size());
  if (current) crypto::secure_zero(current->data(), current->size());
  if (!plain) {
    return fail(error, ErrorCode::secret_crypto, "cryptography failure: authentication failed", "open", provider);
  }
  emit("open", true, ErrorCode::none, provider.name(), plain->size());
  return plain;
}

}  // namespace nexus::secrets
