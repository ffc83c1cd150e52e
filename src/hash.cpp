#include "nexus/hash.hpp"

// Hash authority for the toolkit.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the internal fingerprint primitive. Domain separation via
//      prefix: "nexus.dag:", "nexus.dfa:", "nexus.replay:" are part of the
//      fingerprint schema.
//   2. SHA-256 is used only where a protocol fixes it.
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) for nibble
// encoding instead of snprintf("%02x").

#include <array>
#include <cstring>

#include <openssl/evp.h>
#include <openssl/sha.h>

extern "C" {
#include <blake3.h>
}

namespace nexus {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";
constexpr char kB64[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Decode a single hex character to its nibble value.
// Returns 0xFF on invalid character.
inline uint8_t hex_nibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
  return 0xFF;
}

// Returns 0xFF on a character outside the standard alphabet.
inline uint8_t b64_value(char c) {
  if (c >= 'A' && c <= 'Z') return static_cast<uint8_t>(c - 'A');
  if (c >= 'a' && c <= 'z') return static_cast<uint8_t>(c - 'a' + 26);
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0' + 52);
  if (c == '+') return 62;
  if (c == '/') return 63;
  return 0xFF;
}

std::string blake3_raw(std::string_view a, std::string_view b) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, a.data(), a.size());
  blake3_hasher_update(&hasher, b.data(), b.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return std::string(reinterpret_cast<char*>(out.data()), out.size());
}

// Strict decoder over the standard alphabet. Padding is optional but, when
// present, must complete the final quantum.
std::optional<std::string> decode_standard(std::string_view text) {
  size_t len = text.size();
  size_t pad = 0;
  while (len > 0 && text[len - 1] == '=') {
    --len;
    ++pad;
  }
  if (pad > 2) return std::nullopt;
  if (pad > 0 && (len + pad) % 4 != 0) return std::nullopt;
  if (len % 4 == 1) return std::nullopt;

  std::string out;
  out.reserve(len * 3 / 4);
  uint32_t acc = 0;
  int bits = 0;
  for (size_t i = 0; i < len; ++i) {
    const uint8_t v = b64_value(text[i]);
    if (v == 0xFF) return std::nullopt;
    acc = (acc << 6) | v;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out += static_cast<char>((acc >> bits) & 0xFF);
    }
  }
  // Non-canonical trailing bits are rejected.
  if (bits > 0 && (acc & ((1u << bits) - 1)) != 0) return std::nullopt;
  return out;
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  return to_hex(blake3_raw(payload, {}));
}

std::string hash_bytes_blake3(std::string_view payload) {
  return blake3_raw(payload, {});
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return to_hex(blake3_raw(domain, payload));
}

std::string blake3_version_string() {
  const char* ver = blake3_version();
  return ver ? ver : "unknown";
}

Digest32 sha256(std::string_view payload) {
  Digest32 out{};
  SHA256(reinterpret_cast<const unsigned char*>(payload.data()), payload.size(), out.data());
  return out;
}

std::string sha256_hex(std::string_view payload) {
  return to_hex(sha256(payload));
}

std::string to_hex(std::string_view bytes) {
  std::string out;
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    const auto b = static_cast<unsigned char>(bytes[i]);
    out[i * 2]     = kHexChars[b >> 4];
    out[i * 2 + 1] = kHexChars[b & 0x0f];
  }
  return out;
}

std::string to_hex(const Digest32& digest) {
  return to_hex(as_view(digest));
}

std::optional<std::string> from_hex(std::string_view hex) {
  if (hex.size() % 2 != 0) return std::nullopt;
  std::string out;
  out.resize(hex.size() / 2);
  for (size_t i = 0; i < out.size(); ++i) {
    const uint8_t hi = hex_nibble(hex[i * 2]);
    const uint8_t lo = hex_nibble(hex[i * 2 + 1]);
    if (hi == 0xFF || lo == 0xFF) return std::nullopt;
    out[i] = static_cast<char>((hi << 4) | lo);
  }
  return out;
}

bool is_lower_hex(std::string_view s) {
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

std::string base64_encode(std::string_view bytes) {
  if (bytes.empty()) return {};
  // EVP_EncodeBlock writes 4 * ceil(n / 3) chars plus a NUL.
  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(bytes.data()),
                                static_cast<int>(bytes.size()));
  out.resize(n > 0 ? static_cast<size_t>(n) : 0);
  return out;
}

std::optional<std::string> base64_decode(std::string_view text) {
  return decode_standard(text);
}

std::string base64url_encode(std::string_view bytes) {
  std::string out = base64_encode(bytes);
  while (!out.empty() && out.back() == '=') out.pop_back();
  for (char& c : out) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  return out;
}

std::optional<std::string> base64url_decode(std::string_view text) {
  std::string std_alpha(text);
  for (char& c : std_alpha) {
    if (c == '-') c = '+';
    else if (c == '_') c = '/';
    else if (c == '+' || c == '/' || c == '=') return std::nullopt;
  }
  return decode_standard(std_alpha);
}

std::optional<std::string> base64_decode_any(std::string_view text) {
  if (auto v = decode_standard(text)) return v;
  return base64url_decode(text);
}

std::string_view as_view(const Digest32& digest) {
  return std::string_view(reinterpret_cast<const char*>(digest.data()), digest.size());
}

}  // namespace nexus
