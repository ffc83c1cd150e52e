#pragma once

// nexus/hash.hpp: Digests and byte encodings.
//
// DESIGN:
//   Two hash primitives with disjoint jobs:
//     - BLAKE3 for internal fingerprints that never leave the process or the
//       local disk (DAG/DFA fingerprints, replay-store request hashes). Always
//       domain separated via hash_domain().
//     - SHA-256 for wire-visible digests fixed by the protocols
//       (signed-HTTP body_sha256, req_sig_input_sha256, circuit digests).
//
// INVARIANT:
//   Domain prefixes are part of the fingerprint schema. Changing one changes
//   every stored fingerprint of that domain.

#include <optional>
#include <string>
#include <string_view>

#include "nexus/types.hpp"

namespace nexus {

// BLAKE3
std::string blake3_hex(std::string_view payload);
std::string hash_bytes_blake3(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string blake3_version_string();

// SHA-256 (OpenSSL)
Digest32 sha256(std::string_view payload);
std::string sha256_hex(std::string_view payload);

// Hex, lowercase on output, either case accepted on input.
std::string to_hex(std::string_view bytes);
std::string to_hex(const Digest32& digest);
std::optional<std::string> from_hex(std::string_view hex);
bool is_lower_hex(std::string_view s);

// Base64. The standard alphabet pads; the url-safe variant used in signed-HTTP
// headers never pads.
std::string base64_encode(std::string_view bytes);
std::optional<std::string> base64_decode(std::string_view text);
std::string base64url_encode(std::string_view bytes);
std::optional<std::string> base64url_decode(std::string_view text);
// Accepts standard, unpadded standard and url-safe input.
std::optional<std::string> base64_decode_any(std::string_view text);

std::string_view as_view(const Digest32& digest);

}  // namespace nexus
