#pragma once

// nexus/signed_http.hpp: Signed-HTTP v1 wire format.
//
// WIRE:
//   X-Nexus-Sig-V      "1"
//   X-Nexus-Sig-Input  base64url (no pad) of the claims JSON
//   X-Nexus-Sig        base64url (no pad) of the Ed25519 signature over
//                      domain || sig_input, domain one of
//                        "nexus.leader_tool.request.v1."
//                        "nexus.leader_tool.response.v1."
//
//   Claims are compact JSON with a fixed field order:
//     request:  leader_id, leader_kid, tool_id, iat_ms, exp_ms, nonce,
//               method, path, query, body_sha256
//     response: tool_id, tool_kid, iat_ms, exp_ms, nonce,
//               req_sig_input_sha256, status, body_sha256
//   Digests are lowercase hex SHA-256. Times are ms since the Unix epoch.
//
// INVARIANT:
//   Signatures cover the exact sig_input bytes received; claims are never
//   re-serialized before verification.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "nexus/crypto.hpp"
#include "nexus/jsonlite.hpp"
#include "nexus/types.hpp"

namespace nexus::signed_http {

constexpr std::string_view kHeaderSigVersion = "X-Nexus-Sig-V";
constexpr std::string_view kHeaderSigInput = "X-Nexus-Sig-Input";
constexpr std::string_view kHeaderSig = "X-Nexus-Sig";
constexpr std::string_view kSigVersionV1 = "1";

constexpr std::string_view kDomainRequestV1 = "nexus.leader_tool.request.v1.";
constexpr std::string_view kDomainResponseV1 = "nexus.leader_tool.response.v1.";

constexpr std::uint64_t kDefaultMaxClockSkewMs = 30000;
constexpr std::uint64_t kDefaultMaxValidityMs = 60000;

// ---------------------------------------------------------------------------
// Keys
// ---------------------------------------------------------------------------
// Accepts hex (64 chars, optional 0x), or standard/url base64 with or without
// padding, of 32 raw bytes or of 0x00 || 32 bytes (scheme-flagged keytool
// format).
std::optional<crypto::SigningKey> parse_signing_key(std::string_view text, Error* error = nullptr);

// ---------------------------------------------------------------------------
// Policy
// ---------------------------------------------------------------------------
struct Policy {
  std::uint64_t max_clock_skew_ms{kDefaultMaxClockSkewMs};
  std::uint64_t max_validity_ms{kDefaultMaxValidityMs};
};

// Checked in order: exp < iat, exp - iat > max_validity, iat > now + skew,
// exp < now - skew.
std::optional<Error> validate_time_window(std::uint64_t iat_ms, std::uint64_t exp_ms, std::uint64_t now_ms,
                                          const Policy& policy);

std::uint64_t system_now_ms();

// ---------------------------------------------------------------------------
// Claims
// ---------------------------------------------------------------------------
struct RequestClaims {
  std::string leader_id;
  std::uint64_t leader_kid{0};
  std::string tool_id;
  std::uint64_t iat_ms{0};
  std::uint64_t exp_ms{0};
  std::string nonce;
  std::string method;
  std::string path;
  std::string query;
  std::string body_sha256;
};

struct ResponseClaims {
  std::string tool_id;
  std::uint64_t tool_kid{0};
  std::uint64_t iat_ms{0};
  std::uint64_t exp_ms{0};
  std::string nonce;
  std::string req_sig_input_sha256;
  std::uint16_t status{0};
  std::string body_sha256;
};

std::string encode_claims(const RequestClaims& c);
std::string encode_claims(const ResponseClaims& c);
std::optional<RequestClaims> decode_request_claims(std::string_view sig_input, Error* error = nullptr);
std::optional<ResponseClaims> decode_response_claims(std::string_view sig_input, Error* error = nullptr);

// ---------------------------------------------------------------------------
// Headers
// ---------------------------------------------------------------------------
struct SignatureHeaders {
  std::string sig_input_b64;
  std::string sig_b64;

  // Header name to value, all three headers.
  std::map<std::string, std::string> to_map() const;
};

// Header values as received; nullopt means the header was absent.
struct ReceivedHeaders {
  std::optional<std::string> sig_v;
  std::optional<std::string> sig_input_b64;
  std::optional<std::string> sig_b64;

  static ReceivedHeaders from_map(const std::map<std::string, std::string>& headers);
};

struct DecodedSignature {
  std::string sig_input;
  std::string signature;  // 64 bytes
};

std::optional<DecodedSignature> decode_signature_headers(const ReceivedHeaders& headers, Error* error = nullptr);
SignatureHeaders encode_signature_headers(std::string_view sig_input, std::string_view signature);

// domain || sig_input
std::string message_to_sign(std::string_view domain, std::string_view sig_input);

// Signs claims; returns the headers and the sig_input bytes through `sig_input`.
std::optional<SignatureHeaders> sign_request(const RequestClaims& claims, const crypto::SigningKey& key,
                                             std::string* sig_input, Error* error = nullptr);
std::optional<SignatureHeaders> sign_response(const ResponseClaims& claims, const crypto::SigningKey& key,
                                              std::string* sig_input, Error* error = nullptr);

// ---------------------------------------------------------------------------
// AllowedLeaders
// ---------------------------------------------------------------------------
// { "version": 1, "leaders": [ { "leader_id": str,
//                                "keys": [ { "kid": u64, "public_key": hex32 } ] } ] }
class AllowedLeaders {
 public:
  AllowedLeaders() = default;

  static std::optional<AllowedLeaders> from_json(const std::string& text, Error* error = nullptr);
  static std::optional<AllowedLeaders> from_value(const jsonlite::Value& value, Error* error = nullptr);
  static std::optional<AllowedLeaders> from_path(const std::string& path, Error* error = nullptr);

  void insert(const std::string& leader_id, std::uint64_t kid, const Key32& public_key);
  std::optional<Key32> key(const std::string& leader_id, std::uint64_t kid) const;
  std::size_t leader_count() const { return leaders_.size(); }
  const std::string& source_path() const { return source_path_; }

 private:
  std::map<std::string, std::map<std::uint64_t, Key32>> leaders_;
  std::string source_path_;
};

}  // namespace nexus::signed_http
