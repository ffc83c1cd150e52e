#include "nexus/signed_http.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>

#include "nexus/hash.hpp"
#include "nexus/version.hpp"

namespace nexus::signed_http {
namespace {

std::string quoted(const std::string& s) { return "\"" + jsonlite::escape(s) + "\""; }

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool all_hex(std::string_view s) {
  return std::all_of(s.begin(), s.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

std::optional<crypto::SigningKey> key_from_bytes(const std::string& bytes, Error* error) {
  Key32 seed{};
  if (bytes.size() == 32) {
    std::copy(bytes.begin(), bytes.end(), seed.begin());
    return crypto::SigningKey(seed);
  }
  if (bytes.size() == 33) {
    const auto flag = static_cast<std::uint8_t>(bytes[0]);
    if (flag != 0x00) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "%02x", flag);
      set_error(error, ErrorCode::key_unsupported_scheme_flag,
                std::string("unsupported key scheme flag 0x") + buf + " (expected 0x00 for ed25519)");
      return std::nullopt;
    }
    std::copy(bytes.begin() + 1, bytes.end(), seed.begin());
    return crypto::SigningKey(seed);
  }
  set_error(error, ErrorCode::key_invalid_length,
            "invalid private key length " + std::to_string(bytes.size()) +
                ", expected 32 bytes (raw ed25519) or 33 bytes (0x00 + key)");
  return std::nullopt;
}

// Typed field readers for claims objects.
struct ClaimReader {
  const jsonlite::Object& obj;
  Error* error;
  bool ok{true};

  std::string str(const std::string& key) {
    if (!ok) return {};
    const auto* v = jsonlite::find(obj, key);
    const auto* s = v ? jsonlite::as_string(*v) : nullptr;
    if (!s) return fail(key);
    return *s;
  }

  std::uint64_t u64(const std::string& key) {
    if (!ok) return 0;
    const auto* v = jsonlite::find(obj, key);
    auto n = v ? jsonlite::as_u64(*v) : std::nullopt;
    if (!n) {
      fail(key);
      return 0;
    }
    return *n;
  }

  std::string fail(const std::string& key) {
    ok = false;
    set_error(error, ErrorCode::sig_invalid_signed_input_json,
              "invalid json in signed input: missing or mistyped field `" + key + "`");
    return {};
  }
};

std::optional<jsonlite::Object> parse_claims_object(std::string_view sig_input, Error* error) {
  std::optional<jsonlite::JsonError> jerr;
  auto obj = jsonlite::parse(std::string(sig_input), &jerr);
  if (jerr) {
    set_error(error, ErrorCode::sig_invalid_signed_input_json, "invalid json in signed input: " + jerr->message);
    return std::nullopt;
  }
  return obj;
}

std::optional<SignatureHeaders> sign_claims(std::string_view domain, std::string encoded,
                                            const crypto::SigningKey& key, std::string* sig_input, Error* error) {
  const std::string signature = key.sign(message_to_sign(domain, encoded));
  if (signature.size() != crypto::kEd25519SignatureLen) {
    set_error(error, ErrorCode::sig_invalid_signature, "ed25519 signing failed");
    return std::nullopt;
  }
  auto headers = encode_signature_headers(encoded, signature);
  if (sig_input) *sig_input = std::move(encoded);
  return headers;
}

}  // namespace

// ---------------------------------------------------------------------------
// Keys
// ---------------------------------------------------------------------------

std::optional<crypto::SigningKey> parse_signing_key(std::string_view text, Error* error) {
  const std::string_view raw = trim(text);
  const bool has_0x = raw.substr(0, 2) == "0x";
  const std::string_view body = has_0x ? raw.substr(2) : raw;
  const bool looks_like_hex = has_0x || ((body.size() == 64 || body.size() == 66) && all_hex(body));

  if (looks_like_hex) {
    auto bytes = from_hex(body);
    if (!bytes) {
      set_error(error, ErrorCode::key_invalid_hex, "invalid hex private key");
      return std::nullopt;
    }
    auto key = key_from_bytes(*bytes, error);
    crypto::secure_zero(bytes->data(), bytes->size());
    return key;
  }

  auto bytes = base64_decode_any(raw);
  if (!bytes) {
    set_error(error, ErrorCode::key_invalid_base64, "invalid base64/base64url private key: expected base64/base64url data");
    return std::nullopt;
  }
  auto key = key_from_bytes(*bytes, error);
  crypto::secure_zero(bytes->data(), bytes->size());
  return key;
}

// ---------------------------------------------------------------------------
// Policy
// ---------------------------------------------------------------------------

std::optional<Error> validate_time_window(std::uint64_t iat_ms, std::uint64_t exp_ms, std::uint64_t now_ms,
                                          const Policy& policy) {
  if (exp_ms < iat_ms) return make_error(ErrorCode::sig_invalid_time_window, "exp_ms must be >= iat_ms");
  const std::uint64_t validity = exp_ms - iat_ms;
  if (validity > policy.max_validity_ms) {
    return make_error(ErrorCode::sig_validity_too_large,
                      "validity window too large (" + std::to_string(validity) + "ms > " +
                          std::to_string(policy.max_validity_ms) + "ms)");
  }
  const std::uint64_t skew = policy.max_clock_skew_ms;
  const std::uint64_t latest_iat =
      now_ms > std::numeric_limits<std::uint64_t>::max() - skew ? std::numeric_limits<std::uint64_t>::max()
                                                                 : now_ms + skew;
  if (iat_ms > latest_iat) {
    return make_error(ErrorCode::sig_not_yet_valid, "request is not yet valid (iat_ms=" + std::to_string(iat_ms) +
                                                        ", now_ms=" + std::to_string(now_ms) + ")");
  }
  const std::uint64_t earliest_exp = now_ms > skew ? now_ms - skew : 0;
  if (exp_ms < earliest_exp) {
    return make_error(ErrorCode::sig_expired, "request expired (exp_ms=" + std::to_string(exp_ms) +
                                                  ", now_ms=" + std::to_string(now_ms) + ")");
  }
  return std::nullopt;
}

std::uint64_t system_now_ms() {
  using namespace std::chrono;
  const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  return ms < 0 ? 0 : static_cast<std::uint64_t>(ms);
}

// ---------------------------------------------------------------------------
// Claims
// ---------------------------------------------------------------------------

std::string encode_claims(const RequestClaims& c) {
  std::ostringstream o;
  o << "{\"leader_id\":" << quoted(c.leader_id) << ",\"leader_kid\":" << c.leader_kid
    << ",\"tool_id\":" << quoted(c.tool_id) << ",\"iat_ms\":" << c.iat_ms << ",\"exp_ms\":" << c.exp_ms
    << ",\"nonce\":" << quoted(c.nonce) << ",\"method\":" << quoted(c.method) << ",\"path\":" << quoted(c.path)
    << ",\"query\":" << quoted(c.query) << ",\"body_sha256\":" << quoted(c.body_sha256) << "}";
  return o.str();
}

std::string encode_claims(const ResponseClaims& c) {
  std::ostringstream o;
  o << "{\"tool_id\":" << quoted(c.tool_id) << ",\"tool_kid\":" << c.tool_kid << ",\"iat_ms\":" << c.iat_ms
    << ",\"exp_ms\":" << c.exp_ms << ",\"nonce\":" << quoted(c.nonce)
    << ",\"req_sig_input_sha256\":" << quoted(c.req_sig_input_sha256) << ",\"status\":" << c.status
    << ",\"body_sha256\":" << quoted(c.body_sha256) << "}";
  return o.str();
}

std::optional<RequestClaims> decode_request_claims(std::string_view sig_input, Error* error) {
  auto obj = parse_claims_object(sig_input, error);
  if (!obj) return std::nullopt;
  ClaimReader r{*obj, error};
  RequestClaims c;
  c.leader_id = r.str("leader_id");
  c.leader_kid = r.u64("leader_kid");
  c.tool_id = r.str("tool_id");
  c.iat_ms = r.u64("iat_ms");
  c.exp_ms = r.u64("exp_ms");
  c.nonce = r.str("nonce");
  c.method = r.str("method");
  c.path = r.str("path");
  c.query = r.str("query");
  c.body_sha256 = r.str("body_sha256");
  if (!r.ok) return std::nullopt;
  return c;
}

std::optional<ResponseClaims> decode_response_claims(std::string_view sig_input, Error* error) {
  auto obj = parse_claims_object(sig_input, error);
  if (!obj) return std::nullopt;
  ClaimReader r{*obj, error};
  ResponseClaims c;
  c.tool_id = r.str("tool_id");
  c.tool_kid = r.u64("tool_kid");
  c.iat_ms = r.u64("iat_ms");
  c.exp_ms = r.u64("exp_ms");
  c.nonce = r.str("nonce");
  c.req_sig_input_sha256 = r.str("req_sig_input_sha256");
  const std::uint64_t status = r.u64("status");
  c.body_sha256 = r.str("body_sha256");
  if (!r.ok) return std::nullopt;
  if (status > std::numeric_limits<std::uint16_t>::max()) {
    set_error(error, ErrorCode::sig_invalid_signed_input_json, "invalid json in signed input: status out of range");
    return std::nullopt;
  }
  c.status = static_cast<std::uint16_t>(status);
  return c;
}

// ---------------------------------------------------------------------------
// Headers
// ---------------------------------------------------------------------------

std::map<std::string, std::string> SignatureHeaders::to_map() const {
  return {
      {std::string(kHeaderSigVersion), std::string(kSigVersionV1)},
      {std::string(kHeaderSigInput), sig_input_b64},
      {std::string(kHeaderSig), sig_b64},
  };
}

ReceivedHeaders ReceivedHeaders::from_map(const std::map<std::string, std::string>& headers) {
  auto get = [&](std::string_view name) -> std::optional<std::string> {
    for (const auto& [k, v] : headers) {
      if (k.size() != name.size()) continue;
      bool same = true;
      for (std::size_t i = 0; i < k.size() && same; ++i) {
        same = std::tolower(static_cast<unsigned char>(k[i])) == std::tolower(static_cast<unsigned char>(name[i]));
      }
      if (same) return v;
    }
    return std::nullopt;
  };
  return ReceivedHeaders{get(kHeaderSigVersion), get(kHeaderSigInput), get(kHeaderSig)};
}

std::optional<DecodedSignature> decode_signature_headers(const ReceivedHeaders& headers, Error* error) {
  if (!headers.sig_v) {
    set_error(error, ErrorCode::sig_missing_header, "missing required header '" + std::string(kHeaderSigVersion) + "'");
    return std::nullopt;
  }
  if (*headers.sig_v != kSigVersionV1) {
    set_error(error, ErrorCode::sig_unsupported_version,
              "unsupported signature version '" + *headers.sig_v + "', expected '" + std::string(kSigVersionV1) + "'");
    return std::nullopt;
  }
  if (!headers.sig_input_b64) {
    set_error(error, ErrorCode::sig_missing_header, "missing required header '" + std::string(kHeaderSigInput) + "'");
    return std::nullopt;
  }
  if (!headers.sig_b64) {
    set_error(error, ErrorCode::sig_missing_header, "missing required header '" + std::string(kHeaderSig) + "'");
    return std::nullopt;
  }
  auto sig_input = base64url_decode(*headers.sig_input_b64);
  if (!sig_input) {
    set_error(error, ErrorCode::sig_invalid_base64, "invalid base64url in header '" + std::string(kHeaderSigInput) + "'");
    return std::nullopt;
  }
  auto signature = base64url_decode(*headers.sig_b64);
  if (!signature) {
    set_error(error, ErrorCode::sig_invalid_base64, "invalid base64url in header '" + std::string(kHeaderSig) + "'");
    return std::nullopt;
  }
  if (signature->size() != crypto::kEd25519SignatureLen) {
    set_error(error, ErrorCode::sig_invalid_signature_length,
              "invalid signature length " + std::to_string(signature->size()) + ", expected 64");
    return std::nullopt;
  }
  return DecodedSignature{std::move(*sig_input), std::move(*signature)};
}

SignatureHeaders encode_signature_headers(std::string_view sig_input, std::string_view signature) {
  return SignatureHeaders{base64url_encode(sig_input), base64url_encode(signature)};
}

std::string message_to_sign(std::string_view domain, std::string_view sig_input) {
  std::string msg;
  msg.reserve(domain.size() + sig_input.size());
  msg.append(domain);
  msg.append(sig_input);
  return msg;
}

std::optional<SignatureHeaders> sign_request(const RequestClaims& claims, const crypto::SigningKey& key,
                                             std::string* sig_input, Error* error) {
  return sign_claims(kDomainRequestV1, encode_claims(claims), key, sig_input, error);
}

std::optional<SignatureHeaders> sign_response(const ResponseClaims& claims, const crypto::SigningKey& key,
                                              std::string* sig_input, Error* error) {
  return sign_claims(kDomainResponseV1, encode_claims(claims), key, sig_input, error);
}

// ---------------------------------------------------------------------------
// AllowedLeaders
// ---------------------------------------------------------------------------

std::optional<AllowedLeaders> AllowedLeaders::from_json(const std::string& text, Error* error) {
  std::optional<jsonlite::JsonError> jerr;
  auto value = jsonlite::parse_value(text, &jerr);
  if (jerr) {
    set_error(error, ErrorCode::sig_invalid_allowed_leaders_file, "invalid allowed-leaders file: " + jerr->message);
    return std::nullopt;
  }
  return from_value(value, error);
}

std::optional<AllowedLeaders> AllowedLeaders::from_value(const jsonlite::Value& value, Error* error) {
  auto invalid = [&](const std::string& msg) -> std::optional<AllowedLeaders> {
    set_error(error, ErrorCode::sig_invalid_allowed_leaders_file, "invalid allowed-leaders file: " + msg);
    return std::nullopt;
  };
  const auto* root = jsonlite::as_object(value);
  if (!root) return invalid("expected an object");
  const auto* version_v = jsonlite::find(*root, "version");
  auto version = version_v ? jsonlite::as_u64(*version_v) : std::nullopt;
  if (!version) return invalid("missing field `version`");
  const auto compat = version::check_format("allow_list", *version);
  if (!compat.ok) {
    return invalid("unsupported version " + std::to_string(*version) + ", expected " +
                   std::to_string(version::ALLOW_LIST_VERSION));
  }
  const auto* leaders_v = jsonlite::find(*root, "leaders");
  const auto* leaders = leaders_v ? jsonlite::as_array(*leaders_v) : nullptr;
  if (!leaders) return invalid("missing field `leaders`");

  AllowedLeaders out;
  for (const auto& entry : *leaders) {
    const auto* leader = jsonlite::as_object(entry);
    if (!leader) return invalid("leader entries must be objects");
    const auto* id_v = jsonlite::find(*leader, "leader_id");
    const auto* leader_id = id_v ? jsonlite::as_string(*id_v) : nullptr;
    if (!leader_id) return invalid("missing field `leader_id`");
    const auto* keys_v = jsonlite::find(*leader, "keys");
    const auto* keys = keys_v ? jsonlite::as_array(*keys_v) : nullptr;
    if (!keys) return invalid("leader_id=" + *leader_id + ": missing field `keys`");
    out.leaders_[*leader_id];  // a leader with no keys is still listed
    for (const auto& k : *keys) {
      const auto* key_obj = jsonlite::as_object(k);
      if (!key_obj) return invalid("leader_id=" + *leader_id + ": key entries must be objects");
      const auto* kid_v = jsonlite::find(*key_obj, "kid");
      auto kid = kid_v ? jsonlite::as_u64(*kid_v) : std::nullopt;
      if (!kid) return invalid("leader_id=" + *leader_id + ": missing field `kid`");
      const auto* pk_v = jsonlite::find(*key_obj, "public_key");
      const auto* pk_hex = pk_v ? jsonlite::as_string(*pk_v) : nullptr;
      const std::string where = "leader_id=" + *leader_id + " kid=" + std::to_string(*kid);
      if (!pk_hex) return invalid(where + ": missing field `public_key`");
      auto pk = from_hex(*pk_hex);
      if (!pk) return invalid(where + ": invalid public_key hex");
      if (pk->size() != 32) return invalid(where + ": public_key must be 32 bytes");
      Key32 key{};
      std::copy(pk->begin(), pk->end(), key.begin());
      out.insert(*leader_id, *kid, key);
    }
  }
  return out;
}

std::optional<AllowedLeaders> AllowedLeaders::from_path(const std::string& path, Error* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    set_error(error, ErrorCode::io_error, "io error: cannot open " + path);
    return std::nullopt;
  }
  std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  auto out = from_json(text, error);
  if (out) out->source_path_ = path;
  return out;
}

void AllowedLeaders::insert(const std::string& leader_id, std::uint64_t kid, const Key32& public_key) {
  leaders_[leader_id][kid] = public_key;
}

std::optional<Key32> AllowedLeaders::key(const std::string& leader_id, std::uint64_t kid) const {
  auto it = leaders_.find(leader_id);
  if (it == leaders_.end()) return std::nullopt;
  auto kit = it->second.find(kid);
  if (kit == it->second.end()) return std::nullopt;
  return kit->second;
}

}  // namespace nexus::signed_http
