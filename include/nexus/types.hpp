#pragma once

// nexus/types.hpp: Shared error taxonomy for the Nexus toolkit core.
//
// DESIGN:
//   Every fallible operation reports an ErrorCode. Codes are grouped into the
//   coarse ErrorKind buckets (validation, parse, crypto, replay, timing,
//   transport, circuit) used for failure accounting and for choosing an HTTP
//   status when a failure crosses the signed-HTTP boundary.
//
// CONVENTIONS:
//   - Validations return std::optional<Error> (nullopt = ok).
//   - Producers return std::optional<T> and fill an Error* out-parameter when
//     one is supplied, mirroring jsonlite::parse(text, std::optional<JsonError>*).
//   - No exception crosses a module boundary.
//
// INVARIANT:
//   to_string(code) is stable. It appears in event logs and in signed rejection
//   bodies; renaming a code is a wire change.

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace nexus {

enum class ErrorCode {
  none,
  // jsonlite / config
  json_parse_error,
  json_duplicate_key,
  config_invalid,
  io_error,
  // dag
  dag_invalid_definition,
  dag_cycle,
  dag_no_entry_vertices,
  dag_default_has_incoming_edge,
  dag_layering_violated,
  dag_concurrency_violated,
  // kat
  kat_parse_error,
  // secret store / session store
  secret_base64,
  secret_codec,
  secret_crypto,
  secret_key_unavailable,
  secret_unknown_prefix,
  secret_provider,
  session_unavailable,
  // nexus data
  nexus_data_invalid_utf8,
  nexus_data_invalid_json,
  nexus_data_unknown_storage,
  nexus_data_invalid_encryption_mode,
  nexus_data_invalid_field,
  // keys
  key_invalid_hex,
  key_invalid_base64,
  key_invalid_length,
  key_unsupported_scheme_flag,
  // signed http
  sig_unsupported_version,
  sig_missing_header,
  sig_invalid_base64,
  sig_invalid_signature_length,
  sig_invalid_signed_input_json,
  sig_unknown_leader_key,
  sig_invalid_leader_public_key,
  sig_unknown_tool_key,
  sig_invalid_tool_public_key,
  sig_invalid_signature,
  sig_tool_id_mismatch,
  sig_method_mismatch,
  sig_path_mismatch,
  sig_query_mismatch,
  sig_invalid_body_sha256_hex,
  sig_invalid_req_sig_input_sha256_hex,
  sig_body_hash_mismatch,
  sig_request_binding_mismatch,
  sig_nonce_mismatch,
  sig_status_mismatch,
  sig_invalid_time_window,
  sig_not_yet_valid,
  sig_expired,
  sig_validity_too_large,
  sig_invalid_allowed_leaders_file,
  replay_conflict,
  replay_in_flight,
  // events
  transport_error,
  graphql_error,
  event_parse_error,
  // circuits
  circuit_witness_invalid,
  circuit_unsatisfied,
  proof_verification_failed,
};

std::string to_string(ErrorCode code);

// Coarse failure classes. Used for accounting and propagation policy: only
// transport failures are recovered locally (event fetcher backoff).
enum class ErrorKind {
  none,
  validation,
  parse,
  crypto,
  replay,
  timing,
  transport,
  circuit,
  io,
};

std::string to_string(ErrorKind kind);
ErrorKind kind_of(ErrorCode code);

// HTTP status a responder uses when a failure is reported to the invoker.
// 0 means the code never crosses the HTTP boundary.
int http_status_of(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::none};
  std::string message;

  ErrorKind kind() const { return kind_of(code); }
  std::string to_json() const;
};

Error make_error(ErrorCode code, std::string message);

// Fill `out` when the caller asked for an error report.
inline void set_error(Error* out, ErrorCode code, std::string message) {
  if (out) *out = Error{code, std::move(message)};
}

// ---------------------------------------------------------------------------
// FailureCategoryStats: per-kind failure counters
// ---------------------------------------------------------------------------
// Not thread-safe on its own; ToolkitStats guards it with a mutex.
struct FailureCategoryStats {
  std::map<std::string, std::uint64_t> by_kind;
  std::map<std::string, std::uint64_t> by_code;

  void record(ErrorCode code);
  std::uint64_t total() const;
  std::string to_json() const;
};

using Key32 = std::array<std::uint8_t, 32>;
using Digest32 = std::array<std::uint8_t, 32>;

}  // namespace nexus
