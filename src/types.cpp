#include "nexus/types.hpp"

#include "nexus/jsonlite.hpp"

namespace nexus {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::dag_invalid_definition: return "dag_invalid_definition";
    case ErrorCode::dag_cycle: return "dag_cycle";
    case ErrorCode::dag_no_entry_vertices: return "dag_no_entry_vertices";
    case ErrorCode::dag_default_has_incoming_edge: return "dag_default_has_incoming_edge";
    case ErrorCode::dag_layering_violated: return "dag_layering_violated";
    case ErrorCode::dag_concurrency_violated: return "dag_concurrency_violated";
    case ErrorCode::kat_parse_error: return "kat_parse_error";
    case ErrorCode::secret_base64: return "secret_base64";
    case ErrorCode::secret_codec: return "secret_codec";
    case ErrorCode::secret_crypto: return "secret_crypto";
    case ErrorCode::secret_key_unavailable: return "secret_key_unavailable";
    case ErrorCode::secret_unknown_prefix: return "secret_unknown_prefix";
    case ErrorCode::secret_provider: return "secret_provider";
    case ErrorCode::session_unavailable: return "session_unavailable";
    case ErrorCode::nexus_data_invalid_utf8: return "nexus_data_invalid_utf8";
    case ErrorCode::nexus_data_invalid_json: return "nexus_data_invalid_json";
    case ErrorCode::nexus_data_unknown_storage: return "nexus_data_unknown_storage";
    case ErrorCode::nexus_data_invalid_encryption_mode: return "nexus_data_invalid_encryption_mode";
    case ErrorCode::nexus_data_invalid_field: return "nexus_data_invalid_field";
    case ErrorCode::key_invalid_hex: return "key_invalid_hex";
    case ErrorCode::key_invalid_base64: return "key_invalid_base64";
    case ErrorCode::key_invalid_length: return "key_invalid_length";
    case ErrorCode::key_unsupported_scheme_flag: return "key_unsupported_scheme_flag";
    case ErrorCode::sig_unsupported_version: return "unsupported_version";
    case ErrorCode::sig_missing_header: return "missing_header";
    case ErrorCode::sig_invalid_base64: return "invalid_base64";
    case ErrorCode::sig_invalid_signature_length: return "invalid_signature_length";
    case ErrorCode::sig_invalid_signed_input_json: return "invalid_signed_input_json";
    case ErrorCode::sig_unknown_leader_key: return "unknown_leader_key";
    case ErrorCode::sig_invalid_leader_public_key: return "invalid_leader_public_key";
    case ErrorCode::sig_unknown_tool_key: return "unknown_tool_key";
    case ErrorCode::sig_invalid_tool_public_key: return "invalid_tool_public_key";
    case ErrorCode::sig_invalid_signature: return "invalid_signature";
    case ErrorCode::sig_tool_id_mismatch: return "tool_id_mismatch";
    case ErrorCode::sig_method_mismatch: return "method_mismatch";
    case ErrorCode::sig_path_mismatch: return "path_mismatch";
    case ErrorCode::sig_query_mismatch: return "query_mismatch";
    case ErrorCode::sig_invalid_body_sha256_hex: return "invalid_body_sha256_hex";
    case ErrorCode::sig_invalid_req_sig_input_sha256_hex: return "invalid_req_sig_input_sha256_hex";
    case ErrorCode::sig_body_hash_mismatch: return "body_hash_mismatch";
    case ErrorCode::sig_request_binding_mismatch: return "request_binding_mismatch";
    case ErrorCode::sig_nonce_mismatch: return "nonce_mismatch";
    case ErrorCode::sig_status_mismatch: return "status_mismatch";
    case ErrorCode::sig_invalid_time_window: return "invalid_time_window";
    case ErrorCode::sig_not_yet_valid: return "not_yet_valid";
    case ErrorCode::sig_expired: return "expired";
    case ErrorCode::sig_validity_too_large: return "validity_too_large";
    case ErrorCode::sig_invalid_allowed_leaders_file: return "invalid_allowed_leaders_file";
    case ErrorCode::replay_conflict: return "replay_conflict";
    case ErrorCode::replay_in_flight: return "in_flight";
    case ErrorCode::transport_error: return "transport_error";
    case ErrorCode::graphql_error: return "graphql_error";
    case ErrorCode::event_parse_error: return "event_parse_error";
    case ErrorCode::circuit_witness_invalid: return "circuit_witness_invalid";
    case ErrorCode::circuit_unsatisfied: return "circuit_unsatisfied";
    case ErrorCode::proof_verification_failed: return "proof_verification_failed";
  }
  return "";
}

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::none: return "none";
    case ErrorKind::validation: return "validation";
    case ErrorKind::parse: return "parse";
    case ErrorKind::crypto: return "crypto";
    case ErrorKind::replay: return "replay";
    case ErrorKind::timing: return "timing";
    case ErrorKind::transport: return "transport";
    case ErrorKind::circuit: return "circuit";
    case ErrorKind::io: return "io";
  }
  return "none";
}

ErrorKind kind_of(ErrorCode code) {
  switch (code) {
    case ErrorCode::none:
      return ErrorKind::none;

    case ErrorCode::config_invalid:
    case ErrorCode::dag_invalid_definition:
    case ErrorCode::dag_cycle:
    case ErrorCode::dag_no_entry_vertices:
    case ErrorCode::dag_default_has_incoming_edge:
    case ErrorCode::dag_layering_violated:
    case ErrorCode::dag_concurrency_violated:
    case ErrorCode::session_unavailable:
    case ErrorCode::nexus_data_invalid_field:
    case ErrorCode::sig_unsupported_version:
    case ErrorCode::sig_missing_header:
    case ErrorCode::sig_tool_id_mismatch:
    case ErrorCode::sig_method_mismatch:
    case ErrorCode::sig_path_mismatch:
    case ErrorCode::sig_query_mismatch:
    case ErrorCode::sig_status_mismatch:
    case ErrorCode::sig_nonce_mismatch:
      return ErrorKind::validation;

    case ErrorCode::json_parse_error:
    case ErrorCode::json_duplicate_key:
    case ErrorCode::kat_parse_error:
    case ErrorCode::secret_base64:
    case ErrorCode::secret_codec:
    case ErrorCode::secret_unknown_prefix:
    case ErrorCode::nexus_data_invalid_utf8:
    case ErrorCode::nexus_data_invalid_json:
    case ErrorCode::nexus_data_unknown_storage:
    case ErrorCode::nexus_data_invalid_encryption_mode:
    case ErrorCode::key_invalid_hex:
    case ErrorCode::key_invalid_base64:
    case ErrorCode::key_invalid_length:
    case ErrorCode::key_unsupported_scheme_flag:
    case ErrorCode::sig_invalid_base64:
    case ErrorCode::sig_invalid_signature_length:
    case ErrorCode::sig_invalid_signed_input_json:
    case ErrorCode::sig_invalid_body_sha256_hex:
    case ErrorCode::sig_invalid_req_sig_input_sha256_hex:
    case ErrorCode::sig_invalid_allowed_leaders_file:
    case ErrorCode::event_parse_error:
      return ErrorKind::parse;

    case ErrorCode::secret_crypto:
    case ErrorCode::secret_key_unavailable:
    case ErrorCode::secret_provider:
    case ErrorCode::sig_unknown_leader_key:
    case ErrorCode::sig_invalid_leader_public_key:
    case ErrorCode::sig_unknown_tool_key:
    case ErrorCode::sig_invalid_tool_public_key:
    case ErrorCode::sig_invalid_signature:
    case ErrorCode::sig_body_hash_mismatch:
    case ErrorCode::sig_request_binding_mismatch:
      return ErrorKind::crypto;

    case ErrorCode::replay_conflict:
    case ErrorCode::replay_in_flight:
      return ErrorKind::replay;

    case ErrorCode::sig_invalid_time_window:
    case ErrorCode::sig_not_yet_valid:
    case ErrorCode::sig_expired:
    case ErrorCode::sig_validity_too_large:
      return ErrorKind::timing;

    case ErrorCode::transport_error:
    case ErrorCode::graphql_error:
      return ErrorKind::transport;

    case ErrorCode::circuit_witness_invalid:
    case ErrorCode::circuit_unsatisfied:
    case ErrorCode::proof_verification_failed:
      return ErrorKind::circuit;

    case ErrorCode::io_error:
      return ErrorKind::io;
  }
  return ErrorKind::none;
}

int http_status_of(ErrorCode code) {
  switch (code) {
    case ErrorCode::replay_conflict:
    case ErrorCode::replay_in_flight:
      return 409;
    case ErrorCode::sig_unsupported_version:
    case ErrorCode::sig_missing_header:
    case ErrorCode::sig_invalid_base64:
    case ErrorCode::sig_invalid_signature_length:
    case ErrorCode::sig_invalid_signed_input_json:
    case ErrorCode::sig_invalid_body_sha256_hex:
      return 400;
    case ErrorCode::sig_unknown_leader_key:
    case ErrorCode::sig_invalid_leader_public_key:
    case ErrorCode::sig_invalid_signature:
    case ErrorCode::sig_tool_id_mismatch:
    case ErrorCode::sig_method_mismatch:
    case ErrorCode::sig_path_mismatch:
    case ErrorCode::sig_query_mismatch:
    case ErrorCode::sig_body_hash_mismatch:
    case ErrorCode::sig_invalid_time_window:
    case ErrorCode::sig_not_yet_valid:
    case ErrorCode::sig_expired:
    case ErrorCode::sig_validity_too_large:
      return 401;
    default:
      return 0;
  }
}

std::string Error::to_json() const {
  std::string out = "{\"code\":\"";
  out += to_string(code);
  out += "\",\"kind\":\"";
  out += to_string(kind());
  out += "\",\"message\":\"";
  out += jsonlite::escape(message);
  out += "\"}";
  return out;
}

Error make_error(ErrorCode code, std::string message) {
  return Error{code, std::move(message)};
}

void FailureCategoryStats::record(ErrorCode code) {
  if (code == ErrorCode::none) return;
  by_kind[to_string(kind_of(code))]++;
  by_code[to_string(code)]++;
}

std::uint64_t FailureCategoryStats::total() const {
  std::uint64_t n = 0;
  for (const auto& [_, count] : by_kind) n += count;
  return n;
}

std::string FailureCategoryStats::to_json() const {
  std::string out = "{\"total\":" + std::to_string(total()) + ",\"by_kind\":{";
  bool first = true;
  for (const auto& [k, v] : by_kind) {
    if (!first) out += ",";
    first = false;
    out += "\"" + k + "\":" + std::to_string(v);
  }
  out += "},\"by_code\":{";
  first = true;
  for (const auto& [k, v] : by_code) {
    if (!first) out += ",";
    first = false;
    out += "\"" + k + "\":" + std::to_string(v);
  }
  out += "}}";
  return out;
}

}  // namespace nexus
