#pragma once

// nexus/version.hpp: Version constants for every persisted or wire format.
//
// PURPOSE:
//   Each reader of a versioned format checks the constant here before it
//   accepts data. Readers never accept a format version newer than the one
//   the toolkit was compiled against.

#include <cstdint>
#include <string>

namespace nexus {
namespace version {

constexpr const char* TOOLKIT_SEMVER = "0.3.0";

// ---------------------------------------------------------------------------
// SIGNED_HTTP_VERSION
// Value of the X-Nexus-Sig-V header. The signature domain strings embed the
// same number ("nexus.leader_tool.request.v1.").
// ---------------------------------------------------------------------------
constexpr uint32_t SIGNED_HTTP_VERSION = 1;

// ---------------------------------------------------------------------------
// SECRET_ENVELOPE_VERSION
// The "v1" in "plain:v1:" and "enc:v1:". Version 1 = AES-256-GCM with a
// 12-byte random nonce prepended to ciphertext||tag.
// ---------------------------------------------------------------------------
constexpr uint32_t SECRET_ENVELOPE_VERSION = 1;

// ---------------------------------------------------------------------------
// ALLOW_LIST_VERSION
// "version" field of allowed-leaders files.
// ---------------------------------------------------------------------------
constexpr uint32_t ALLOW_LIST_VERSION = 1;

// ---------------------------------------------------------------------------
// RUNTIME_CONFIG_VERSION
// "version" field of the tool-host runtime configuration.
// ---------------------------------------------------------------------------
constexpr uint32_t RUNTIME_CONFIG_VERSION = 1;

// ---------------------------------------------------------------------------
// DFA_SERIALIZATION_VERSION
// Layout of the canonical DFA byte stream hashed by the transaction-policy
// circuit. Any change to the layout changes every published DFA hash.
// ---------------------------------------------------------------------------
constexpr uint32_t DFA_SERIALIZATION_VERSION = 1;

struct VersionManifest {
  uint32_t signed_http{SIGNED_HTTP_VERSION};
  uint32_t secret_envelope{SECRET_ENVELOPE_VERSION};
  uint32_t allow_list{ALLOW_LIST_VERSION};
  uint32_t runtime_config{RUNTIME_CONFIG_VERSION};
  uint32_t dfa_serialization{DFA_SERIALIZATION_VERSION};
  std::string toolkit_semver;
  std::string fingerprint_primitive;  // "blake3"
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

// ---------------------------------------------------------------------------
// Format check for a versioned document. `format` is one of
// "signed_http", "secret_envelope", "allow_list", "runtime_config",
// "dfa_serialization".
// ---------------------------------------------------------------------------
struct CompatibilityResult {
  bool ok{true};
  std::string error_code;    // Empty if ok
  std::string description;
  uint32_t supported{0};
  uint32_t actual{0};
};

CompatibilityResult check_format(const std::string& format, uint64_t actual_version);

}  // namespace version
}  // namespace nexus
