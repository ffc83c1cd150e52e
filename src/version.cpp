#include "nexus/version.hpp"

#include <sstream>

#include "nexus/hash.hpp"

namespace nexus {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.toolkit_semver        = TOOLKIT_SEMVER;
  m.fingerprint_primitive = "blake3-" + blake3_version_string();
  m.build_timestamp       = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"signed_http\":" << m.signed_http
    << ",\"secret_envelope\":" << m.secret_envelope
    << ",\"allow_list\":" << m.allow_list
    << ",\"runtime_config\":" << m.runtime_config
    << ",\"dfa_serialization\":" << m.dfa_serialization
    << ",\"toolkit_semver\":\"" << m.toolkit_semver << "\""
    << ",\"fingerprint_primitive\":\"" << m.fingerprint_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_format(const std::string& format, uint64_t actual_version) {
  CompatibilityResult r;
  if (format == "signed_http") r.supported = SIGNED_HTTP_VERSION;
  else if (format == "secret_envelope") r.supported = SECRET_ENVELOPE_VERSION;
  else if (format == "allow_list") r.supported = ALLOW_LIST_VERSION;
  else if (format == "runtime_config") r.supported = RUNTIME_CONFIG_VERSION;
  else if (format == "dfa_serialization") r.supported = DFA_SERIALIZATION_VERSION;
  else {
    r.ok = false;
    r.error_code = "unknown_format";
    r.description = "unknown versioned format: " + format;
    return r;
  }
  r.actual = static_cast<uint32_t>(actual_version);
  if (actual_version != r.supported) {
    r.ok = false;
    r.error_code = "format_version_mismatch";
    r.description = "unsupported " + format + " version " + std::to_string(actual_version) +
                    " (supported: " + std::to_string(r.supported) + ")";
  }
  return r;
}

}  // namespace version
}  // namespace nexus
