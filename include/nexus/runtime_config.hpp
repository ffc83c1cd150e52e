#pragma once

// nexus/runtime_config.hpp: Tool-host runtime configuration.
//
// FORMAT (version 1):
//   {
//     "version": 1,
//     "invoke_max_body_bytes": 10485760,          // optional, default 10 MiB
//     "signed_http": {                            // optional, absent = disabled
//       "mode": "required" | "disabled",          // default "required"
//       "allowed_leaders_path": "./leaders.json", // or
//       "allowed_leaders": { ...allow-list... },  // inline wins over path
//       "max_clock_skew_ms": 30000,               // optional
//       "max_validity_ms": 60000,                 // optional
//       "tools": { "<tool_id>": { "tool_kid": 0, "tool_signing_key": "<hex|base64>" } }
//     }
//   }
//
// Loaded from the path in NEXUS_TOOLKIT_CONFIG_PATH; when the variable is unset
// the defaults apply and signed HTTP is disabled.

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "nexus/crypto.hpp"
#include "nexus/signed_http.hpp"
#include "nexus/types.hpp"

namespace nexus {

constexpr const char* kEnvToolkitConfigPath = "NEXUS_TOOLKIT_CONFIG_PATH";
constexpr std::uint64_t kDefaultInvokeMaxBodyBytes = 10ull * 1024 * 1024;

enum class SignedHttpMode { disabled, required };

struct ToolSigningConfig {
  std::uint64_t tool_kid{0};
  crypto::SigningKey signing_key;
};

class ToolkitRuntimeConfig {
 public:
  ToolkitRuntimeConfig() = default;

  static std::optional<ToolkitRuntimeConfig> from_json(const std::string& text, Error* error = nullptr);
  static std::optional<ToolkitRuntimeConfig> from_path(const std::string& path, Error* error = nullptr);
  static std::optional<ToolkitRuntimeConfig> from_env(Error* error = nullptr);

  // Re-reads source_path(). Fails with config_invalid when there is none.
  std::optional<ToolkitRuntimeConfig> reload(Error* error = nullptr) const;

  std::uint64_t invoke_max_body_bytes() const { return invoke_max_body_bytes_; }
  bool signed_http_is_required() const { return signed_http_required_; }
  bool has_tool(const std::string& tool_id) const { return tools_.contains(tool_id); }
  const ToolSigningConfig* tool(const std::string& tool_id) const;
  std::size_t tool_count() const { return tools_.size(); }
  const signed_http::AllowedLeaders& allowed_leaders() const { return allowed_leaders_; }
  const signed_http::Policy& policy() const { return policy_; }
  const std::string& source_path() const { return source_path_; }

  // Summary without key material.
  std::string to_json() const;

 private:
  std::uint64_t invoke_max_body_bytes_{kDefaultInvokeMaxBodyBytes};
  bool signed_http_required_{false};
  signed_http::Policy policy_;
  signed_http::AllowedLeaders allowed_leaders_;
  std::map<std::string, ToolSigningConfig> tools_;
  std::string source_path_;
};

}  // namespace nexus
