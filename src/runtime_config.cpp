#include "nexus/runtime_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>

#include "nexus/hash.hpp"
#include "nexus/jsonlite.hpp"
#include "nexus/version.hpp"

namespace nexus {
namespace {

std::optional<ToolkitRuntimeConfig> invalid(Error* error, std::string message) {
  set_error(error, ErrorCode::config_invalid, std::move(message));
  return std::nullopt;
}

// Optional u64 field: absent keeps `out`, present but mistyped fails.
bool read_u64(const jsonlite::Object& obj, const std::string& key, std::uint64_t& out, std::string& problem) {
  const auto* v = jsonlite::find(obj, key);
  if (!v || jsonlite::is_null(*v)) return true;
  auto n = jsonlite::as_u64(*v);
  if (!n) {
    problem = "`" + key + "` must be an unsigned integer";
    return false;
  }
  out = *n;
  return true;
}

}  // namespace

std::optional<ToolkitRuntimeConfig> ToolkitRuntimeConfig::from_json(const std::string& text, Error* error) {
  std::optional<jsonlite::JsonError> jerr;
  auto root = jsonlite::parse(text, &jerr);
  if (jerr) return invalid(error, "invalid JSON: " + jerr->message);

  const auto* version_v = jsonlite::find(root, "version");
  auto version = version_v ? jsonlite::as_u64(*version_v) : std::nullopt;
  if (!version) return invalid(error, "missing field `version`");
  if (!version::check_format("runtime_config", *version).ok) {
    return invalid(error, "unsupported config version " + std::to_string(*version) + ", expected " +
                              std::to_string(version::RUNTIME_CONFIG_VERSION));
  }

  ToolkitRuntimeConfig cfg;
  std::string problem;
  if (!read_u64(root, "invoke_max_body_bytes", cfg.invoke_max_body_bytes_, problem)) return invalid(error, problem);

  const auto* sh_v = jsonlite::find(root, "signed_http");
  if (!sh_v || jsonlite::is_null(*sh_v)) return cfg;
  const auto* sh = jsonlite::as_object(*sh_v);
  if (!sh) return invalid(error, "`signed_http` must be an object");

  const std::string mode = jsonlite::get_string(*sh, "mode", "required");
  if (mode == "disabled") return cfg;
  if (mode != "required") return invalid(error, "unknown signed_http.mode `" + mode + "`");

  Error leaders_err;
  const auto* inline_v = jsonlite::find(*sh, "allowed_leaders");
  const auto* path_v = jsonlite::find(*sh, "allowed_leaders_path");
  std::optional<signed_http::AllowedLeaders> leaders;
  if (inline_v && !jsonlite::is_null(*inline_v)) {
    leaders = signed_http::AllowedLeaders::from_value(*inline_v, &leaders_err);
  } else if (path_v && jsonlite::as_string(*path_v)) {
    leaders = signed_http::AllowedLeaders::from_path(*jsonlite::as_string(*path_v), &leaders_err);
  } else {
    return invalid(error, "signed_http requires either allowed_leaders or allowed_leaders_path");
  }
  if (!leaders) {
    if (error) *error = leaders_err;
    return std::nullopt;
  }
  cfg.allowed_leaders_ = std::move(*leaders);

  if (!read_u64(*sh, "max_clock_skew_ms", cfg.policy_.max_clock_skew_ms, problem) ||
      !read_u64(*sh, "max_validity_ms", cfg.policy_.max_validity_ms, problem)) {
    return invalid(error, "signed_http." + problem);
  }

  const auto* tools_v = jsonlite::find(*sh, "tools");
  const auto* tools = tools_v ? jsonlite::as_object(*tools_v) : nullptr;
  if (tools_v && !tools) return invalid(error, "`signed_http.tools` must be an object");
  if (!tools || tools->empty()) return invalid(error, "signed_http.tools must contain at least one tool entry");

  for (const auto& [tool_id, entry_v] : *tools) {
    const std::string where = "signed_http.tools[\"" + tool_id + "\"]";
    const auto* entry = jsonlite::as_object(entry_v);
    if (!entry) return invalid(error, where + " must be an object");
    const auto* kid_v = jsonlite::find(*entry, "tool_kid");
    auto kid = kid_v ? jsonlite::as_u64(*kid_v) : std::nullopt;
    if (!kid) return invalid(error, where + ": missing field `tool_kid`");
    const auto* key_v = jsonlite::find(*entry, "tool_signing_key");
    const auto* key_text = key_v ? jsonlite::as_string(*key_v) : nullptr;
    if (!key_text) return invalid(error, where + ": missing field `tool_signing_key`");

    Error key_err;
    auto key = signed_http::parse_signing_key(*key_text, &key_err);
    if (!key) return invalid(error, "invalid " + where + ".tool_signing_key: " + key_err.message);
    cfg.tools_.emplace(tool_id, ToolSigningConfig{*kid, std::move(*key)});
  }

  cfg.signed_http_required_ = true;
  return cfg;
}

std::optional<ToolkitRuntimeConfig> ToolkitRuntimeConfig::from_path(const std::string& path, Error* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    set_error(error, ErrorCode::io_error, "failed to read " + path);
    return std::nullopt;
  }
  std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  Error err;
  auto cfg = from_json(text, &err);
  if (!cfg) {
    set_error(error, err.code,
              "failed to parse " + path + " (expected ToolkitRuntimeConfig v1 JSON): " + err.message);
    return std::nullopt;
  }
  cfg->source_path_ = path;
  return cfg;
}

std::optional<ToolkitRuntimeConfig> ToolkitRuntimeConfig::from_env(Error* error) {
  const char* path = std::getenv(kEnvToolkitConfigPath);
  if (!path || !path[0]) return ToolkitRuntimeConfig{};
  return from_path(path, error);
}

std::optional<ToolkitRuntimeConfig> ToolkitRuntimeConfig::reload(Error* error) const {
  if (source_path_.empty()) return invalid(error, "config was not loaded from a file");
  return from_path(source_path_, error);
}

const ToolSigningConfig* ToolkitRuntimeConfig::tool(const std::string& tool_id) const {
  auto it = tools_.find(tool_id);
  return it == tools_.end() ? nullptr : &it->second;
}

std::string ToolkitRuntimeConfig::to_json() const {
  jsonlite::Object sh;
  sh["mode"] = jsonlite::Value{std::string(signed_http_required_ ? "required" : "disabled")};
  if (signed_http_required_) {
    sh["max_clock_skew_ms"] = jsonlite::Value{policy_.max_clock_skew_ms};
    sh["max_validity_ms"] = jsonlite::Value{policy_.max_validity_ms};
    sh["allowed_leaders"] = jsonlite::Value{static_cast<std::uint64_t>(allowed_leaders_.leader_count())};
    jsonlite::Object tools;
    for (const auto& [id, t] : tools_) {
      jsonlite::Object entry;
      entry["tool_kid"] = jsonlite::Value{t.tool_kid};
      auto pk = t.signing_key.public_key();
      entry["public_key"] = pk ? jsonlite::Value{to_hex(*pk)} : jsonlite::Value{nullptr};
      tools[id] = jsonlite::Value{std::move(entry)};
    }
    sh["tools"] = jsonlite::Value{std::move(tools)};
  }
  jsonlite::Object root;
  root["version"] = jsonlite::Value{static_cast<std::uint64_t>(version::RUNTIME_CONFIG_VERSION)};
  root["invoke_max_body_bytes"] = jsonlite::Value{invoke_max_body_bytes_};
  root["signed_http"] = jsonlite::Value{std::move(sh)};
  if (!source_path_.empty()) root["source_path"] = jsonlite::Value{source_path_};
  return jsonlite::to_json(root);
}

}  // namespace nexus
