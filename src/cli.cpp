#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "nexus/dag.hpp"
#include "nexus/hash.hpp"
#include "nexus/jsonlite.hpp"
#include "nexus/kat.hpp"
#include "nexus/nexus_data.hpp"
#include "nexus/observability.hpp"
#include "nexus/runtime_config.hpp"
#include "nexus/signed_http.hpp"
#include "nexus/version.hpp"

namespace {

std::optional<std::string> read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

// --name value pairs after the subcommand.
std::map<std::string, std::string> parse_flags(int argc, char **argv,
                                               int first) {
  std::map<std::string, std::string> flags;
  for (int i = first; i < argc; ++i) {
    std::string a = argv[i];
    if (a.rfind("--", 0) != 0)
      continue;
    if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0)
      flags[a.substr(2)] = argv[++i];
    else
      flags[a.substr(2)] = "";
  }
  return flags;
}

std::vector<std::string> split_csv(const std::string &s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ','))
    if (!item.empty())
      out.push_back(item);
  return out;
}

int fail(const nexus::Error &err) {
  std::cout << "{\"ok\":false,\"error\":" << err.to_json() << "}\n";
  return 2;
}

int usage() {
  std::cerr << "usage: nexus <command> [options]\n"
               "  version\n"
               "  health\n"
               "  dag validate --file <dag.json>\n"
               "  kat compile --expr <text> [--actions a,b] [--tests t,u]\n"
               "  config check [--file <config.json>]\n"
               "  key public --key <hex|base64>\n"
               "  data hint --file <data.json>\n"
               "  stats\n";
  return 1;
}

// Known BLAKE3 and SHA-256 vectors.
bool verify_hash_vectors() {
  if (nexus::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262")
    return false;
  if (nexus::sha256_hex("abc") !=
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad")
    return false;
  return true;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2)
    return usage();
  const std::string cmd = argv[1];
  const std::string sub = argc >= 3 ? argv[2] : "";

  if (cmd == "version") {
    std::cout << nexus::version::manifest_to_json(
                     nexus::version::current_manifest())
              << "\n";
    return 0;
  }

  if (cmd == "health") {
    const bool vectors_ok = verify_hash_vectors();
    std::cout << "{\"ok\":" << (vectors_ok ? "true" : "false")
              << ",\"blake3\":\"" << nexus::blake3_version_string() << "\""
              << ",\"semver\":\"" << nexus::version::TOOLKIT_SEMVER << "\"}\n";
    return vectors_ok ? 0 : 2;
  }

  if (cmd == "dag" && sub == "validate") {
    auto flags = parse_flags(argc, argv, 3);
    auto text = read_file(flags["file"]);
    if (!text)
      return fail(nexus::make_error(nexus::ErrorCode::io_error,
                                    "cannot read " + flags["file"]));
    nexus::Error err;
    auto description = nexus::dag::parse_dag_json(*text, &err);
    if (!description)
      return fail(err);
    const auto graph = nexus::dag::build_graph(*description);
    if (auto invalid = nexus::dag::validate(graph))
      return fail(*invalid);
    std::cout << "{\"ok\":true,\"vertices\":" << graph.vertices().size()
              << ",\"edges\":" << graph.edge_count() << ",\"fingerprint\":\""
              << nexus::dag::dag_fingerprint(graph) << "\"}\n";
    return 0;
  }

  if (cmd == "kat" && sub == "compile") {
    auto flags = parse_flags(argc, argv, 3);
    nexus::Error err;
    auto config = nexus::kat::ParserConfig::make(split_csv(flags["actions"]),
                                                 split_csv(flags["tests"]),
                                                 &err);
    if (!config)
      return fail(err);
    auto expr = nexus::kat::parse_kat(flags["expr"], *config, &err);
    if (!expr)
      return fail(err);
    const auto dfa = nexus::kat::compile(**expr);
    std::cout << "{\"ok\":true,\"expr\":\""
              << nexus::jsonlite::escape(nexus::kat::to_string(**expr))
              << "\",\"states\":" << dfa.states.size()
              << ",\"accepting\":" << dfa.accepting.size()
              << ",\"max_out_degree\":" << dfa.max_out_degree()
              << ",\"fingerprint\":\"" << nexus::kat::dfa_fingerprint(dfa)
              << "\"}\n";
    return 0;
  }

  if (cmd == "config" && sub == "check") {
    auto flags = parse_flags(argc, argv, 3);
    nexus::Error err;
    auto cfg = flags.count("file")
                   ? nexus::ToolkitRuntimeConfig::from_path(flags["file"], &err)
                   : nexus::ToolkitRuntimeConfig::from_env(&err);
    if (!cfg)
      return fail(err);
    std::cout << "{\"ok\":true,\"config\":" << cfg->to_json() << "}\n";
    return 0;
  }

  if (cmd == "key" && sub == "public") {
    auto flags = parse_flags(argc, argv, 3);
    nexus::Error err;
    auto key = nexus::signed_http::parse_signing_key(flags["key"], &err);
    if (!key)
      return fail(err);
    auto pk = key->public_key();
    if (!pk)
      return fail(nexus::make_error(nexus::ErrorCode::key_invalid_length,
                                    "cannot derive public key"));
    std::cout << "{\"ok\":true,\"public_key\":\""
              << nexus::to_hex(*pk)
              << "\"}\n";
    return 0;
  }

  if (cmd == "data" && sub == "hint") {
    auto flags = parse_flags(argc, argv, 3);
    auto text = read_file(flags["file"]);
    if (!text)
      return fail(nexus::make_error(nexus::ErrorCode::io_error,
                                    "cannot read " + flags["file"]));
    std::optional<nexus::jsonlite::JsonError> jerr;
    auto value = nexus::jsonlite::parse_value(*text, &jerr);
    if (jerr)
      return fail(nexus::make_error(nexus::ErrorCode::json_parse_error,
                                    jerr->message));
    nexus::Error err;
    auto fields = nexus::hint_remote_fields(value, &err);
    if (!fields)
      return fail(err);
    nexus::jsonlite::Array arr;
    for (auto &f : *fields)
      arr.push_back(nexus::jsonlite::Value{f});
    std::cout << "{\"ok\":true,\"remote_fields\":"
              << nexus::jsonlite::to_json(nexus::jsonlite::Value{arr})
              << "}\n";
    return 0;
  }

  if (cmd == "stats") {
    std::cout << nexus::global_toolkit_stats().to_json() << "\n";
    return 0;
  }

  return usage();
}
