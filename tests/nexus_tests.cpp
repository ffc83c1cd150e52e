#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "nexus/crypto.hpp"
#include "nexus/dag.hpp"
#include "nexus/events.hpp"
#include "nexus/hash.hpp"
#include "nexus/jsonlite.hpp"
#include "nexus/kat.hpp"
#include "nexus/nexus_data.hpp"
#include "nexus/observability.hpp"
#include "nexus/runtime_config.hpp"
#include "nexus/secret_store.hpp"
#include "nexus/session_store.hpp"
#include "nexus/signed_http.hpp"
#include "nexus/signed_http_engine.hpp"
#include "nexus/types.hpp"
#include "nexus/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

nexus::Key32 filled_key(std::uint8_t b) {
  nexus::Key32 k;
  k.fill(b);
  return k;
}

nexus::jsonlite::Value json(const std::string& text) {
  std::optional<nexus::jsonlite::JsonError> err;
  auto v = nexus::jsonlite::parse_value(text, &err);
  expect(!err, "test JSON must parse: " + text);
  return v;
}

fs::path scratch_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("nexus_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void write_text(const fs::path& path, const std::string& text) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << text;
}

// ============================================================================
// Phase 1: Hashing and encodings
// ============================================================================

void test_hash_known_vectors() {
  expect(nexus::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(nexus::sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "SHA-256 abc vector");
  expect(nexus::hash_domain("nexus.dag:", "x") != nexus::hash_domain("nexus.dfa:", "x"),
         "domains must separate fingerprints");
}

void test_base64_variants() {
  const std::string raw("\xfb\xff\x00\x10", 4);
  const std::string url = nexus::base64url_encode(raw);
  expect(url.find('=') == std::string::npos, "base64url never pads");
  expect(url.find('+') == std::string::npos && url.find('/') == std::string::npos, "base64url alphabet");
  expect(nexus::base64url_decode(url) == raw, "base64url decode");
  expect(nexus::base64_decode_any(nexus::base64_encode(raw)) == raw, "decode_any accepts padded standard");
  expect(nexus::base64_decode_any(url) == raw, "decode_any accepts url-safe");
  expect(!nexus::base64_decode("@@@@"), "invalid base64 rejected");
  expect(nexus::from_hex("0A0b") == std::string("\x0a\x0b", 2), "hex decode accepts both cases");
  expect(!nexus::from_hex("abc"), "odd-length hex rejected");
}

void test_error_taxonomy() {
  expect(nexus::to_string(nexus::ErrorCode::replay_in_flight) == "in_flight", "stable in_flight name");
  expect(nexus::to_string(nexus::ErrorCode::sig_body_hash_mismatch) == "body_hash_mismatch",
         "stable body_hash_mismatch name");
  expect(nexus::kind_of(nexus::ErrorCode::transport_error) == nexus::ErrorKind::transport, "transport kind");
  expect(nexus::kind_of(nexus::ErrorCode::dag_cycle) == nexus::ErrorKind::validation, "validation kind");
  expect(nexus::http_status_of(nexus::ErrorCode::replay_conflict) == 409, "conflict is 409");
  expect(nexus::http_status_of(nexus::ErrorCode::sig_expired) == 401, "expired is 401");
  expect(nexus::http_status_of(nexus::ErrorCode::dag_cycle) == 0, "dag errors never cross HTTP");
}

void test_version_manifest() {
  const auto m = nexus::version::current_manifest();
  expect(m.signed_http == 1 && m.allow_list == 1 && m.runtime_config == 1, "format versions");
  const std::string j = nexus::version::manifest_to_json(m);
  expect(j.find("\"toolkit_semver\"") != std::string::npos, "manifest has semver");
  expect(nexus::version::check_format("runtime_config", 1).ok, "v1 config accepted");
  expect(!nexus::version::check_format("runtime_config", 2).ok, "future config rejected");
  expect(!nexus::version::check_format("no_such_format", 1).ok, "unknown format rejected");
}

// ============================================================================
// Phase 2: DAG validator
// ============================================================================

std::string vertex_json(const std::string& name) {
  return "{\"name\":\"" + name + "\",\"kind\":{\"variant\":\"off_chain\",\"tool_fqn\":\"xyz.tool." + name + "@1\"}}";
}

std::string entry_json(const std::string& name, const std::vector<std::string>& ports) {
  std::string p;
  for (const auto& port : ports) p += (p.empty() ? "\"" : ",\"") + port + "\"";
  return "{\"name\":\"" + name + "\",\"kind\":{\"variant\":\"off_chain\",\"tool_fqn\":\"xyz.tool." + name +
         "@1\"},\"input_ports\":[" + p + "]}";
}

std::string edge_json(const std::string& from, const std::string& variant, const std::string& port,
                      const std::string& to, const std::string& input) {
  return "{\"from\":{\"vertex\":\"" + from + "\",\"output_variant\":\"" + variant + "\",\"output_port\":\"" + port +
         "\"},\"to\":{\"vertex\":\"" + to + "\",\"input_port\":\"" + input + "\"}}";
}

std::string default_json(const std::string& vertex, const std::string& port) {
  return "{\"vertex\":\"" + vertex + "\",\"input_port\":\"" + port +
         "\",\"value\":{\"storage\":\"inline\",\"data\":42}}";
}

std::string join(const std::vector<std::string>& parts) {
  std::string out;
  for (const auto& p : parts) out += (out.empty() ? "" : ",") + p;
  return out;
}

std::string dag_json(const std::vector<std::string>& vertices, const std::vector<std::string>& edges,
                     const std::vector<std::string>& entries, const std::vector<std::string>& defaults = {}) {
  return "{\"vertices\":[" + join(vertices) + "],\"edges\":[" + join(edges) + "],\"entry_vertices\":[" +
         join(entries) + "],\"default_values\":[" + join(defaults) + "]}";
}

void test_dag_minimal_accepted() {
  const auto text = dag_json({vertex_json("B")}, {edge_json("A", "ok", "out", "B", "x")}, {entry_json("A", {"in"})});
  const auto err = nexus::dag::validate_dag_json(text);
  expect(!err, "minimal chain must validate: " + (err ? err->message : ""));

  nexus::Error perr;
  auto d = nexus::dag::parse_dag_json(text, &perr);
  expect(d.has_value(), "parse minimal DAG");
  const auto g = nexus::dag::build_graph(*d);
  // A.in, A, A.ok, A.ok.out, B.x, B
  expect(g.vertices().size() == 6, "six vertices");
  expect(g.edge_count() == 5, "five edges");
}

void test_dag_exclusive_variants_merge() {
  // Two variants of one tool are mutually exclusive, so they may share a port.
  const auto text = dag_json({vertex_json("B")},
                             {edge_json("A", "ok", "out", "B", "x"), edge_json("A", "err", "reason", "B", "x")},
                             {entry_json("A", {"in"})});
  const auto err = nexus::dag::validate_dag_json(text);
  expect(!err, "exclusive variants may merge: " + (err ? err->message : ""));
}

void test_dag_join_through_second_port() {
  const auto text = dag_json({vertex_json("B")},
                             {edge_json("A", "ok", "left", "B", "x"), edge_json("A", "ok", "right", "B", "y")},
                             {entry_json("A", {"in"})});
  expect(!nexus::dag::validate_dag_json(text), "two-port fork joined at two input ports is valid");
}

void test_dag_second_entry_race_rejected() {
  const auto text = dag_json({vertex_json("B")},
                             {edge_json("A", "ok", "out", "B", "x"), edge_json("C", "ok", "out", "B", "x")},
                             {entry_json("A", {"in"}), entry_json("C", {"in"})});
  const auto err = nexus::dag::validate_dag_json(text);
  expect(err && err->code == nexus::ErrorCode::dag_concurrency_violated, "racing entries must be rejected");
}

void test_dag_second_entry_through_second_port() {
  // A.ok has one output port into B.x; entry C feeds B.y. No port merges, so nothing to balance.
  const auto single = dag_json({vertex_json("B")},
                               {edge_json("A", "ok", "out", "B", "x"), edge_json("C", "ok", "out", "B", "y")},
                               {entry_json("A", {"in"}), entry_json("C", {"in"})});
  const auto single_err = nexus::dag::validate_dag_json(single);
  expect(!single_err, "second entry on its own port is accepted: " + (single_err ? single_err->message : ""));

  // A.ok gains a second output port that also lands on B.y, making B.y a merge of A and C.
  const auto doubled = dag_json({vertex_json("B")},
                                {edge_json("A", "ok", "out", "B", "x"), edge_json("A", "ok", "extra", "B", "y"),
                                 edge_json("C", "ok", "out", "B", "y")},
                                {entry_json("A", {"in"}), entry_json("C", {"in"})});
  const auto doubled_err = nexus::dag::validate_dag_json(doubled);
  expect(doubled_err && doubled_err->code == nexus::ErrorCode::dag_concurrency_violated,
         "second output port merging with the second entry is rejected");
  expect(doubled_err->message.find("(balance 1)") != std::string::npos, "balance reported");
}

void test_dag_fork_into_one_port_rejected() {
  const auto text = dag_json({vertex_json("B")},
                             {edge_json("A", "ok", "left", "B", "x"), edge_json("A", "ok", "right", "B", "x")},
                             {entry_json("A", {"in"})});
  const auto err = nexus::dag::validate_dag_json(text);
  expect(err && err->code == nexus::ErrorCode::dag_concurrency_violated, "fork into one port must be rejected");
}

void test_dag_cycle_rejected() {
  const auto text = dag_json({vertex_json("A"), vertex_json("B")},
                             {edge_json("E", "ok", "out", "A", "z"), edge_json("A", "ok", "out", "B", "x"),
                              edge_json("B", "ok", "out", "A", "y")},
                             {entry_json("E", {"in"})});
  const auto err = nexus::dag::validate_dag_json(text);
  expect(err && err->code == nexus::ErrorCode::dag_cycle, "cycle detected");
}

void test_dag_no_entry_rejected() {
  const auto text = dag_json({vertex_json("A"), vertex_json("B")}, {edge_json("A", "ok", "out", "B", "x")}, {});
  const auto err = nexus::dag::validate_dag_json(text);
  expect(err && err->code == nexus::ErrorCode::dag_no_entry_vertices, "no entry vertices");
}

void test_dag_default_with_incoming_rejected() {
  const auto text = dag_json({vertex_json("B")}, {edge_json("A", "ok", "out", "B", "x")}, {entry_json("A", {"in"})},
                             {default_json("B", "x")});
  const auto err = nexus::dag::validate_dag_json(text);
  expect(err && err->code == nexus::ErrorCode::dag_default_has_incoming_edge, "default port with incoming edge");
}

void test_dag_layering_rejected() {
  nexus::dag::DagGraph g;
  const auto in = g.intern(nexus::dag::VertexKind::input_port, "T", "", "p");
  const auto variant = g.intern(nexus::dag::VertexKind::output_variant, "T", "ok", "");
  g.add_edge(in, variant);
  const auto err = nexus::dag::validate(g);
  expect(err && err->code == nexus::ErrorCode::dag_layering_violated, "input port must lead to a tool");
}

void test_dag_structure_errors() {
  nexus::Error err;
  auto dup_edge = dag_json({vertex_json("B")},
                           {edge_json("A", "ok", "out", "B", "x"), edge_json("A", "ok", "out", "B", "y")},
                           {entry_json("A", {"in"})});
  expect(!nexus::dag::parse_dag_json(dup_edge, &err), "duplicate output port edge");
  expect(err.code == nexus::ErrorCode::dag_invalid_definition, "structural error code");

  auto both = dag_json({vertex_json("A"), vertex_json("B")}, {edge_json("A", "ok", "out", "B", "x")},
                       {entry_json("A", {"in"})});
  expect(!nexus::dag::parse_dag_json(both, &err), "vertex declared twice as entry and vertex");

  expect(!nexus::dag::parse_dag_json("{\"vertices\":[]}", &err), "missing arrays rejected");
}

void test_dag_fingerprint_stable() {
  const auto a = dag_json({vertex_json("B")}, {edge_json("A", "ok", "out", "B", "x")}, {entry_json("A", {"in"})});
  const auto b = dag_json({vertex_json("B")},
                          {edge_json("A", "ok", "out", "B", "x"), edge_json("A", "err", "e", "B", "x")},
                          {entry_json("A", {"in"})});
  auto da = nexus::dag::parse_dag_json(a);
  auto db = nexus::dag::parse_dag_json(b);
  expect(da && db, "parse fingerprint inputs");
  const auto fa = nexus::dag::dag_fingerprint(nexus::dag::build_graph(*da));
  expect(fa == nexus::dag::dag_fingerprint(nexus::dag::build_graph(*da)), "fingerprint deterministic");
  expect(fa != nexus::dag::dag_fingerprint(nexus::dag::build_graph(*db)), "fingerprint covers edges");
  expect(fa.size() == 64, "fingerprint is BLAKE3 hex");
}

// ============================================================================
// Phase 3: KAT automata
// ============================================================================

nexus::kat::ExprPtr parse_kat(const std::string& text, const std::vector<std::string>& actions,
                              const std::vector<std::string>& tests) {
  nexus::Error err;
  auto config = nexus::kat::ParserConfig::make(actions, tests, &err);
  expect(config.has_value(), "parser config");
  auto expr = nexus::kat::parse_kat(text, *config, &err);
  expect(expr.has_value(), "parse '" + text + "': " + err.message);
  return *expr;
}

void test_kat_choice_of_actions() {
  const auto dfa = nexus::kat::compile(*parse_kat("a + b", {"a", "b"}, {}));
  const auto& start = dfa.states[dfa.start];
  expect(start.transitions.size() == 2, "start has two transitions");
  expect(start.transitions[0].label == nexus::kat::Label::make_action("a"), "first label is a");
  expect(start.transitions[1].label == nexus::kat::Label::make_action("b"), "second label is b");
  expect(dfa.is_accepting(start.transitions[0].to), "a leads to acceptance");
  expect(dfa.is_accepting(start.transitions[1].to), "b leads to acceptance");
  expect(!dfa.is_accepting(dfa.start), "empty word rejected");
}

void test_kat_label_order() {
  using nexus::kat::Label;
  expect(Label::make_action("z") < Label::make_test(nexus::kat::atom("a")), "actions sort before tests");
  expect(Label::make_action("a") < Label::make_action("b"), "actions sort by symbol");
  expect(nexus::kat::compare(nexus::kat::atom("t"), nexus::kat::tnot(nexus::kat::atom("t"))) < 0,
         "atoms sort before negations");
}

std::vector<std::vector<nexus::kat::Label>> words_up_to(const std::vector<nexus::kat::Label>& alphabet,
                                                        std::size_t max_len) {
  std::vector<std::vector<nexus::kat::Label>> out{{}};
  std::vector<std::vector<nexus::kat::Label>> frontier{{}};
  for (std::size_t len = 1; len <= max_len; ++len) {
    std::vector<std::vector<nexus::kat::Label>> next;
    for (const auto& w : frontier) {
      for (const auto& l : alphabet) {
        auto extended = w;
        extended.push_back(l);
        next.push_back(extended);
      }
    }
    out.insert(out.end(), next.begin(), next.end());
    frontier = std::move(next);
  }
  return out;
}

void test_kat_nfa_dfa_agree() {
  using nexus::kat::Label;
  const std::vector<Label> alphabet{Label::make_action("a"), Label::make_action("b"),
                                    Label::make_test(nexus::kat::atom("t")),
                                    Label::make_test(nexus::kat::tnot(nexus::kat::atom("t")))};
  const std::vector<std::string> exprs{"(a + b)* ; a", "a ; (b ; a)*", "t ; a + !t ; b", "(t ; a)* ; b", "1 + a",
                                       "0 ; a"};
  const auto words = words_up_to(alphabet, 4);
  for (const auto& text : exprs) {
    const auto expr = parse_kat(text, {"a", "b"}, {"t"});
    const auto enfa = nexus::kat::to_enfa(*expr);
    const auto dfa = nexus::kat::determinize(enfa);
    for (const auto& t : enfa.transitions) {
      expect(t.from < enfa.state_count && t.to < enfa.state_count, "dense ε-NFA state ids");
    }
    for (const auto& w : words) {
      expect(enfa.accepts(w) == dfa.accepts(w), "ε-NFA and DFA disagree on " + text);
    }
  }
  const auto star = nexus::kat::compile(*parse_kat("(a + b)* ; a", {"a", "b"}, {}));
  expect(star.accepts({Label::make_action("b"), Label::make_action("a")}), "ba accepted");
  expect(!star.accepts({Label::make_action("a"), Label::make_action("b")}), "ab rejected");
}

void test_kat_dfa_deterministic() {
  const auto dfa = nexus::kat::compile(*parse_kat("(a + a ; b)* ; (a + b)", {"a", "b"}, {}));
  for (const auto& s : dfa.states) {
    for (std::size_t i = 1; i < s.transitions.size(); ++i) {
      expect(s.transitions[i - 1].label < s.transitions[i].label, "transitions sorted and distinct");
    }
  }
  expect(dfa.max_out_degree() <= 2, "at most one transition per symbol");
}

void test_kat_parse_errors() {
  nexus::Error err;
  auto cfg = nexus::kat::ParserConfig::make({"a"}, {"t"}, &err);
  expect(cfg.has_value(), "config");
  expect(!nexus::kat::parse_kat("a +", *cfg, &err), "dangling choice");
  expect(err.code == nexus::ErrorCode::kat_parse_error, "kat parse error code");
  expect(!nexus::kat::parse_kat("c", *cfg, &err), "undeclared symbol");
  expect(!nexus::kat::ParserConfig::make({"a"}, {"a"}, &err), "symbol declared both ways");
}

void test_kat_serialization() {
  const auto dfa = nexus::kat::compile(*parse_kat("a ; b", {"a", "b"}, {}));
  nexus::kat::SymbolEncoder enc = [](const nexus::kat::Label& l) -> std::optional<std::string> {
    if (l.kind != nexus::kat::LabelKind::action) return std::nullopt;
    return std::string("S") + l.symbol;
  };
  nexus::Error err;
  auto bytes = nexus::kat::serialize_dfa(dfa, enc, &err);
  expect(bytes.has_value(), "serialize");
  expect(static_cast<std::uint8_t>((*bytes)[0]) == dfa.states.size(), "state count prefix");
  expect(bytes == nexus::kat::serialize_dfa(dfa, enc), "serialization deterministic");

  const auto with_test = nexus::kat::compile(*parse_kat("t ; a", {"a"}, {"t"}));
  expect(!nexus::kat::serialize_dfa(with_test, enc, &err), "unencodable label rejected");
  expect(nexus::kat::dfa_fingerprint(dfa) == nexus::kat::dfa_fingerprint(dfa), "DFA fingerprint stable");
}

// ============================================================================
// Phase 4: Secret store and session store
// ============================================================================

void test_secret_envelope_encrypted() {
  auto provider = nexus::secrets::StaticKeyProvider(filled_key(7));
  nexus::secrets::JsonSecret secret(json("{\"a\":1,\"b\":\"x\"}"));
  auto first = secret.serialize(provider);
  auto second = secret.serialize(provider);
  expect(first && second, "serialize under static key");
  expect(first->rfind("enc:v1:", 0) == 0, "encrypted prefix");
  expect(*first != *second, "fresh nonce per serialization");
  for (const auto& envelope : {*first, *second}) {
    auto back = nexus::secrets::JsonSecret::deserialize(envelope, provider);
    expect(back && back->value() == json("{\"a\":1,\"b\":\"x\"}"), "envelope round trip");
  }
}

void test_secret_envelope_plain_and_errors() {
  nexus::secrets::NoKeyProvider none;
  nexus::secrets::StaticKeyProvider keyed(filled_key(7));
  nexus::secrets::BytesSecret secret(std::string("hunter2"));

  auto plain = secret.serialize(none);
  expect(plain && plain->rfind("plain:v1:", 0) == 0, "plaintext prefix");
  expect(nexus::secrets::BytesSecret::deserialize(*plain, keyed)->value() == "hunter2", "plain opens with any key");

  auto enc = secret.serialize(keyed);
  nexus::Error err;
  expect(!nexus::secrets::BytesSecret::deserialize(*enc, none, &err), "enc without key fails");
  expect(err.code == nexus::ErrorCode::secret_key_unavailable, "key unavailable code");

  auto blob = nexus::base64_decode(enc->substr(nexus::secrets::kEncPrefix.size()));
  expect(blob.has_value(), "envelope body is base64");
  (*blob)[blob->size() - 1] = static_cast<char>((*blob)[blob->size() - 1] ^ 0x01);
  const std::string tampered = std::string(nexus::secrets::kEncPrefix) + nexus::base64_encode(*blob);
  expect(!nexus::secrets::BytesSecret::deserialize(tampered, keyed, &err), "tampered envelope fails");
  expect(err.code == nexus::ErrorCode::secret_crypto, "tamper is a crypto failure");

  expect(!nexus::secrets::open_envelope("zip:v1:AAAA", keyed, &err), "unknown prefix");
  expect(err.code == nexus::ErrorCode::secret_unknown_prefix, "unknown prefix code");

  std::ostringstream os;
  os << secret;
  expect(os.str() == "[REDACTED]", "secrets render redacted");
}

void test_secret_key_rotation() {
  nexus::secrets::StaticKeyProvider old_key(filled_key(1));
  auto envelope = nexus::secrets::seal_envelope("payload", old_key);
  expect(envelope.has_value(), "seal under old key");

  nexus::secrets::RotatingKeyProvider rotated(filled_key(2), {filled_key(1)});
  auto opened = nexus::secrets::open_envelope(*envelope, rotated);
  expect(opened == std::string("payload"), "previous key still opens");

  auto resealed = nexus::secrets::seal_envelope("payload", rotated);
  nexus::Error err;
  expect(!nexus::secrets::open_envelope(*resealed, old_key, &err), "new envelopes use the current key");
}

void test_secret_env_key_provider() {
  ::setenv("NEXUS_TEST_SECRET_KEY", nexus::to_hex(filled_key(9)).c_str(), 1);
  nexus::secrets::EnvKeyProvider provider("NEXUS_TEST_SECRET_KEY");
  auto envelope = nexus::secrets::seal_envelope("v", provider);
  expect(envelope && nexus::secrets::is_encrypted_envelope(*envelope), "env key encrypts");
  expect(nexus::secrets::open_envelope(*envelope, nexus::secrets::StaticKeyProvider(filled_key(9))) ==
             std::string("v"),
         "env key is the hex key");

  ::setenv("NEXUS_TEST_SECRET_KEY", "not-hex", 1);
  nexus::Error err;
  expect(!nexus::secrets::seal_envelope("v", provider, &err), "malformed env key fails");
  expect(err.code == nexus::ErrorCode::secret_provider, "provider error code");

  ::unsetenv("NEXUS_TEST_SECRET_KEY");
  auto plain = nexus::secrets::seal_envelope("v", provider);
  expect(plain && !nexus::secrets::is_encrypted_envelope(*plain), "unset env key means plaintext");
}

nexus::sessions::Session make_session(std::uint8_t id_byte, const std::string& state) {
  nexus::sessions::Session s;
  s.id.fill(id_byte);
  s.state = state;
  return s;
}

void test_session_store_checkout() {
  const auto dir = scratch_dir("sessions");
  auto provider = std::make_shared<nexus::secrets::StaticKeyProvider>(filled_key(3));
  nexus::sessions::CryptoStore store((dir / "store.json").string(), provider);

  nexus::Error err;
  expect(!store.get_active_session(&err), "empty store has no session");
  expect(err.code == nexus::ErrorCode::session_unavailable, "session unavailable");

  expect(!store.insert_session(make_session(0x02, "two")), "insert two");
  expect(!store.insert_session(make_session(0x01, "one")), "insert one");
  expect(store.session_count() == std::size_t{2}, "two sessions stored");

  auto first = store.get_active_session(&err);
  expect(first && first->state == "one", "lowest id checked out first");
  expect(store.session_count() == std::size_t{1}, "checked-out session removed from file");
  auto second = store.get_active_session(&err);
  expect(second && second->state == "two", "second checkout returns a different session");

  expect(!store.release_session(*first), "release first");
  expect(!store.release_session(*second), "release second");
  expect(store.session_count() == std::size_t{2}, "released sessions visible again");

  std::ifstream ifs(dir / "store.json");
  std::string on_disk((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  expect(on_disk.find("enc:v1:") != std::string::npos, "sessions stored as envelopes");
  fs::remove_all(dir);
}

void test_session_lease_releases() {
  const auto dir = scratch_dir("lease");
  nexus::sessions::CryptoStore store((dir / "store.json").string(), nullptr);
  expect(!store.insert_session(make_session(0x05, "s")), "insert");
  {
    auto lease = nexus::sessions::SessionLease::acquire(store);
    expect(lease.has_value(), "lease acquired");
    expect(lease->session().state == "s", "leased session");
    expect(store.session_count() == std::size_t{0}, "leased session hidden");
  }
  expect(store.session_count() == std::size_t{1}, "lease returns session on scope exit");
  fs::remove_all(dir);
}

void test_session_lease_drop_failure_reported() {
  static std::mutex mu;
  static std::vector<nexus::ToolkitEvent> captured;
  {
    std::lock_guard<std::mutex> lk(mu);
    captured.clear();
  }
  const auto dir = scratch_dir("lease_drop");
  const auto path = dir / "store.json";
  nexus::sessions::CryptoStore store(path.string(), nullptr);
  expect(!store.insert_session(make_session(0x06, "s")), "insert");

  nexus::set_toolkit_event_hook([](const nexus::ToolkitEvent& ev) {
    std::lock_guard<std::mutex> lk(mu);
    captured.push_back(ev);
  });
  {
    auto lease = nexus::sessions::SessionLease::acquire(store);
    expect(lease.has_value(), "lease acquired");
    // A non-empty directory in place of the store file makes the write-back fail.
    fs::remove(path);
    fs::create_directories(path / "blocker");
  }
  nexus::set_toolkit_event_hook(nullptr);

  bool reported = false;
  {
    std::lock_guard<std::mutex> lk(mu);
    for (const auto& ev : captured) {
      if (ev.component == "session_store" && ev.action == "lease_drop") {
        reported = !ev.ok && ev.error == nexus::ErrorCode::io_error && ev.subject == path.string();
      }
    }
  }
  expect(reported, "failed write-back on lease drop is reported");
  fs::remove_all(dir);
}

void test_identity_key_and_truncate() {
  const auto dir = scratch_dir("identity");
  auto provider = std::make_shared<nexus::secrets::StaticKeyProvider>(filled_key(4));
  nexus::sessions::CryptoStore store((dir / "store.json").string(), provider);

  nexus::Error err;
  expect(!store.identity_key(&err), "no identity key yet");
  auto generated = store.generate_identity_key(&err);
  expect(generated.has_value(), "generate identity key");
  expect(store.identity_key() == generated, "identity key persisted");

  expect(!store.insert_session(make_session(0x01, "x")), "insert");
  expect(!store.truncate(), "truncate");
  expect(!store.identity_key(&err), "identity cleared");
  expect(store.session_count() == std::size_t{0}, "sessions cleared");
  fs::remove_all(dir);
}

// ============================================================================
// Phase 5: NexusData codec
// ============================================================================

void test_nexus_data_large_integer_string() {
  const std::string big = "105792089237316195563853351929625371316844592863025172891227567439681422591090";
  auto data = nexus::NexusData::new_inline(nexus::jsonlite::Value{big});
  nexus::Error err;
  auto back = nexus::from_wire(nexus::to_wire(data), &err);
  expect(back.has_value(), "decode inline string");
  const auto* s = nexus::jsonlite::as_string(back->data);
  expect(s && *s == big, "large integer stays a JSON string");

  nexus::NexusDataWire bare;
  bare.storage = "inline";
  bare.one = " " + big + "\n";
  auto quoted = nexus::from_wire(bare, &err);
  expect(quoted && nexus::jsonlite::as_string(quoted->data) && *nexus::jsonlite::as_string(quoted->data) == big,
         "bare wide integer preserved as string");

  expect(nexus::preserve_large_integer("12345678901234567890") == "12345678901234567890", "u64-sized kept");
  expect(nexus::preserve_large_integer("-12345678901234567890") == "-12345678901234567890",
         "negative i64-sized kept");
  expect(nexus::preserve_large_integer("-123456789012345678901") == "\"-123456789012345678901\"",
         "wider negative quoted");
}

void test_nexus_data_round_trip() {
  const std::vector<nexus::NexusData> cases{
      nexus::NexusData::new_inline(json("{\"k\":[1,2,3]}")),
      nexus::NexusData::new_inline_encrypted(json("\"secret\"")),
      nexus::NexusData::new_walrus(json("[1,\"two\",{\"three\":3}]")),
      nexus::NexusData::new_walrus_encrypted(json("[]")),
  };
  for (const auto& d : cases) {
    const auto wire = nexus::to_wire(d);
    expect(wire.one.empty() || wire.many.empty(), "one and many are exclusive");
    nexus::Error err;
    auto back = nexus::from_wire(wire, &err);
    expect(back && *back == d, "wire round trip: " + err.message);
    auto via_json = nexus::wire_from_json(nexus::wire_to_json(wire), &err);
    expect(via_json && *via_json == wire, "on-chain JSON rendition");
  }
  const auto empty = nexus::to_wire(nexus::NexusData::new_inline(json("[]")));
  expect(empty.one.empty() && empty.many.empty(), "empty array leaves both empty");
  expect(nexus::to_wire(nexus::NexusData::new_walrus(json("1"))).storage == "walrus", "walrus tag");
}

void test_nexus_data_errors() {
  nexus::Error err;
  nexus::NexusDataWire w;
  w.storage = "ipfs";
  w.one = "1";
  expect(!nexus::from_wire(w, &err) && err.code == nexus::ErrorCode::nexus_data_unknown_storage, "unknown storage");

  w.storage = "inline";
  w.encryption_mode = 3;
  expect(!nexus::from_wire(w, &err) && err.code == nexus::ErrorCode::nexus_data_invalid_encryption_mode,
         "encryption mode 3 rejected");

  w.encryption_mode = 0;
  w.one = "\"\xff\"";
  expect(!nexus::from_wire(w, &err) && err.code == nexus::ErrorCode::nexus_data_invalid_utf8, "invalid utf-8");

  w.one = "{oops";
  expect(!nexus::from_wire(w, &err) && err.code == nexus::ErrorCode::nexus_data_invalid_json, "invalid JSON");
}

void test_nexus_data_input_helpers() {
  nexus::Error err;
  auto map = nexus::json_to_nexus_data_map(json("{\"a\":1,\"b\":2,\"c\":3}"), {"b"}, {"c"}, std::nullopt, &err);
  expect(map.has_value(), "wrap fields");
  expect(map->at("a").storage == nexus::StorageKind::inline_storage && !map->at("a").is_encrypted(), "plain inline");
  expect(map->at("b").encryption_mode == nexus::EncryptionMode::standard, "encrypted field");
  expect(map->at("c").storage == nexus::StorageKind::walrus, "remote field");
  expect(!nexus::json_to_nexus_data_map(json("{\"c\":3}"), {}, {"c"}, nexus::StorageKind::inline_storage, &err),
         "inline remote storage rejected");

  auto none = nexus::hint_remote_fields(json("{\"small\":1}"), &err);
  expect(none && none->empty(), "small object fits");
  const std::string big(40000, 'x');
  auto hinted = nexus::hint_remote_fields(json("{\"big\":\"" + big + "\",\"small\":1}"), &err);
  expect(hinted && hinted->size() == 1 && hinted->front() == "big", "largest field moves remote");
}

// ============================================================================
// Phase 6: Signed HTTP wire format
// ============================================================================

const std::string kScenarioBody = "{\"hello\":\"world\"}";

nexus::signed_http::RequestClaims scenario_claims(const std::string& body) {
  nexus::signed_http::RequestClaims c;
  c.leader_id = "leader-1";
  c.leader_kid = 0;
  c.tool_id = "tool-1";
  c.iat_ms = 1000;
  c.exp_ms = 2000;
  c.nonce = "abc";
  c.method = "POST";
  c.path = "/invoke";
  c.query = "";
  c.body_sha256 = nexus::sha256_hex(body);
  return c;
}

nexus::signed_http::ReceivedHeaders signed_headers(const nexus::signed_http::RequestClaims& claims,
                                                   const nexus::crypto::SigningKey& key,
                                                   std::string* sig_input = nullptr) {
  std::string input;
  nexus::Error err;
  auto headers = nexus::signed_http::sign_request(claims, key, &input, &err);
  expect(headers.has_value(), "sign_request: " + err.message);
  if (sig_input) *sig_input = input;
  return nexus::signed_http::ReceivedHeaders::from_map(headers->to_map());
}

void test_signing_key_formats() {
  const std::string hex = nexus::to_hex(filled_key(0x11));
  nexus::Error err;
  auto k1 = nexus::signed_http::parse_signing_key(hex, &err);
  auto k2 = nexus::signed_http::parse_signing_key("0x" + hex, &err);
  const std::string raw(32, '\x11');
  auto k3 = nexus::signed_http::parse_signing_key(nexus::base64_encode(raw), &err);
  auto k4 = nexus::signed_http::parse_signing_key(nexus::base64_encode(std::string(1, '\0') + raw), &err);
  expect(k1 && k2 && k3 && k4, "hex, 0x hex, base64 and flagged base64 keys");
  expect(k1->seed() == k2->seed() && k2->seed() == k3->seed() && k3->seed() == k4->seed(), "same seed");

  expect(!nexus::signed_http::parse_signing_key(nexus::base64_encode(std::string(1, '\x01') + raw), &err),
         "non-ed25519 flag rejected");
  expect(err.code == nexus::ErrorCode::key_unsupported_scheme_flag, "scheme flag code");
  expect(err.message.find("0x01") != std::string::npos, "flag named in message");
  expect(!nexus::signed_http::parse_signing_key(nexus::base64_encode(std::string(31, 'a')), &err),
         "short key rejected");
  expect(err.code == nexus::ErrorCode::key_invalid_length, "length code");
}

void test_time_window_rules() {
  using nexus::signed_http::validate_time_window;
  nexus::signed_http::Policy p;
  p.max_clock_skew_ms = 30000;
  p.max_validity_ms = 10000;
  expect(!validate_time_window(1000, 2000, 1500, p), "scenario window accepted");
  expect(validate_time_window(2000, 1000, 1500, p)->code == nexus::ErrorCode::sig_invalid_time_window,
         "exp before iat");
  expect(validate_time_window(1000, 20000, 1500, p)->code == nexus::ErrorCode::sig_validity_too_large,
         "validity too large");
  expect(validate_time_window(50000, 51000, 1500, p)->code == nexus::ErrorCode::sig_not_yet_valid,
         "issued in the future");
  expect(validate_time_window(1000, 2000, 40000, p)->code == nexus::ErrorCode::sig_expired, "expired");
  expect(!validate_time_window(1000, 2000, 31000, p), "expiry within skew accepted");
}

void test_signature_headers() {
  nexus::crypto::SigningKey leader(filled_key(0x11));
  std::string sig_input;
  auto headers = signed_headers(scenario_claims(kScenarioBody), leader, &sig_input);
  expect(headers.sig_v == std::string("1"), "version header");

  nexus::Error err;
  auto decoded = nexus::signed_http::decode_signature_headers(headers, &err);
  expect(decoded && decoded->sig_input == sig_input, "sig input decodes");
  expect(nexus::crypto::ed25519_verify(
             *leader.public_key(),
             nexus::signed_http::message_to_sign(nexus::signed_http::kDomainRequestV1, decoded->sig_input),
             decoded->signature),
         "signature over domain || sig_input");
  expect(!nexus::crypto::ed25519_verify(
             *leader.public_key(),
             nexus::signed_http::message_to_sign(nexus::signed_http::kDomainResponseV1, decoded->sig_input),
             decoded->signature),
         "request signature does not verify as a response");

  auto claims = nexus::signed_http::decode_request_claims(decoded->sig_input, &err);
  expect(claims && claims->nonce == "abc" && claims->body_sha256 == nexus::sha256_hex(kScenarioBody),
         "claims decode");
  expect(sig_input.find("\"leader_id\"") == 1, "leader_id is the first claim");

  std::map<std::string, std::string> lower{{"x-nexus-sig-v", "1"},
                                           {"x-nexus-sig-input", *headers.sig_input_b64},
                                           {"x-nexus-sig", *headers.sig_b64}};
  auto from_lower = nexus::signed_http::ReceivedHeaders::from_map(lower);
  expect(from_lower.sig_input_b64 == headers.sig_input_b64, "header names are case-insensitive");

  auto missing = headers;
  missing.sig_b64.reset();
  expect(!nexus::signed_http::decode_signature_headers(missing, &err) &&
             err.code == nexus::ErrorCode::sig_missing_header,
         "missing signature header");
  auto v2 = headers;
  v2.sig_v = "2";
  expect(!nexus::signed_http::decode_signature_headers(v2, &err) &&
             err.code == nexus::ErrorCode::sig_unsupported_version,
         "unsupported version");
  auto short_sig = headers;
  short_sig.sig_b64 = nexus::base64url_encode("short");
  expect(!nexus::signed_http::decode_signature_headers(short_sig, &err) &&
             err.code == nexus::ErrorCode::sig_invalid_signature_length,
         "short signature");
}

void test_allowed_leaders_file() {
  nexus::crypto::SigningKey leader(filled_key(0x11));
  const std::string pk_hex = nexus::to_hex(*leader.public_key());
  const std::string text = "{\"version\":1,\"leaders\":[{\"leader_id\":\"leader-1\",\"keys\":[{\"kid\":0,"
                           "\"public_key\":\"" + pk_hex + "\"}]}]}";
  nexus::Error err;
  auto leaders = nexus::signed_http::AllowedLeaders::from_json(text, &err);
  expect(leaders.has_value(), "allow-list parses: " + err.message);
  expect(leaders->key("leader-1", 0) == leader.public_key(), "key lookup");
  expect(!leaders->key("leader-1", 1), "unknown kid");

  const auto dir = scratch_dir("leaders");
  write_text(dir / "leaders.json", text);
  auto from_file = nexus::signed_http::AllowedLeaders::from_path((dir / "leaders.json").string(), &err);
  expect(from_file && from_file->source_path() == (dir / "leaders.json").string(), "from_path");

  std::string v2 = text;
  v2.replace(v2.find("\"version\":1"), 11, "\"version\":2");
  expect(!nexus::signed_http::AllowedLeaders::from_json(v2, &err), "future allow-list rejected");
  expect(err.code == nexus::ErrorCode::sig_invalid_allowed_leaders_file, "allow-list error code");
  expect(!nexus::signed_http::AllowedLeaders::from_path((dir / "missing.json").string(), &err), "missing file");
  fs::remove_all(dir);
}

// ============================================================================
// Phase 7: Signed HTTP engine
// ============================================================================

struct EngineFixture {
  nexus::crypto::SigningKey leader{filled_key(0x11)};
  nexus::crypto::SigningKey tool{filled_key(0x22)};
  std::shared_ptr<nexus::signed_http::FixedClock> clock = std::make_shared<nexus::signed_http::FixedClock>(1500);
  std::shared_ptr<nexus::signed_http::InMemoryReplayStore> store =
      std::make_shared<nexus::signed_http::InMemoryReplayStore>();

  nexus::signed_http::Policy policy() const {
    nexus::signed_http::Policy p;
    p.max_validity_ms = 10000;
    return p;
  }
  nexus::signed_http::SignedHttpEngine engine() const { return nexus::signed_http::SignedHttpEngine(policy(), clock); }
  nexus::signed_http::AllowedLeaders allowed() const {
    nexus::signed_http::AllowedLeaders a;
    a.insert("leader-1", 0, *leader.public_key());
    return a;
  }
  nexus::signed_http::Responder responder() const {
    return engine().responder("tool-1", 7, tool,
                              std::make_shared<nexus::signed_http::AllowedLeadersResolver>(allowed()), store);
  }
};

using nexus::signed_http::InvokeDecision;

void test_signed_http_happy_path() {
  EngineFixture f;
  std::string request_input;
  auto headers = signed_headers(scenario_claims(kScenarioBody), f.leader, &request_input);

  nexus::Error err;
  auto decision = f.responder().authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err);
  expect(decision.has_value(), "authenticated: " + err.message);
  expect(decision->kind == InvokeDecision::Kind::proceed && decision->session, "proceed");
  const auto& ctx = decision->session->auth_context();
  expect(ctx.invoker_id == "leader-1" && ctx.nonce == "abc" && ctx.method == "POST" && ctx.path == "/invoke",
         "auth context");
  expect(ctx.request_sig_input_sha256 == nexus::sha256(request_input), "request hash recorded");

  const std::string body = "{\"ok\":true}";
  auto response = decision->session->finish(200, body, &err);
  expect(response.has_value(), "finish: " + err.message);
  expect(response->status == 200 && response->body == body, "response carried");

  auto decoded = nexus::signed_http::decode_signature_headers(
      nexus::signed_http::ReceivedHeaders::from_map(response->headers.to_map()), &err);
  expect(decoded.has_value(), "response headers decode");
  auto rc = nexus::signed_http::decode_response_claims(decoded->sig_input, &err);
  expect(rc && rc->nonce == "abc" && rc->status == 200 && rc->tool_id == "tool-1" && rc->tool_kid == 7,
         "response claims");
  expect(rc->body_sha256 == nexus::sha256_hex(body), "response body bound");
  expect(rc->req_sig_input_sha256 == nexus::sha256_hex(request_input), "response bound to request");
  expect(nexus::crypto::ed25519_verify(
             *f.tool.public_key(),
             nexus::signed_http::message_to_sign(nexus::signed_http::kDomainResponseV1, decoded->sig_input),
             decoded->signature),
         "response signature verifies");
}

void test_signed_http_body_tamper() {
  EngineFixture f;
  auto headers = signed_headers(scenario_claims(kScenarioBody), f.leader);
  std::string tampered = kScenarioBody;
  tampered[2] = static_cast<char>(tampered[2] ^ 0x01);
  nexus::Error err;
  auto decision = f.responder().authenticate_invoke("POST", "/invoke", "", headers, tampered, &err);
  expect(!decision, "tampered body rejected");
  expect(err.code == nexus::ErrorCode::sig_body_hash_mismatch, "body hash mismatch");
  expect(f.store->size() == 0, "rejected request leaves no replay entry");
}

void test_signed_http_request_rejections() {
  EngineFixture f;
  auto responder = f.responder();
  auto headers = signed_headers(scenario_claims(kScenarioBody), f.leader);
  nexus::Error err;

  expect(!responder.authenticate_invoke("GET", "/invoke", "", headers, kScenarioBody, &err) &&
             err.code == nexus::ErrorCode::sig_method_mismatch,
         "method bound");
  expect(!responder.authenticate_invoke("POST", "/other", "", headers, kScenarioBody, &err) &&
             err.code == nexus::ErrorCode::sig_path_mismatch,
         "path bound");
  expect(!responder.authenticate_invoke("POST", "/invoke", "x=1", headers, kScenarioBody, &err) &&
             err.code == nexus::ErrorCode::sig_query_mismatch,
         "query bound");

  auto bad_sig = headers;
  auto sig = nexus::base64url_decode(*bad_sig.sig_b64);
  (*sig)[0] = static_cast<char>((*sig)[0] ^ 0x01);
  bad_sig.sig_b64 = nexus::base64url_encode(*sig);
  expect(!responder.authenticate_invoke("POST", "/invoke", "", bad_sig, kScenarioBody, &err) &&
             err.code == nexus::ErrorCode::sig_invalid_signature,
         "flipped signature bit");

  nexus::crypto::SigningKey stranger(filled_key(0x33));
  auto stranger_headers = signed_headers(scenario_claims(kScenarioBody), stranger);
  expect(!responder.authenticate_invoke("POST", "/invoke", "", stranger_headers, kScenarioBody, &err) &&
             err.code == nexus::ErrorCode::sig_invalid_signature,
         "allow-listed id with a foreign key");

  auto unknown = scenario_claims(kScenarioBody);
  unknown.leader_kid = 9;
  expect(!responder.authenticate_invoke("POST", "/invoke", "", signed_headers(unknown, f.leader), kScenarioBody,
                                        &err) &&
             err.code == nexus::ErrorCode::sig_unknown_leader_key,
         "unknown leader kid");

  auto other_tool = scenario_claims(kScenarioBody);
  other_tool.tool_id = "tool-2";
  expect(!responder.authenticate_invoke("POST", "/invoke", "", signed_headers(other_tool, f.leader), kScenarioBody,
                                        &err) &&
             err.code == nexus::ErrorCode::sig_tool_id_mismatch,
         "tool id bound");

  f.clock->set(40000);
  expect(!responder.authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err) &&
             err.code == nexus::ErrorCode::sig_expired,
         "expired request");
  expect(f.store->size() == 0, "no replay entries from rejected requests");
}

void test_signed_http_in_flight_then_cached() {
  EngineFixture f;
  auto responder = f.responder();
  auto headers = signed_headers(scenario_claims(kScenarioBody), f.leader);
  nexus::Error err;

  auto first = responder.authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err);
  expect(first && first->kind == InvokeDecision::Kind::proceed, "first request proceeds");

  auto concurrent = responder.authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err);
  expect(concurrent && concurrent->kind == InvokeDecision::Kind::rejected, "identical request while in flight");
  expect(concurrent->rejection->kind == nexus::signed_http::ResponderRejection::Kind::in_flight, "in-flight kind");
  expect(concurrent->rejection->code() == nexus::ErrorCode::replay_in_flight, "in-flight code");

  auto response = first->session->finish(200, "{\"ok\":true}", &err);
  expect(response.has_value(), "first finishes");

  auto replay = responder.authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err);
  expect(replay && replay->kind == InvokeDecision::Kind::replayed, "identical re-request replays");
  expect(replay->response->status == 200 && replay->response->body == "{\"ok\":true}", "cached response");
  expect(replay->response->headers.sig_b64 == response->headers.sig_b64 &&
             replay->response->headers.sig_input_b64 == response->headers.sig_input_b64,
         "cached response returned verbatim");

  const std::string other_body = "{\"hello\":\"there\"}";
  auto conflicting = responder.authenticate_invoke("POST", "/invoke", "",
                                                   signed_headers(scenario_claims(other_body), f.leader),
                                                   other_body, &err);
  expect(conflicting && conflicting->kind == InvokeDecision::Kind::rejected, "same nonce, different request");
  expect(conflicting->rejection->kind == nexus::signed_http::ResponderRejection::Kind::replay_conflict,
         "replay conflict kind");
}

void test_signed_http_session_drop_releases() {
  EngineFixture f;
  auto responder = f.responder();
  auto headers = signed_headers(scenario_claims(kScenarioBody), f.leader);
  nexus::Error err;
  {
    auto first = responder.authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err);
    expect(first && first->kind == InvokeDecision::Kind::proceed, "proceed");
    expect(f.store->size() == 1, "in-flight reservation held");
  }
  expect(f.store->size() == 0, "dropped session releases its reservation");
  auto retry = responder.authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err);
  expect(retry && retry->kind == InvokeDecision::Kind::proceed, "retry proceeds after drop");
}

void test_signed_http_finish_twice_and_rejection_signing() {
  EngineFixture f;
  auto responder = f.responder();
  auto headers = signed_headers(scenario_claims(kScenarioBody), f.leader);
  nexus::Error err;

  auto first = responder.authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err);
  auto concurrent = responder.authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err);
  expect(concurrent && concurrent->rejection, "rejection available");

  auto signed_rejection = concurrent->rejection->sign_response(409, "{\"error\":\"in_flight\"}", &err);
  expect(signed_rejection && signed_rejection->status == 409, "rejection signed");
  auto decoded = nexus::signed_http::decode_signature_headers(
      nexus::signed_http::ReceivedHeaders::from_map(signed_rejection->headers.to_map()), &err);
  auto rc = nexus::signed_http::decode_response_claims(decoded->sig_input, &err);
  expect(rc && rc->status == 409 && rc->nonce == "abc", "rejection claims carry the request nonce");
  expect(f.store->size() == 1, "rejection does not touch the replay store");

  expect(first->session->finish(200, "{\"ok\":true}", &err).has_value(), "finish once");
  expect(!first->session->finish(200, "{\"ok\":true}", &err), "finish twice fails");
  expect(err.code == nexus::ErrorCode::replay_in_flight, "second finish code");
}

void test_signed_http_invoker_round_trip() {
  EngineFixture f;
  auto engine = f.engine();
  auto invoker = engine.invoker("leader-1", 0, f.leader);
  auto responder = f.responder();
  const std::string body = "{\"input\":1}";

  nexus::Error err;
  auto session = invoker.begin_invoke("tool-1", "POST", "/invoke", "a=b", body, &err);
  expect(session.has_value(), "begin_invoke: " + err.message);
  expect(!session->nonce().empty() && session->nonce().find('=') == std::string::npos, "random nonce base64url");
  auto again = invoker.begin_invoke("tool-1", "POST", "/invoke", "a=b", body, &err);
  expect(again && again->nonce() != session->nonce(), "nonces are fresh");

  auto received = nexus::signed_http::ReceivedHeaders::from_map(session->request_headers().to_map());
  auto decision = responder.authenticate_invoke("POST", "/invoke", "a=b", received, body, &err);
  expect(decision && decision->kind == InvokeDecision::Kind::proceed, "responder accepts: " + err.message);
  expect(decision->session->auth_context().nonce == session->nonce(), "nonce carried");

  auto response = decision->session->finish(200, "{\"ok\":true}", &err);
  expect(response.has_value(), "finish");
  const auto response_headers = nexus::signed_http::ReceivedHeaders::from_map(response->headers.to_map());

  nexus::signed_http::StaticResponderKey resolver("tool-1", 7, *f.tool.public_key());
  auto verified = session->verify_response(response->status, response_headers, response->body, resolver, &err);
  expect(verified.has_value(), "invoker verifies: " + err.message);
  expect(verified->status == 200 && verified->nonce == session->nonce() && verified->responder_id == "tool-1",
         "verified response");

  expect(!session->verify_response(201, response_headers, response->body, resolver, &err) &&
             err.code == nexus::ErrorCode::sig_status_mismatch,
         "status bound");
  expect(!session->verify_response(200, response_headers, "{\"ok\":false}", resolver, &err) &&
             err.code == nexus::ErrorCode::sig_body_hash_mismatch,
         "response body bound");
  nexus::signed_http::StaticResponderKey wrong_kid("tool-1", 8, *f.tool.public_key());
  expect(!session->verify_response(200, response_headers, response->body, wrong_kid, &err) &&
             err.code == nexus::ErrorCode::sig_unknown_tool_key,
         "unknown tool key");
  expect(!again->verify_response(200, response_headers, response->body, resolver, &err) &&
             err.code == nexus::ErrorCode::sig_request_binding_mismatch,
         "response bound to its own request");
}

// Advances one millisecond on every reading.
class TickingClock : public nexus::signed_http::Clock {
 public:
  explicit TickingClock(std::uint64_t start) : next_(start) {}
  std::uint64_t now_ms() const override { return next_.fetch_add(1); }

 private:
  mutable std::atomic<std::uint64_t> next_;
};

class RecordingReplayStore : public nexus::signed_http::InMemoryReplayStore {
 public:
  nexus::signed_http::ReplayDecision begin_or_replay(const std::string& key, const nexus::Digest32& request_hash,
                                                     std::uint64_t expires_at_ms, std::uint64_t now_ms) override {
    seen_now_ms.push_back(now_ms);
    return InMemoryReplayStore::begin_or_replay(key, request_hash, expires_at_ms, now_ms);
  }

  std::vector<std::uint64_t> seen_now_ms;
};

std::uint64_t response_iat(const nexus::signed_http::SignedResponse& response) {
  nexus::Error err;
  auto decoded = nexus::signed_http::decode_signature_headers(
      nexus::signed_http::ReceivedHeaders::from_map(response.headers.to_map()), &err);
  expect(decoded.has_value(), "response headers decode");
  auto rc = nexus::signed_http::decode_response_claims(decoded->sig_input, &err);
  expect(rc.has_value(), "response claims decode");
  return rc->iat_ms;
}

void test_signed_http_single_clock_reading() {
  EngineFixture f;
  auto clock = std::make_shared<TickingClock>(1500);
  auto store = std::make_shared<RecordingReplayStore>();
  nexus::signed_http::SignedHttpEngine engine(f.policy(), clock);
  auto responder = engine.responder("tool-1", 7, f.tool,
                                    std::make_shared<nexus::signed_http::AllowedLeadersResolver>(f.allowed()), store);
  auto headers = signed_headers(scenario_claims(kScenarioBody), f.leader);
  nexus::Error err;

  auto first = responder.authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err);
  expect(first && first->kind == InvokeDecision::Kind::proceed, "proceed: " + err.message);
  const std::uint64_t now = first->session->auth_context().now_ms;
  expect(now == 1500, "auth context carries the first reading");
  expect(store->seen_now_ms.size() == 1 && store->seen_now_ms[0] == now, "replay store saw the same reading");

  auto concurrent = responder.authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err);
  expect(concurrent && concurrent->rejection, "in-flight rejection");
  const std::uint64_t rejection_now = concurrent->rejection->auth_context().now_ms;
  expect(rejection_now == now + 1, "one reading per request");
  auto rejected = concurrent->rejection->sign_response(409, "{}", &err);
  expect(rejected && response_iat(*rejected) == rejection_now, "rejection iat reuses the request reading");

  auto response = first->session->finish(200, "{\"ok\":true}", &err);
  expect(response && response_iat(*response) == now, "response iat reuses the request reading");
}

void test_signed_http_stats_and_hook() {
  static std::mutex mu;
  static std::vector<nexus::ToolkitEvent> captured;
  {
    std::lock_guard<std::mutex> lk(mu);
    captured.clear();
  }
  nexus::set_toolkit_event_hook([](const nexus::ToolkitEvent& ev) {
    std::lock_guard<std::mutex> lk(mu);
    captured.push_back(ev);
  });

  auto& stats = nexus::global_toolkit_stats();
  const auto authenticated_before = stats.requests_authenticated.load();
  const auto replay_before = stats.replay_hits.load();

  EngineFixture f;
  auto responder = f.responder();
  auto headers = signed_headers(scenario_claims(kScenarioBody), f.leader);
  nexus::Error err;
  auto first = responder.authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err);
  expect(first->session->finish(200, "{}", &err).has_value(), "finish");
  auto replay = responder.authenticate_invoke("POST", "/invoke", "", headers, kScenarioBody, &err);
  expect(replay && replay->kind == InvokeDecision::Kind::replayed, "replayed");
  nexus::set_toolkit_event_hook(nullptr);

  expect(stats.requests_authenticated.load() > authenticated_before, "authentication counted");
  expect(stats.replay_hits.load() > replay_before, "replay counted");

  std::lock_guard<std::mutex> lk(mu);
  bool saw_authenticate = false;
  for (const auto& ev : captured) {
    if (ev.component == "signed_http" && ev.action == "authenticate" && ev.ok) saw_authenticate = true;
    const std::string line = nexus::event_to_json(ev);
    expect(line.find(nexus::to_hex(f.tool.seed())) == std::string::npos, "events carry no key material");
  }
  expect(saw_authenticate, "authenticate event emitted");
}

// ============================================================================
// Phase 8: Runtime configuration
// ============================================================================

std::string runtime_config_json(const nexus::crypto::SigningKey& leader, const std::string& tool_key) {
  return "{\"version\":1,\"invoke_max_body_bytes\":2048,\"signed_http\":{\"mode\":\"required\","
         "\"allowed_leaders\":{\"version\":1,\"leaders\":[{\"leader_id\":\"leader-1\",\"keys\":[{\"kid\":0,"
         "\"public_key\":\"" +
         nexus::to_hex(*leader.public_key()) +
         "\"}]}]},\"max_clock_skew_ms\":1000,"
         "\"tools\":{\"tool-1\":{\"tool_kid\":7,\"tool_signing_key\":\"" +
         tool_key + "\"}}}}";
}

void test_runtime_config_parsing() {
  nexus::crypto::SigningKey leader(filled_key(0x11));
  const std::string seed_hex = nexus::to_hex(filled_key(0x22));
  nexus::Error err;
  auto cfg = nexus::ToolkitRuntimeConfig::from_json(runtime_config_json(leader, seed_hex), &err);
  expect(cfg.has_value(), "config parses: " + err.message);
  expect(cfg->signed_http_is_required(), "signed http required");
  expect(cfg->invoke_max_body_bytes() == 2048, "body limit");
  expect(cfg->policy().max_clock_skew_ms == 1000, "skew override");
  expect(cfg->policy().max_validity_ms == nexus::signed_http::kDefaultMaxValidityMs, "validity default");
  expect(cfg->has_tool("tool-1") && cfg->tool("tool-1")->tool_kid == 7, "tool entry");
  expect(!cfg->tool("tool-2"), "unknown tool");
  expect(cfg->allowed_leaders().key("leader-1", 0) == leader.public_key(), "inline allow-list");
  expect(cfg->to_json().find(seed_hex) == std::string::npos, "summary carries no key material");

  auto disabled = nexus::ToolkitRuntimeConfig::from_json("{\"version\":1}", &err);
  expect(disabled && !disabled->signed_http_is_required(), "absent section disables signed http");
  expect(disabled->invoke_max_body_bytes() == nexus::kDefaultInvokeMaxBodyBytes, "10 MiB default");

  auto off = nexus::ToolkitRuntimeConfig::from_json(
      "{\"version\":1,\"signed_http\":{\"mode\":\"disabled\"}}", &err);
  expect(off && !off->signed_http_is_required(), "disabled mode");
}

void test_runtime_config_errors() {
  nexus::crypto::SigningKey leader(filled_key(0x11));
  nexus::Error err;
  expect(!nexus::ToolkitRuntimeConfig::from_json("{\"version\":2}", &err) &&
             err.code == nexus::ErrorCode::config_invalid,
         "future version rejected");
  expect(!nexus::ToolkitRuntimeConfig::from_json(
             "{\"version\":1,\"signed_http\":{\"mode\":\"optional\"}}", &err),
         "unknown mode rejected");
  expect(!nexus::ToolkitRuntimeConfig::from_json(
             "{\"version\":1,\"signed_http\":{\"mode\":\"required\",\"tools\":{}}}", &err),
         "allow-list required");
  expect(err.message.find("allowed_leaders") != std::string::npos, "allow-list named in message");

  expect(!nexus::ToolkitRuntimeConfig::from_json(runtime_config_json(leader, "zz"), &err), "bad tool key");
  expect(err.code == nexus::ErrorCode::config_invalid, "bad key is a config error");
  expect(err.message.find("invalid signed_http.tools[\"tool-1\"].tool_signing_key") != std::string::npos,
         "bad key names the tool");
}

void test_runtime_config_from_env_and_reload() {
  nexus::crypto::SigningKey leader(filled_key(0x11));
  const auto dir = scratch_dir("config");
  const auto path = dir / "toolkit.json";
  const std::string flagged = nexus::base64_encode(std::string(1, '\0') + std::string(32, '\x22'));
  write_text(path, runtime_config_json(leader, flagged));

  ::setenv(nexus::kEnvToolkitConfigPath, path.string().c_str(), 1);
  nexus::Error err;
  auto cfg = nexus::ToolkitRuntimeConfig::from_env(&err);
  expect(cfg && cfg->signed_http_is_required(), "config from env: " + err.message);
  expect(cfg->source_path() == path.string(), "source path recorded");
  expect(cfg->tool("tool-1")->signing_key.seed() == filled_key(0x22), "flagged base64 key");

  write_text(path, "{\"version\":1}");
  auto reloaded = cfg->reload(&err);
  expect(reloaded && !reloaded->signed_http_is_required(), "reload picks up changes");

  write_text(path, "{not json");
  expect(!cfg->reload(&err), "reload of broken file fails");
  expect(err.message.find("expected ToolkitRuntimeConfig v1 JSON") != std::string::npos, "parse failure wrapped");

  ::unsetenv(nexus::kEnvToolkitConfigPath);
  auto defaults = nexus::ToolkitRuntimeConfig::from_env(&err);
  expect(defaults && !defaults->signed_http_is_required(), "unset env means defaults");
  expect(!defaults->reload(&err), "nothing to reload without a file");
  fs::remove_all(dir);
}

// ============================================================================
// Phase 9: Event fetcher
// ============================================================================

const std::string kPackage = "0x0000000000000000000000000000000000000000000000000000000000000abc";

std::string event_node(std::uint64_t seq, const std::string& package, const std::string& repr) {
  return "{\"sequenceNumber\":" + std::to_string(seq) +
         ",\"transaction\":{\"digest\":\"D" + std::to_string(seq) +
         "\"},\"transactionModule\":{\"package\":{\"address\":\"" + package +
         "\"}},\"contents\":{\"type\":{\"repr\":\"" + repr + "\"},\"json\":{\"event\":{\"walk\":" +
         std::to_string(seq) + "}}}}";
}

std::string page_body(const std::vector<std::string>& nodes, const std::string& cursor) {
  return "{\"data\":{\"events\":{\"nodes\":[" + join(nodes) + "],\"pageInfo\":{\"endCursor\":\"" + cursor +
         "\",\"hasNextPage\":false}}}}";
}

const std::string kEmptyPage =
    "{\"data\":{\"events\":{\"nodes\":[],\"pageInfo\":{\"endCursor\":null,\"hasNextPage\":false}}}}";

class ScriptedTransport : public nexus::events::GraphqlTransport {
 public:
  explicit ScriptedTransport(std::vector<std::optional<std::string>> script) : script_(std::move(script)) {}

  std::optional<std::string> post(const std::string& request_json, nexus::Error* error) override {
    std::lock_guard<std::mutex> lk(mu_);
    requests_.push_back(request_json);
    if (next_ < script_.size()) {
      auto item = script_[next_++];
      if (!item) nexus::set_error(error, nexus::ErrorCode::transport_error, "connection refused");
      return item;
    }
    return kEmptyPage;
  }

  std::vector<std::string> requests() const {
    std::lock_guard<std::mutex> lk(mu_);
    return requests_;
  }

 private:
  mutable std::mutex mu_;
  std::vector<std::optional<std::string>> script_;
  std::size_t next_{0};
  std::vector<std::string> requests_;
};

nexus::events::EventFilter nexus_filter() {
  nexus::events::EventFilter filter;
  filter.package = "0xabc";
  return filter;
}

void test_type_tags() {
  nexus::Error err;
  auto tag = nexus::events::parse_type_tag(
      "0xabc::event::EventWrapper<0xabc::dag::RequestScheduledExecution<0xabc::dag::OccurrenceScheduledEvent>>",
      &err);
  expect(tag.has_value(), "nested tag parses");
  expect(tag->module == "event" && tag->name == "EventWrapper" && tag->params.size() == 1, "wrapper tag");
  expect(tag->params[0].params[0].name == "OccurrenceScheduledEvent", "nested parameter");
  expect(nexus::events::normalize_event_name(tag->params[0]) == std::string("RequestScheduledOccurrenceEvent"),
         "scheduled occurrence renamed");

  auto walk = nexus::events::parse_type_tag("0x1::dag::RequestScheduledExecution<0x1::dag::RequestWalkExecutionEvent>");
  expect(nexus::events::normalize_event_name(*walk) == std::string("RequestScheduledWalkEvent"), "walk renamed");
  auto odd = nexus::events::parse_type_tag("0x1::dag::RequestScheduledExecution<0x1::dag::Other>");
  expect(!nexus::events::normalize_event_name(*odd, &err), "unknown scheduled payload");

  auto prim = nexus::events::parse_type_tag("0x2::vec::Vec<u64, address>");
  expect(prim && prim->params.size() == 2 && !prim->params[0].is_struct(), "primitive parameters");
  expect(!nexus::events::parse_type_tag("0x2::vec::Vec<u64", &err), "unbalanced tag rejected");
  expect(nexus::events::normalize_address(kPackage) == "0xabc", "address normalized");
  expect(nexus::events::normalize_address("0x000") == "0x0", "zero address");
}

void test_parse_event() {
  const auto filter = nexus_filter();
  nexus::Error err;
  auto ev = nexus::events::parse_event(
      json(event_node(3, kPackage, "0xabc::event::EventWrapper<0xabc::dag::WalkAdvancedEvent>")), filter, &err);
  expect(ev.has_value(), "event parses: " + err.message);
  expect(ev->name == "WalkAdvancedEvent" && ev->id.index == 3 && ev->id.tx_digest == "D3", "event fields");
  expect(ev->payload == json("{\"walk\":3}"), "payload is contents.json.event");

  expect(!nexus::events::parse_event(
             json(event_node(4, "0xdef", "0xabc::event::EventWrapper<0xabc::dag::WalkAdvancedEvent>")), filter,
             &err),
         "foreign package rejected");
  expect(err.message.find("Event does not come from a Nexus package") != std::string::npos, "foreign message");
  expect(!nexus::events::parse_event(json(event_node(5, kPackage, "0xabc::dag::WalkAdvancedEvent")), filter, &err),
         "unwrapped event rejected");
  expect(err.code == nexus::ErrorCode::event_parse_error, "event parse error code");

  auto extra = filter;
  extra.extra_packages.push_back("0xdef");
  expect(nexus::events::parse_event(
             json(event_node(6, "0xdef", "0xabc::event::EventWrapper<0xabc::dag::WalkAdvancedEvent>")), extra)
             .has_value(),
         "extra package accepted");

  auto typed = filter;
  typed.inner_type = "0xabc::dag::WalkAdvancedEvent";
  expect(typed.type_filter() == "0xabc::event::EventWrapper<0xabc::dag::WalkAdvancedEvent>", "typed filter");
}

void test_events_response_parsing() {
  nexus::Error err;
  expect(!nexus::events::parse_events_response("{\"errors\":[{\"message\":\"boom\"}]}", &err), "graphql errors");
  expect(err.code == nexus::ErrorCode::graphql_error && err.message == "GraphQL error: boom", "graphql message");
  expect(!nexus::events::parse_events_response("{\"data\":{}}", &err), "missing nodes");
  auto page = nexus::events::parse_events_response(page_body({"{}"}, "c9"), &err);
  expect(page && page->nodes.size() == 1 && page->end_cursor == std::string("c9"), "page parsed");
  auto empty = nexus::events::parse_events_response(kEmptyPage, &err);
  expect(empty && empty->nodes.empty() && !empty->end_cursor, "empty page");

  nexus::events::EventsQuery q;
  q.type_filter = "0xabc::event::EventWrapper";
  q.at_checkpoint = 42;
  auto obj = nexus::jsonlite::parse(q.to_json(), nullptr);
  const auto* vars = nexus::jsonlite::as_object(*nexus::jsonlite::find(obj, "variables"));
  expect(vars && nexus::jsonlite::is_null(*nexus::jsonlite::find(*vars, "after")), "no cursor yet");
  const auto* f = nexus::jsonlite::as_object(*nexus::jsonlite::find(*vars, "filter"));
  expect(nexus::jsonlite::get_u64(*f, "atCheckpoint") == 42, "checkpoint filter");
}

void test_event_channel_bounds() {
  nexus::events::EventChannel<int> ch(2);
  expect(ch.send(1) && ch.send(2), "fill channel");
  std::atomic<bool> third_sent{false};
  std::thread producer([&] { third_sent = ch.send(3); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  expect(!third_sent.load(), "send blocks while full");
  expect(ch.receive() == 1, "fifo order");
  producer.join();
  expect(third_sent.load(), "send resumes after receive");
  expect(ch.size() == 2, "two queued");

  std::atomic<bool> blocked_result{true};
  std::thread blocked([&] { blocked_result = ch.send(4); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ch.close();
  blocked.join();
  expect(!blocked_result.load(), "close releases a blocked sender");
  expect(!ch.receive(), "closed channel yields nothing");
  expect(!ch.send(5), "send after close fails");
  expect(ch.wait_closed_for(std::chrono::milliseconds(1)), "closed channel wakes waiters");
}

std::optional<std::string> request_after(const std::string& request_json) {
  auto obj = nexus::jsonlite::parse(request_json, nullptr);
  const auto* vars = nexus::jsonlite::as_object(*nexus::jsonlite::find(obj, "variables"));
  const auto* after = nexus::jsonlite::find(*vars, "after");
  if (!after || nexus::jsonlite::is_null(*after)) return std::nullopt;
  return *nexus::jsonlite::as_string(*after);
}

bool request_has_checkpoint(const std::string& request_json) {
  auto obj = nexus::jsonlite::parse(request_json, nullptr);
  const auto* vars = nexus::jsonlite::as_object(*nexus::jsonlite::find(obj, "variables"));
  const auto* filter = nexus::jsonlite::as_object(*nexus::jsonlite::find(*vars, "filter"));
  return nexus::jsonlite::find(*filter, "atCheckpoint") != nullptr;
}

void test_event_stream_close() {
  auto transport = std::make_shared<ScriptedTransport>(std::vector<std::optional<std::string>>{});
  nexus::events::FetcherConfig config;
  config.initial_backoff = std::chrono::milliseconds(1);
  config.max_backoff = std::chrono::milliseconds(2);
  config.channel_capacity = 2;
  nexus::events::EventFetcher fetcher(transport, nexus_filter(), config);

  auto stream = fetcher.poll();
  stream->close();
  std::size_t drained = 0;
  while (stream->next()) ++drained;
  expect(drained <= 2, "closed stream drains at most its capacity");
  stream->close();
  expect(!stream->next_for(std::chrono::milliseconds(1)), "closed stream stays empty");

  const auto sent = transport->requests().size();
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  expect(transport->requests().size() == sent, "poller joined on close");
}

void test_event_fetcher_polling() {
  const std::string wrapped = "0xabc::event::EventWrapper<0xabc::dag::WalkAdvancedEvent>";
  auto transport = std::make_shared<ScriptedTransport>(std::vector<std::optional<std::string>>{
      std::nullopt,
      std::string("{\"errors\":[{\"message\":\"rate limited\"}]}"),
      page_body({event_node(1, kPackage, wrapped), event_node(2, "0xdef", wrapped), event_node(3, kPackage, wrapped)},
                "c1"),
  });

  nexus::events::FetcherConfig config;
  config.initial_backoff = std::chrono::milliseconds(1);
  config.max_backoff = std::chrono::milliseconds(4);
  config.channel_capacity = 4;
  nexus::events::EventFetcher fetcher(transport, nexus_filter(), config);

  auto stream = fetcher.poll(std::nullopt, 42);
  auto first = stream->next_for(std::chrono::seconds(5));
  expect(first && !first->ok() && first->error->code == nexus::ErrorCode::transport_error, "transport error surfaced");
  auto second = stream->next_for(std::chrono::seconds(5));
  expect(second && !second->ok() && second->error->code == nexus::ErrorCode::graphql_error, "graphql error surfaced");
  auto third = stream->next_for(std::chrono::seconds(5));
  expect(third && third->ok(), "page delivered");
  expect(third->page->next_cursor == "c1", "cursor carried");
  expect(third->page->events.size() == 2, "unparseable event skipped");
  expect(third->page->events[0].id.index == 1 && third->page->events[1].id.index == 3, "server order kept");

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (transport->requests().size() < 4 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  stream->close();

  const auto requests = transport->requests();
  expect(requests.size() >= 4, "poller kept polling after the page");
  expect(!request_after(requests[0]) && request_has_checkpoint(requests[0]), "starts at the checkpoint");
  expect(request_has_checkpoint(requests[2]), "checkpoint kept until a page arrives");
  expect(request_after(requests[3]) == std::string("c1"), "next query continues from the cursor");
  expect(!request_has_checkpoint(requests[3]), "checkpoint dropped once a cursor exists");
  expect(!stream->next_for(std::chrono::milliseconds(1)), "closed stream is empty");
}

void test_event_fetcher_stops_on_drop() {
  auto transport = std::make_shared<ScriptedTransport>(std::vector<std::optional<std::string>>{});
  nexus::events::FetcherConfig config;
  config.initial_backoff = std::chrono::milliseconds(1);
  config.max_backoff = std::chrono::milliseconds(2);
  nexus::events::EventFetcher fetcher(transport, nexus_filter(), config);
  {
    auto stream = fetcher.poll();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  const auto after_drop = transport->requests().size();
  expect(after_drop > 0, "empty pages polled with backoff");
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  expect(transport->requests().size() == after_drop, "dropping the stream stops the poller");
}

}  // namespace

int main() {
  std::cout << "=== nexus toolkit tests ===\n";

  std::cout << "\n[Phase 1] Hashing, encodings, error taxonomy\n";
  run_test("hash known vectors", test_hash_known_vectors);
  run_test("base64 variants", test_base64_variants);
  run_test("error taxonomy", test_error_taxonomy);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Phase 2] DAG validator\n";
  run_test("minimal DAG accepted", test_dag_minimal_accepted);
  run_test("exclusive variants merge", test_dag_exclusive_variants_merge);
  run_test("join through second port", test_dag_join_through_second_port);
  run_test("second entry race rejected", test_dag_second_entry_race_rejected);
  run_test("second entry through second port", test_dag_second_entry_through_second_port);
  run_test("fork into one port rejected", test_dag_fork_into_one_port_rejected);
  run_test("cycle rejected", test_dag_cycle_rejected);
  run_test("no entry rejected", test_dag_no_entry_rejected);
  run_test("default with incoming edge rejected", test_dag_default_with_incoming_rejected);
  run_test("layering rejected", test_dag_layering_rejected);
  run_test("structural errors", test_dag_structure_errors);
  run_test("fingerprint stable", test_dag_fingerprint_stable);

  std::cout << "\n[Phase 3] KAT automata\n";
  run_test("choice of actions", test_kat_choice_of_actions);
  run_test("label order", test_kat_label_order);
  run_test("ε-NFA and DFA agree", test_kat_nfa_dfa_agree);
  run_test("DFA deterministic", test_kat_dfa_deterministic);
  run_test("parse errors", test_kat_parse_errors);
  run_test("DFA serialization", test_kat_serialization);

  std::cout << "\n[Phase 4] Secret store and session store\n";
  run_test("encrypted envelope", test_secret_envelope_encrypted);
  run_test("plain envelope and errors", test_secret_envelope_plain_and_errors);
  run_test("key rotation", test_secret_key_rotation);
  run_test("env key provider", test_secret_env_key_provider);
  run_test("session checkout", test_session_store_checkout);
  run_test("session lease", test_session_lease_releases);
  run_test("lease drop failure reported", test_session_lease_drop_failure_reported);
  run_test("identity key and truncate", test_identity_key_and_truncate);

  std::cout << "\n[Phase 5] NexusData codec\n";
  run_test("large integer string", test_nexus_data_large_integer_string);
  run_test("wire round trip", test_nexus_data_round_trip);
  run_test("decode errors", test_nexus_data_errors);
  run_test("input helpers", test_nexus_data_input_helpers);

  std::cout << "\n[Phase 6] Signed HTTP wire format\n";
  run_test("signing key formats", test_signing_key_formats);
  run_test("time window rules", test_time_window_rules);
  run_test("signature headers", test_signature_headers);
  run_test("allowed leaders file", test_allowed_leaders_file);

  std::cout << "\n[Phase 7] Signed HTTP engine\n";
  run_test("happy path", test_signed_http_happy_path);
  run_test("body tamper", test_signed_http_body_tamper);
  run_test("request rejections", test_signed_http_request_rejections);
  run_test("in flight then cached", test_signed_http_in_flight_then_cached);
  run_test("dropped session releases", test_signed_http_session_drop_releases);
  run_test("finish twice, signed rejection", test_signed_http_finish_twice_and_rejection_signing);
  run_test("invoker round trip", test_signed_http_invoker_round_trip);
  run_test("single clock reading per request", test_signed_http_single_clock_reading);
  run_test("stats and event hook", test_signed_http_stats_and_hook);

  std::cout << "\n[Phase 8] Runtime configuration\n";
  run_test("config parsing", test_runtime_config_parsing);
  run_test("config errors", test_runtime_config_errors);
  run_test("config from env and reload", test_runtime_config_from_env_and_reload);

  std::cout << "\n[Phase 9] Event fetcher\n";
  run_test("type tags", test_type_tags);
  run_test("parse event", test_parse_event);
  run_test("events response", test_events_response_parsing);
  run_test("channel bounds", test_event_channel_bounds);
  run_test("stream close", test_event_stream_close);
  run_test("fetcher polling", test_event_fetcher_polling);
  run_test("fetcher stops on drop", test_event_fetcher_stops_on_drop);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
