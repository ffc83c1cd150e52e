#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "nexus/circuit_gadgets.hpp"
#include "nexus/gas_circuit.hpp"
#include "nexus/groth16.hpp"
#include "nexus/hash.hpp"
#include "nexus/kat.hpp"
#include "nexus/tx_policy_circuit.hpp"
#include "nexus/types.hpp"

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

using namespace nexus::circuits;

nexus::Digest32 filled_digest(std::uint8_t b) {
  nexus::Digest32 d;
  d.fill(b);
  return d;
}

void append_le_u64(std::string& out, std::uint64_t v) {
  for (int i = 0; i < 8; ++i) out += static_cast<char>((v >> (8 * i)) & 0xFF);
}

// One gas tuple under the first-32-bytes digest: the digest of every blob is
// its own prefix, so the chain lines up by construction.
GasTuple first_bytes_tuple(std::uint64_t claimed, std::uint16_t tolerance_bps) {
  const nexus::Digest32 tx = filled_digest(0x54);
  const nexus::Digest32 effects_digest = filled_digest(0x45);
  const std::string t(nexus::as_view(tx));
  const std::string e(nexus::as_view(effects_digest));

  GasTuple tuple;
  auto& w = tuple.witness;
  w.effects_bytes = e;
  w.computation_offset = w.effects_bytes.size();
  append_le_u64(w.effects_bytes, 500);
  w.storage_offset = w.effects_bytes.size();
  append_le_u64(w.effects_bytes, 450);
  w.rebate_offset = w.effects_bytes.size();
  append_le_u64(w.effects_bytes, 100);
  w.computation_cost = 500;
  w.storage_cost = 450;
  w.storage_rebate = 100;

  w.contents_bytes = t + e;
  w.tx_digest_offset = 0;
  w.effects_digest_offset = 32;

  w.summary_bytes = t + std::string(16, '\x07');
  w.content_digest_offset = 0;

  tuple.pub.checkpoint_digest = tx;
  tuple.pub.tx_digest = tx;
  tuple.pub.claimed_total = claimed;
  tuple.pub.tolerance_bps = tolerance_bps;
  return tuple;
}

// ============================================================================
// Phase 1: Gadgets
// ============================================================================

void test_sha256_gadget_matches_native() {
  init_curve();
  Protoboard pb;
  CircuitBuilder b(pb);
  const auto bytes = b.alloc_bytes("abc", "msg");
  const auto digest = b.digest<Sha256Digest>(bytes);
  const auto native = nexus::sha256("abc");
  for (std::size_t i = 0; i < 32; ++i) expect(digest[i].value == native[i], "gadget digest byte matches");
  expect(Sha256Digest::native("abc") == native, "native policy is SHA-256");
  expect(pb.is_satisfied(), "SHA-256 gadget witness satisfies its constraints");
  expect(b.constraint_count() > 10000, "compression function is constrained");
}

void test_constant_digest_folds() {
  init_curve();
  Protoboard pb;
  CircuitBuilder b(pb);
  const auto before = b.constraint_count();
  const auto digest = b.digest<Sha256Digest>(CircuitBuilder::constant_bytes("abc"));
  expect(b.constraint_count() == before, "constant input emits no constraints");
  expect(digest[0].value == nexus::sha256("abc")[0], "constant digest computed natively");
  expect(FirstBytesDigest::native("xy")[0] == 'x' && FirstBytesDigest::native("xy")[2] == 0,
         "first-bytes digest zero pads");
}

void test_le_comparison_gadget() {
  init_curve();
  Protoboard pb;
  CircuitBuilder b(pb);
  const auto small = b.decompose(b.alloc(field_from_u64(5), "small"), 8, "small.bits");
  const auto large = b.decompose(b.alloc(field_from_u64(9), "large"), 8, "large.bits");
  b.enforce_le_bits(small, large, "small_le_large");
  expect(pb.is_satisfied(), "5 <= 9 holds");

  Protoboard bad;
  CircuitBuilder c(bad);
  const auto x = c.decompose(c.alloc(field_from_u64(9), "x"), 8, "x.bits");
  const auto y = c.decompose(c.alloc(field_from_u64(5), "y"), 8, "y.bits");
  c.enforce_le_bits(x, y, "x_le_y");
  expect(!bad.is_satisfied(), "9 <= 5 fails");
}

// ============================================================================
// Phase 2: Gas circuit
// ============================================================================

void test_gas_within_tolerance() {
  expect(gas_within_tolerance(850, 850, 0), "exact match");
  expect(gas_within_tolerance(850, 842, 100), "within 1%");
  expect(!gas_within_tolerance(850, 800, 100), "outside 1%");
  expect(gas_within_tolerance(850, 858, 100), "tolerance is symmetric");
}

void test_gas_circuit_satisfied() {
  nexus::Error err;
  auto circuit = GasCircuit<FirstBytesDigest>::make({first_bytes_tuple(850, 100)}, &err);
  expect(circuit.has_value(), "gas circuit builds: " + err.message);
  const auto result = nexus::groth16::check_satisfied(*circuit);
  expect(!result, "850 claimed for 500 + 450 - 100 is satisfied");
  expect(circuit->public_inputs().size() == 6, "two digests in limbs, claimed total, tolerance");
}

void test_gas_circuit_claim_outside_tolerance() {
  auto circuit = GasCircuit<FirstBytesDigest>::make({first_bytes_tuple(800, 100)});
  expect(circuit.has_value(), "witness is well formed");
  const auto result = nexus::groth16::check_satisfied(*circuit);
  expect(result && result->code == nexus::ErrorCode::circuit_unsatisfied, "800 claimed is outside 1%");
}

void test_gas_circuit_broken_digest_chain() {
  auto tuple = first_bytes_tuple(850, 100);
  tuple.pub.tx_digest = filled_digest(0x99);
  auto circuit = GasCircuit<FirstBytesDigest>::make({tuple});
  const auto result = nexus::groth16::check_satisfied(*circuit);
  expect(result && result->code == nexus::ErrorCode::circuit_unsatisfied, "public tx digest must be in contents");

  auto forged = first_bytes_tuple(850, 100);
  forged.witness.computation_cost = 600;
  auto forged_circuit = GasCircuit<FirstBytesDigest>::make({forged});
  const auto forged_result = nexus::groth16::check_satisfied(*forged_circuit);
  expect(forged_result && forged_result->code == nexus::ErrorCode::circuit_unsatisfied,
         "gas fields are bound to the effects bytes");
}

void test_gas_witness_validation() {
  nexus::Error err;
  auto misplaced = first_bytes_tuple(850, 100);
  misplaced.witness.effects_digest_offset = 16;
  expect(!GasCircuit<FirstBytesDigest>::make({misplaced}, &err), "effects digest must follow tx digest");
  expect(err.code == nexus::ErrorCode::circuit_witness_invalid, "witness error code");

  auto out_of_bounds = first_bytes_tuple(850, 100);
  out_of_bounds.witness.rebate_offset = out_of_bounds.witness.effects_bytes.size() - 4;
  expect(!GasCircuit<FirstBytesDigest>::make({out_of_bounds}, &err), "gas field past end");

  auto tolerance = first_bytes_tuple(850, 10001);
  expect(!GasCircuit<FirstBytesDigest>::make({tolerance}, &err), "tolerance above 100%");
  expect(!GasCircuit<FirstBytesDigest>::make({}, &err), "at least one tuple");
}

void test_gas_circuit_two_tuples() {
  auto second = first_bytes_tuple(845, 100);
  auto circuit = GasCircuit<FirstBytesDigest>::make({first_bytes_tuple(850, 0), second});
  expect(circuit.has_value(), "two tuples");
  expect(!nexus::groth16::check_satisfied(*circuit), "every tuple satisfied");
  expect(circuit->public_inputs().size() == 12, "public inputs per tuple");
}

// ============================================================================
// Phase 3: Transaction policy circuit
// ============================================================================

const std::size_t kMaxSymbolBytes = 64;

std::map<std::string, std::string> transfer_split_payloads() {
  return {{"transfer", std::string(command_literal(CommandTag::transfer_objects))},
          {"split", std::string(command_literal(CommandTag::split_coin))}};
}

nexus::kat::Dfa compile_policy(const std::string& text, const std::vector<std::string>& actions) {
  nexus::Error err;
  auto config = nexus::kat::ParserConfig::make(actions, {}, &err);
  expect(config.has_value(), "policy parser config");
  auto expr = nexus::kat::parse_kat(text, *config, &err);
  expect(expr.has_value(), "policy parses: " + err.message);
  return nexus::kat::compile(**expr);
}

TxPolicyBounds bounds_for(const PolicyDfa& dfa, std::size_t max_actions) {
  TxPolicyBounds bounds;
  bounds.max_actions = max_actions;
  bounds.max_symbol_bytes = kMaxSymbolBytes;
  bounds.max_states = dfa.states.size();
  bounds.max_transitions_per_state = 2;
  bounds.max_id_len = 16;
  return bounds;
}

std::optional<nexus::Error> check_policy(const PolicyDfa& dfa, const std::vector<PolicyCommand>& commands,
                                         std::size_t max_actions) {
  nexus::Error err;
  auto witness = layout_commands(commands, max_actions, &err);
  expect(witness.has_value(), "layout commands: " + err.message);
  auto circuit = TxPolicyCircuit<FirstBytesDigest>::make(bounds_for(dfa, max_actions), dfa, *witness, &err);
  expect(circuit.has_value(), "policy circuit builds: " + err.message);
  return nexus::groth16::check_satisfied(*circuit);
}

PolicyCommand command(CommandTag tag) {
  PolicyCommand c;
  c.tag = tag;
  return c;
}

void test_symbol_encoding() {
  auto sym = command_symbol(CommandTag::transfer_objects, kMaxSymbolBytes);
  expect(sym && sym->size() == 4 + kMaxSymbolBytes, "symbol padded to layout");
  expect(static_cast<std::uint8_t>((*sym)[0]) == 15 && sym->substr(4, 15) == "TransferObjects",
         "length prefix then literal");
  nexus::Error err;
  expect(!command_symbol(CommandTag::move_call, kMaxSymbolBytes, &err), "MoveCall needs an identity");
  expect(!encode_symbol(std::string(65, 'x'), kMaxSymbolBytes, &err), "oversized payload");
  const auto payload = move_call_payload(filled_digest(0x01), "coin", "split");
  expect(payload.size() == 8 + 32 + 4 + 4 + 4 + 5 && payload.rfind("MoveCall", 0) == 0, "MoveCall payload layout");
}

void test_policy_dfa_serialization_matches_kat() {
  const auto dfa = compile_policy("transfer ; split", {"transfer", "split"});
  nexus::Error err;
  auto policy = policy_dfa_from_kat(dfa, transfer_split_payloads(), kMaxSymbolBytes, &err);
  expect(policy.has_value(), "policy DFA from KAT: " + err.message);
  auto kat_bytes =
      nexus::kat::serialize_dfa(dfa, policy_symbol_encoder(transfer_split_payloads(), kMaxSymbolBytes), &err);
  expect(kat_bytes && *kat_bytes == serialize_policy_dfa(*policy), "one serialization for both views");

  std::map<std::string, std::string> missing{{"transfer", "TransferObjects"}};
  expect(!policy_dfa_from_kat(dfa, missing, kMaxSymbolBytes, &err), "every action needs a payload");
}

void test_tx_policy_accepts_allowed_order() {
  const auto dfa = compile_policy("transfer ; split", {"transfer", "split"});
  auto policy = policy_dfa_from_kat(dfa, transfer_split_payloads(), kMaxSymbolBytes);
  expect(policy.has_value(), "policy");
  const auto result =
      check_policy(*policy, {command(CommandTag::transfer_objects), command(CommandTag::split_coin)}, 3);
  expect(!result, "transfer then split is allowed");
}

void test_tx_policy_rejects_reversed_order() {
  const auto dfa = compile_policy("transfer ; split", {"transfer", "split"});
  auto policy = policy_dfa_from_kat(dfa, transfer_split_payloads(), kMaxSymbolBytes);
  const auto reversed =
      check_policy(*policy, {command(CommandTag::split_coin), command(CommandTag::transfer_objects)}, 3);
  expect(reversed && reversed->code == nexus::ErrorCode::circuit_unsatisfied, "split then transfer is rejected");
  const auto partial = check_policy(*policy, {command(CommandTag::transfer_objects)}, 3);
  expect(partial && partial->code == nexus::ErrorCode::circuit_unsatisfied, "run must end accepting");
}

void test_tx_policy_move_call() {
  const nexus::Digest32 package = filled_digest(0x02);
  std::map<std::string, std::string> payloads{{"call", move_call_payload(package, "coin", "split")}};
  const auto dfa = compile_policy("call*", {"call"});
  auto policy = policy_dfa_from_kat(dfa, payloads, kMaxSymbolBytes);
  expect(policy.has_value(), "MoveCall policy");

  PolicyCommand call;
  call.tag = CommandTag::move_call;
  call.package = package;
  call.module = "coin";
  call.function = "split";
  expect(!check_policy(*policy, {call, call}, 3), "allowed move calls");

  PolicyCommand other = call;
  other.function = "join";
  const auto result = check_policy(*policy, {call, other}, 3);
  expect(result && result->code == nexus::ErrorCode::circuit_unsatisfied, "other function rejected");
  expect(!check_policy(*policy, {}, 3), "empty transaction matches star");
}

void test_tx_policy_witness_validation() {
  const auto dfa = compile_policy("transfer ; split", {"transfer", "split"});
  auto policy = policy_dfa_from_kat(dfa, transfer_split_payloads(), kMaxSymbolBytes);
  nexus::Error err;
  expect(!layout_commands({command(CommandTag::publish), command(CommandTag::publish)}, 1, &err),
         "too many commands");

  auto witness = layout_commands({command(CommandTag::transfer_objects)}, 3);
  auto bounds = bounds_for(*policy, 3);
  bounds.max_states = 1;
  expect(validate_tx_policy_witness(bounds, *policy, *witness).has_value(), "state bound enforced");
  bounds = bounds_for(*policy, 3);
  bounds.max_symbol_bytes = 8;
  expect(validate_tx_policy_witness(bounds, *policy, *witness).has_value(), "literal must fit symbol");
  expect(!TxPolicyCircuit<FirstBytesDigest>::make(bounds_for(*policy, 2), *policy, *witness, &err),
         "per-slot vectors sized to max_actions");
  expect(err.code == nexus::ErrorCode::circuit_witness_invalid, "witness error code");
}

void test_tx_policy_public_inputs() {
  const auto dfa = compile_policy("transfer ; split", {"transfer", "split"});
  auto policy = policy_dfa_from_kat(dfa, transfer_split_payloads(), kMaxSymbolBytes);
  auto witness = layout_commands({command(CommandTag::transfer_objects), command(CommandTag::split_coin)}, 3);
  auto circuit = TxPolicyCircuit<FirstBytesDigest>::make(bounds_for(*policy, 3), *policy, *witness);
  expect(circuit.has_value(), "circuit");
  expect(circuit->public_inputs().size() == 9, "tx digest, dfa hash and five bounds");
  expect(circuit->tx_digest() == FirstBytesDigest::native(witness->tx_bytes), "tx digest over the layout");
  expect(circuit->dfa_hash() == FirstBytesDigest::native(serialize_policy_dfa(*policy)), "dfa hash");
}

// ============================================================================
// Phase 4: Groth16
// ============================================================================

void test_groth16_prove_and_verify() {
  auto circuit = GasCircuit<FirstBytesDigest>::make({first_bytes_tuple(850, 100)});
  expect(circuit.has_value(), "circuit");
  nexus::Error err;
  auto keypair = nexus::groth16::setup(*circuit, &err);
  expect(keypair.has_value(), "setup: " + err.message);
  auto proof = nexus::groth16::prove(keypair->pk, *circuit, &err);
  expect(proof.has_value(), "prove: " + err.message);

  expect(!nexus::groth16::verify(keypair->vk, circuit->public_inputs(), *proof), "proof verifies");

  auto wrong = first_bytes_tuple(851, 100);
  const auto wrong_inputs = gas_public_inputs({wrong.pub});
  const auto rejected = nexus::groth16::verify(keypair->vk, wrong_inputs, *proof);
  expect(rejected && rejected->code == nexus::ErrorCode::proof_verification_failed, "wrong claim rejected");

  auto bytes = nexus::groth16::serialize_proof(*proof);
  auto back = nexus::groth16::deserialize_proof(bytes, &err);
  expect(back.has_value(), "proof deserializes");
  auto vk_back = nexus::groth16::deserialize_verification_key(nexus::groth16::serialize_verification_key(keypair->vk));
  expect(vk_back.has_value(), "verification key deserializes");
  expect(!nexus::groth16::verify(*vk_back, circuit->public_inputs(), *back), "deserialized proof verifies");
  expect(!nexus::groth16::deserialize_proof("garbage", &err), "garbage proof rejected");
}

void test_groth16_refuses_unsatisfied_witness() {
  auto good = GasCircuit<FirstBytesDigest>::make({first_bytes_tuple(850, 100)});
  auto bad = GasCircuit<FirstBytesDigest>::make({first_bytes_tuple(800, 100)});
  nexus::Error err;
  auto keypair = nexus::groth16::setup(*good, &err);
  expect(keypair.has_value(), "setup");
  expect(!nexus::groth16::prove(keypair->pk, *bad, &err), "no proof for an unsatisfied witness");
  expect(err.code == nexus::ErrorCode::circuit_unsatisfied, "unsatisfied code");
}

}  // namespace

int main() {
  std::cout << "=== nexus circuit tests ===\n";

  std::cout << "\n[Phase 1] Gadgets\n";
  run_test("SHA-256 gadget matches native", test_sha256_gadget_matches_native);
  run_test("constant digest folds", test_constant_digest_folds);
  run_test("less-or-equal gadget", test_le_comparison_gadget);

  std::cout << "\n[Phase 2] Gas circuit\n";
  run_test("tolerance arithmetic", test_gas_within_tolerance);
  run_test("claim within tolerance", test_gas_circuit_satisfied);
  run_test("claim outside tolerance", test_gas_circuit_claim_outside_tolerance);
  run_test("broken digest chain", test_gas_circuit_broken_digest_chain);
  run_test("witness validation", test_gas_witness_validation);
  run_test("two tuples", test_gas_circuit_two_tuples);

  std::cout << "\n[Phase 3] Transaction policy circuit\n";
  run_test("symbol encoding", test_symbol_encoding);
  run_test("policy DFA serialization", test_policy_dfa_serialization_matches_kat);
  run_test("allowed order", test_tx_policy_accepts_allowed_order);
  run_test("reversed order", test_tx_policy_rejects_reversed_order);
  run_test("move call policy", test_tx_policy_move_call);
  run_test("witness validation", test_tx_policy_witness_validation);
  run_test("public inputs", test_tx_policy_public_inputs);

  std::cout << "\n[Phase 4] Groth16\n";
  run_test("prove and verify", test_groth16_prove_and_verify);
  run_test("unsatisfied witness", test_groth16_refuses_unsatisfied_witness);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
