#pragma once

// nexus/tx_policy_circuit.hpp: Transaction-policy circuit.
//
// DESIGN:
//   Proves that the commands of a transaction, read from its raw bytes at
//   witnessed offsets, spell a word accepted by a DFA whose hash is public.
//
//   Every command becomes one symbol:
//     le_u32(payload_len) || payload || zero padding     (4 + max_symbol_bytes)
//   where the payload is the ASCII command name, except for MoveCall:
//     "MoveCall" || package(32) || le_u32(module_len) || module
//                || le_u32(function_len) || function
//
//   The DFA is serialized exactly like kat::serialize_dfa with these symbols,
//   so a policy compiled from KAT text binds to the same hash.
//
//   Public inputs in order: tx limbs (2), DFA hash limbs (2), max_actions,
//   max_symbol_bytes, max_states, max_transitions_per_state, max_id_len.
//
// INVARIANT:
//   Slot j is present iff j < action_count; presence flags are monotone.
//   A present slot matches exactly one DFA transition; absent slots keep the
//   current state. The run must end in an accepting state.
//   Circuit shape depends on the DFA, the bounds, the transaction length and
//   the witnessed offsets and identifier lengths.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nexus/circuit_gadgets.hpp"
#include "nexus/kat.hpp"
#include "nexus/types.hpp"

namespace nexus::circuits {

enum class CommandTag : std::uint8_t {
  move_call = 0,
  transfer_objects = 1,
  split_coin = 2,
  merge_coins = 3,
  publish = 4,
  make_move_vec = 5,
  upgrade = 6,
};

constexpr std::size_t kCommandTagCount = 7;
constexpr std::size_t kLengthPrefixBytes = 4;
constexpr std::size_t kPackageBytes = 32;

std::string_view command_literal(CommandTag tag);

struct TxPolicyBounds {
  std::size_t max_actions{0};
  std::size_t max_symbol_bytes{0};
  std::size_t max_states{0};
  std::size_t max_transitions_per_state{0};
  std::size_t max_id_len{0};

  std::size_t symbol_layout() const { return kLengthPrefixBytes + max_symbol_bytes; }
};

// ---------------------------------------------------------------------------
// Symbols
// ---------------------------------------------------------------------------
std::optional<std::string> encode_symbol(std::string_view payload, std::size_t max_symbol_bytes,
                                         Error* error = nullptr);
std::string move_call_payload(const Digest32& package, std::string_view module, std::string_view function);
std::optional<std::string> move_call_symbol(const Digest32& package, std::string_view module,
                                            std::string_view function, std::size_t max_symbol_bytes,
                                            Error* error = nullptr);
// Symbol of a command without auxiliary data; MoveCall is rejected.
std::optional<std::string> command_symbol(CommandTag tag, std::size_t max_symbol_bytes, Error* error = nullptr);

// ---------------------------------------------------------------------------
// Policy DFA
// ---------------------------------------------------------------------------
struct PolicyTransition {
  std::size_t target{0};
  std::string symbol;  // encoded, symbol_layout() bytes
};

struct PolicyState {
  bool accepting{false};
  std::vector<PolicyTransition> transitions;
};

struct PolicyDfa {
  std::size_t start{0};
  std::vector<PolicyState> states;
};

std::string serialize_policy_dfa(const PolicyDfa& dfa);

// Maps each action label of a compiled KAT policy to the encoded symbol of
// its payload. Test labels and unmapped actions fail with kat_parse_error.
std::optional<PolicyDfa> policy_dfa_from_kat(const kat::Dfa& dfa, const std::map<std::string, std::string>& payloads,
                                             std::size_t max_symbol_bytes, Error* error = nullptr);

// SymbolEncoder equivalent of policy_dfa_from_kat, for kat::serialize_dfa.
kat::SymbolEncoder policy_symbol_encoder(std::map<std::string, std::string> payloads, std::size_t max_symbol_bytes);

// ---------------------------------------------------------------------------
// Witness
// ---------------------------------------------------------------------------
struct TxPolicyWitness {
  std::string tx_bytes;
  std::size_t action_count{0};
  // One entry per action slot (max_actions).
  std::vector<std::size_t> tag_offsets;
  std::vector<std::size_t> package_offsets;
  std::vector<std::size_t> module_offsets;
  std::vector<std::size_t> module_lengths;
  std::vector<std::size_t> function_offsets;
  std::vector<std::size_t> function_lengths;
};

// A command as laid out by layout_commands.
struct PolicyCommand {
  CommandTag tag{CommandTag::transfer_objects};
  Digest32 package{};
  std::string module;
  std::string function;
};

// Encodes commands as tag(1) [|| package(32) || le_u32(len) || module
// || le_u32(len) || function] and records the offsets. Absent slots point at
// offset 0 with zero lengths.
std::optional<TxPolicyWitness> layout_commands(const std::vector<PolicyCommand>& commands, std::size_t max_actions,
                                               Error* error = nullptr);

std::optional<Error> validate_tx_policy_witness(const TxPolicyBounds& bounds, const PolicyDfa& dfa,
                                                const TxPolicyWitness& witness);

template <typename D>
std::vector<FieldT> tx_policy_public_inputs(const TxPolicyBounds& bounds, const Digest32& tx_digest,
                                            const PolicyDfa& dfa);

template <typename D>
class TxPolicyCircuit {
 public:
  // The tx digest is D::native(witness.tx_bytes).
  static std::optional<TxPolicyCircuit> make(TxPolicyBounds bounds, PolicyDfa dfa, TxPolicyWitness witness,
                                             Error* error = nullptr);

  std::optional<Error> synthesize(Protoboard& pb) const;
  std::vector<FieldT> public_inputs() const;

  const Digest32& tx_digest() const { return tx_digest_; }
  Digest32 dfa_hash() const { return D::native(serialize_policy_dfa(dfa_)); }

 private:
  TxPolicyCircuit(TxPolicyBounds bounds, PolicyDfa dfa, TxPolicyWitness witness)
      : bounds_(bounds), dfa_(std::move(dfa)), witness_(std::move(witness)) {
    tx_digest_ = D::native(witness_.tx_bytes);
  }

  TxPolicyBounds bounds_;
  PolicyDfa dfa_;
  TxPolicyWitness witness_;
  Digest32 tx_digest_{};
};

extern template class TxPolicyCircuit<FirstBytesDigest>;
extern template class TxPolicyCircuit<Sha256Digest>;

}  // namespace nexus::circuits
