#include "nexus/tx_policy_circuit.hpp"

#include <array>
#include <map>
#include <utility>

#include "nexus/hash.hpp"

namespace nexus::circuits {
namespace {

constexpr std::string_view kMoveCallLiteral = "MoveCall";

void append_le_u32(std::string& out, std::uint32_t v) {
  for (int i = 0; i < 4; ++i) out += static_cast<char>((v >> (8 * i)) & 0xFF);
}

bool span_ok(std::size_t offset, std::size_t len, std::size_t size) {
  return offset <= size && len <= size - offset;
}

std::size_t move_call_payload_len(std::size_t module_len, std::size_t function_len) {
  return kMoveCallLiteral.size() + kPackageBytes + kLengthPrefixBytes + module_len + kLengthPrefixBytes +
         function_len;
}

std::vector<Bit> constant_bits(std::uint64_t v, std::size_t n) {
  std::vector<Bit> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) out.push_back(CircuitBuilder::constant_bit(i < 64 && ((v >> i) & 1u) != 0));
  return out;
}

void push_constant_le_u32(std::vector<Byte>& out, std::uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(CircuitBuilder::constant_byte(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF)));
}

// Byte at `index`, or a constant zero past the end of the transaction.
const Byte& tx_byte_or_zero(const std::vector<Byte>& tx, std::size_t index) {
  static const Byte kZero = CircuitBuilder::constant_byte(0);
  return index < tx.size() ? tx[index] : kZero;
}

// le_u32 read from the four bytes before `offset` (clamped at 0).
Num length_prefix_before(const std::vector<Byte>& tx, std::size_t offset) {
  const std::size_t start = offset >= kLengthPrefixBytes ? offset - kLengthPrefixBytes : 0;
  std::vector<Byte> bytes;
  for (std::size_t i = 0; i < kLengthPrefixBytes; ++i) bytes.push_back(tx_byte_or_zero(tx, start + i));
  return CircuitBuilder::pack_bytes_le(bytes);
}

// Selected symbol bit: sum over the one-hot tag flags of flag * candidate bit.
struct SymbolBitSum {
  LC lc;
  bool value{false};
  bool any{false};

  void add_constant(const Bit& flag, bool candidate) {
    if (!candidate) return;
    lc = lc + flag.lc;
    value = value || flag.value;
    any = true;
  }
  void add_term(const Bit& term) {
    lc = lc + term.lc;
    value = value || term.value;
    any = true;
  }
  Bit bit() const { return any ? Bit{lc, value, false} : CircuitBuilder::constant_bit(false); }
};

}  // namespace

std::string_view command_literal(CommandTag tag) {
  switch (tag) {
    case CommandTag::move_call: return "MoveCall";
    case CommandTag::transfer_objects: return "TransferObjects";
    case CommandTag::split_coin: return "SplitCoin";
    case CommandTag::merge_coins: return "MergeCoins";
    case CommandTag::publish: return "Publish";
    case CommandTag::make_move_vec: return "MakeMoveVec";
    case CommandTag::upgrade: return "Upgrade";
  }
  return "";
}

// ---------------------------------------------------------------------------
// Symbols
// ---------------------------------------------------------------------------

std::optional<std::string> encode_symbol(std::string_view payload, std::size_t max_symbol_bytes, Error* error) {
  if (payload.size() > max_symbol_bytes) {
    set_error(error, ErrorCode::circuit_witness_invalid,
              "symbol payload of " + std::to_string(payload.size()) + " bytes exceeds max_symbol_bytes " +
                  std::to_string(max_symbol_bytes));
    return std::nullopt;
  }
  std::string out;
  out.reserve(kLengthPrefixBytes + max_symbol_bytes);
  append_le_u32(out, static_cast<std::uint32_t>(payload.size()));
  out.append(payload);
  out.append(max_symbol_bytes - payload.size(), '\0');
  return out;
}

std::string move_call_payload(const Digest32& package, std::string_view module, std::string_view function) {
  std::string out(kMoveCallLiteral);
  out.append(as_view(package));
  append_le_u32(out, static_cast<std::uint32_t>(module.size()));
  out.append(module);
  append_le_u32(out, static_cast<std::uint32_t>(function.size()));
  out.append(function);
  return out;
}

std::optional<std::string> move_call_symbol(const Digest32& package, std::string_view module,
                                            std::string_view function, std::size_t max_symbol_bytes, Error* error) {
  return encode_symbol(move_call_payload(package, module, function), max_symbol_bytes, error);
}

std::optional<std::string> command_symbol(CommandTag tag, std::size_t max_symbol_bytes, Error* error) {
  if (tag == CommandTag::move_call) {
    set_error(error, ErrorCode::circuit_witness_invalid, "MoveCall symbols need package, module and function");
    return std::nullopt;
  }
  return encode_symbol(command_literal(tag), max_symbol_bytes, error);
}

// ---------------------------------------------------------------------------
// Policy DFA
// ---------------------------------------------------------------------------

std::string serialize_policy_dfa(const PolicyDfa& dfa) {
  std::string out;
  append_le_u32(out, static_cast<std::uint32_t>(dfa.states.size()));
  append_le_u32(out, static_cast<std::uint32_t>(dfa.start));
  for (const auto& state : dfa.states) {
    out += static_cast<char>(state.accepting ? 1 : 0);
    append_le_u32(out, static_cast<std::uint32_t>(state.transitions.size()));
    for (const auto& t : state.transitions) {
      append_le_u32(out, static_cast<std::uint32_t>(t.target));
      out += t.symbol;
    }
  }
  return out;
}

std::optional<PolicyDfa> policy_dfa_from_kat(const kat::Dfa& dfa, const std::map<std::string, std::string>& payloads,
                                             std::size_t max_symbol_bytes, Error* error) {
  PolicyDfa out;
  out.start = dfa.start;
  out.states.reserve(dfa.states.size());
  for (std::size_t i = 0; i < dfa.states.size(); ++i) {
    PolicyState state;
    state.accepting = dfa.is_accepting(i);
    for (const auto& t : dfa.states[i].transitions) {
      if (t.label.kind != kat::LabelKind::action) {
        set_error(error, ErrorCode::kat_parse_error,
                  "test label " + kat::to_string(t.label) + " has no transaction symbol");
        return std::nullopt;
      }
      auto it = payloads.find(t.label.symbol);
      if (it == payloads.end()) {
        set_error(error, ErrorCode::kat_parse_error, "no transaction symbol for action " + t.label.symbol);
        return std::nullopt;
      }
      auto symbol = encode_symbol(it->second, max_symbol_bytes, error);
      if (!symbol) return std::nullopt;
      state.transitions.push_back(PolicyTransition{t.to, std::move(*symbol)});
    }
    out.states.push_back(std::move(state));
  }
  return out;
}

kat::SymbolEncoder policy_symbol_encoder(std::map<std::string, std::string> payloads, std::size_t max_symbol_bytes) {
  return [payloads = std::move(payloads), max_symbol_bytes](const kat::Label& label) -> std::optional<std::string> {
    if (label.kind != kat::LabelKind::action) return std::nullopt;
    auto it = payloads.find(label.symbol);
    if (it == payloads.end()) return std::nullopt;
    return encode_symbol(it->second, max_symbol_bytes);
  };
}

// ---------------------------------------------------------------------------
// Witness
// ---------------------------------------------------------------------------

std::optional<TxPolicyWitness> layout_commands(const std::vector<PolicyCommand>& commands, std::size_t max_actions,
                                               Error* error) {
  if (commands.size() > max_actions) {
    set_error(error, ErrorCode::circuit_witness_invalid,
              std::to_string(commands.size()) + " commands exceed max_actions " + std::to_string(max_actions));
    return std::nullopt;
  }
  TxPolicyWitness w;
  w.action_count = commands.size();
  w.tag_offsets.assign(max_actions, 0);
  w.package_offsets.assign(max_actions, 0);
  w.module_offsets.assign(max_actions, 0);
  w.module_lengths.assign(max_actions, 0);
  w.function_offsets.assign(max_actions, 0);
  w.function_lengths.assign(max_actions, 0);

  append_le_u32(w.tx_bytes, static_cast<std::uint32_t>(commands.size()));
  for (std::size_t j = 0; j < commands.size(); ++j) {
    const auto& c = commands[j];
    w.tag_offsets[j] = w.tx_bytes.size();
    w.tx_bytes += static_cast<char>(c.tag);
    if (c.tag != CommandTag::move_call) continue;
    w.package_offsets[j] = w.tx_bytes.size();
    w.tx_bytes.append(as_view(c.package));
    append_le_u32(w.tx_bytes, static_cast<std::uint32_t>(c.module.size()));
    w.module_offsets[j] = w.tx_bytes.size();
    w.module_lengths[j] = c.module.size();
    w.tx_bytes += c.module;
    append_le_u32(w.tx_bytes, static_cast<std::uint32_t>(c.function.size()));
    w.function_offsets[j] = w.tx_bytes.size();
    w.function_lengths[j] = c.function.size();
    w.tx_bytes += c.function;
  }
  return w;
}

std::optional<Error> validate_tx_policy_witness(const TxPolicyBounds& bounds, const PolicyDfa& dfa,
                                                const TxPolicyWitness& w) {
  auto invalid = [](std::string msg) { return make_error(ErrorCode::circuit_witness_invalid, std::move(msg)); };

  if (bounds.max_actions == 0) return invalid("max_actions must be positive");
  if (bounds.max_symbol_bytes == 0) return invalid("max_symbol_bytes must be positive");
  for (std::size_t k = 1; k < kCommandTagCount; ++k) {
    if (command_literal(static_cast<CommandTag>(k)).size() > bounds.max_symbol_bytes) {
      return invalid("max_symbol_bytes is smaller than the command literal " +
                     std::string(command_literal(static_cast<CommandTag>(k))));
    }
  }
  const std::size_t n = bounds.max_actions;
  if (w.tag_offsets.size() != n || w.package_offsets.size() != n || w.module_offsets.size() != n ||
      w.module_lengths.size() != n || w.function_offsets.size() != n || w.function_lengths.size() != n) {
    return invalid("per-action witness vectors must have max_actions entries");
  }
  if (w.tx_bytes.empty()) return invalid("transaction bytes required");
  if (w.action_count > n) return invalid("action_count exceeds max_actions");

  for (std::size_t j = 0; j < n; ++j) {
    const std::string at = "action " + std::to_string(j) + ": ";
    if (w.tag_offsets[j] >= w.tx_bytes.size()) return invalid(at + "command tag offset out of bounds");
    if (w.module_lengths[j] > bounds.max_id_len || w.function_lengths[j] > bounds.max_id_len) {
      return invalid(at + "identifier exceeds max_id_len");
    }
    const bool present = j < w.action_count;
    const auto tag = static_cast<std::uint8_t>(w.tx_bytes[w.tag_offsets[j]]);
    if (!present || tag != static_cast<std::uint8_t>(CommandTag::move_call)) continue;
    if (!span_ok(w.package_offsets[j], kPackageBytes, w.tx_bytes.size())) {
      return invalid(at + "package offset out of bounds");
    }
    if (w.module_offsets[j] < kLengthPrefixBytes || !span_ok(w.module_offsets[j], w.module_lengths[j], w.tx_bytes.size())) {
      return invalid(at + "module slice out of bounds");
    }
    if (w.function_offsets[j] < kLengthPrefixBytes ||
        !span_ok(w.function_offsets[j], w.function_lengths[j], w.tx_bytes.size())) {
      return invalid(at + "function slice out of bounds");
    }
    if (move_call_payload_len(w.module_lengths[j], w.function_lengths[j]) > bounds.max_symbol_bytes) {
      return invalid(at + "move call symbol exceeds max_symbol_bytes");
    }
  }

  if (dfa.states.empty()) return invalid("dfa must contain at least one state");
  if (dfa.states.size() > bounds.max_states) return invalid("dfa state bound exceeded");
  if (dfa.start >= dfa.states.size()) return invalid("dfa start state out of range");
  for (const auto& state : dfa.states) {
    if (state.transitions.size() > bounds.max_transitions_per_state) return invalid("dfa transition bound exceeded");
    for (const auto& t : state.transitions) {
      if (t.target >= dfa.states.size()) return invalid("dfa target out of range");
      if (t.symbol.size() != bounds.symbol_layout()) {
        return invalid("dfa symbols must be length-prefixed and padded to max_symbol_bytes");
      }
    }
  }
  return std::nullopt;
}

template <typename D>
std::vector<FieldT> tx_policy_public_inputs(const TxPolicyBounds& bounds, const Digest32& tx_digest,
                                            const PolicyDfa& dfa) {
  init_curve();
  std::vector<FieldT> out;
  for (const auto& limb : digest_to_limbs(tx_digest)) out.push_back(limb);
  for (const auto& limb : digest_to_limbs(D::native(serialize_policy_dfa(dfa)))) out.push_back(limb);
  out.push_back(field_from_u64(bounds.max_actions));
  out.push_back(field_from_u64(bounds.max_symbol_bytes));
  out.push_back(field_from_u64(bounds.max_states));
  out.push_back(field_from_u64(bounds.max_transitions_per_state));
  out.push_back(field_from_u64(bounds.max_id_len));
  return out;
}

// ---------------------------------------------------------------------------
// TxPolicyCircuit
// ---------------------------------------------------------------------------

template <typename D>
std::optional<TxPolicyCircuit<D>> TxPolicyCircuit<D>::make(TxPolicyBounds bounds, PolicyDfa dfa,
                                                           TxPolicyWitness witness, Error* error) {
  init_curve();
  if (auto err = validate_tx_policy_witness(bounds, dfa, witness)) {
    if (error) *error = *err;
    return std::nullopt;
  }
  return TxPolicyCircuit(bounds, std::move(dfa), std::move(witness));
}

template <typename D>
std::vector<FieldT> TxPolicyCircuit<D>::public_inputs() const {
  return tx_policy_public_inputs<D>(bounds_, tx_digest_, dfa_);
}

template <typename D>
std::optional<Error> TxPolicyCircuit<D>::synthesize(Protoboard& pb) const {
  if (auto err = validate_tx_policy_witness(bounds_, dfa_, witness_)) return err;
  const auto& w = witness_;
  const std::size_t slots = bounds_.max_actions;
  const std::size_t layout = bounds_.symbol_layout();

  CircuitBuilder b(pb);

  // Public inputs.
  const auto inputs = public_inputs();
  std::vector<Num> pub;
  pub.reserve(inputs.size());
  for (const auto& v : inputs) pub.push_back(b.public_input(v, "tx_policy.public"));
  b.finish_public_inputs();
  const std::array<Num, kDigestLimbs> tx_limbs{pub[0], pub[1]};
  const std::array<Num, kDigestLimbs> dfa_limbs{pub[2], pub[3]};
  const std::size_t bound_values[] = {bounds_.max_actions, bounds_.max_symbol_bytes, bounds_.max_states,
                                      bounds_.max_transitions_per_state, bounds_.max_id_len};
  for (std::size_t i = 0; i < 5; ++i) {
    b.enforce_equal(pub[4 + i], CircuitBuilder::constant_u64(bound_values[i]), "tx_policy.bound");
  }

  // Transaction bytes bound to the public digest.
  const auto tx = b.alloc_bytes(w.tx_bytes, "tx_policy.tx");
  b.enforce_digest_eq_limbs(b.digest<D>(tx), tx_limbs, "tx_policy.tx_eq");

  // Presence flags.
  const Num count = b.alloc(field_from_u64(w.action_count), "tx_policy.action_count");
  b.enforce_le_bits(b.decompose(count, 32, "tx_policy.action_count_bits"), constant_bits(slots, 32),
                    "tx_policy.action_count_le");
  std::vector<Bit> present;
  Num present_sum = CircuitBuilder::constant_u64(0);
  for (std::size_t j = 0; j < slots; ++j) {
    present.push_back(b.alloc_bit(j < w.action_count, "tx_policy.present"));
    present_sum = CircuitBuilder::add(present_sum, CircuitBuilder::from_bit(present.back()));
    if (j > 0) {
      b.enforce_zero_product(CircuitBuilder::from_bit(present[j]),
                             CircuitBuilder::from_bit(CircuitBuilder::not_(present[j - 1])), "tx_policy.monotone");
    }
  }
  b.enforce_equal(present_sum, count, "tx_policy.present_sum");

  // Static command candidates, indexed by tag.
  std::array<std::string, kCommandTagCount> literal_symbols;
  for (std::size_t k = 1; k < kCommandTagCount; ++k) {
    literal_symbols[k] = *encode_symbol(command_literal(static_cast<CommandTag>(k)), bounds_.max_symbol_bytes);
  }

  // Per-slot symbol limbs.
  const Num one = CircuitBuilder::constant_u64(1);
  std::vector<std::array<Num, kDigestLimbs>> action_limbs;
  action_limbs.reserve(slots);
  for (std::size_t j = 0; j < slots; ++j) {
    const std::string n = "tx_policy.action[" + std::to_string(j) + "]";
    const Num tag = CircuitBuilder::pack_byte(tx[w.tag_offsets[j]]);

    std::array<Bit, kCommandTagCount> is_tag;
    Num recognized = CircuitBuilder::constant_u64(0);
    for (std::size_t k = 0; k < kCommandTagCount; ++k) {
      is_tag[k] = b.is_equal(tag, CircuitBuilder::constant_u64(k), n + ".tag");
      recognized = CircuitBuilder::add(recognized, CircuitBuilder::from_bit(is_tag[k]));
    }
    b.enforce_zero_product(CircuitBuilder::from_bit(present[j]), CircuitBuilder::sub(one, recognized),
                           n + ".recognized");

    // MoveCall candidate read from the transaction bytes.
    const Bit move_call_mask = b.and_(is_tag[0], present[j], n + ".move_call_mask");
    const std::size_t module_len = w.module_lengths[j];
    const std::size_t function_len = w.function_lengths[j];
    const std::size_t payload_len = move_call_payload_len(module_len, function_len);
    std::vector<Byte> move_call;
    if (payload_len <= bounds_.max_symbol_bytes) {
      push_constant_le_u32(move_call, static_cast<std::uint32_t>(payload_len));
      for (char c : kMoveCallLiteral) move_call.push_back(CircuitBuilder::constant_byte(static_cast<std::uint8_t>(c)));
      for (std::size_t k = 0; k < kPackageBytes; ++k) move_call.push_back(tx_byte_or_zero(tx, w.package_offsets[j] + k));
      push_constant_le_u32(move_call, static_cast<std::uint32_t>(module_len));
      for (std::size_t k = 0; k < module_len; ++k) move_call.push_back(tx_byte_or_zero(tx, w.module_offsets[j] + k));
      push_constant_le_u32(move_call, static_cast<std::uint32_t>(function_len));
      for (std::size_t k = 0; k < function_len; ++k) {
        move_call.push_back(tx_byte_or_zero(tx, w.function_offsets[j] + k));
      }
      while (move_call.size() < layout) move_call.push_back(CircuitBuilder::constant_byte(0));

      const Num mask = CircuitBuilder::from_bit(move_call_mask);
      b.enforce_zero_product(
          CircuitBuilder::sub(length_prefix_before(tx, w.module_offsets[j]), CircuitBuilder::constant_u64(module_len)),
          mask, n + ".module_len");
      b.enforce_zero_product(CircuitBuilder::sub(length_prefix_before(tx, w.function_offsets[j]),
                                                 CircuitBuilder::constant_u64(function_len)),
                             mask, n + ".function_len");
    } else {
      // No MoveCall symbol fits this slot's identifiers.
      b.enforce_equal(CircuitBuilder::from_bit(move_call_mask), CircuitBuilder::constant_u64(0), n + ".move_call_fit");
    }

    // Select the symbol of the matching tag.
    std::vector<Byte> symbol(layout);
    for (std::size_t p = 0; p < layout; ++p) {
      for (std::size_t i = 0; i < 8; ++i) {
        SymbolBitSum sum;
        for (std::size_t k = 1; k < kCommandTagCount; ++k) {
          sum.add_constant(is_tag[k], ((static_cast<std::uint8_t>(literal_symbols[k][p]) >> i) & 1u) != 0);
        }
        if (!move_call.empty()) {
          const Bit& mc = move_call[p].bits[i];
          if (mc.is_const) {
            sum.add_constant(is_tag[0], mc.value);
          } else {
            sum.add_term(b.and_(is_tag[0], mc, n + ".select"));
          }
        }
        symbol[p].bits[i] = sum.bit();
      }
      std::uint8_t v = 0;
      for (std::size_t i = 0; i < 8; ++i) {
        if (symbol[p].bits[i].value) v = static_cast<std::uint8_t>(v | (1u << i));
      }
      symbol[p].value = v;
    }
    action_limbs.push_back(b.digest_limbs(b.digest<D>(symbol)));
  }

  // DFA commitment.
  b.enforce_digest_eq_limbs(b.digest<D>(CircuitBuilder::constant_bytes(serialize_policy_dfa(dfa_))), dfa_limbs,
                            "tx_policy.dfa_eq");

  std::map<std::string, std::array<FieldT, kDigestLimbs>> transition_limbs;
  for (const auto& state : dfa_.states) {
    for (const auto& t : state.transitions) {
      if (!transition_limbs.count(t.symbol)) transition_limbs.emplace(t.symbol, digest_to_limbs(D::native(t.symbol)));
    }
  }

  // DFA run.
  Num current = CircuitBuilder::constant_u64(dfa_.start);
  for (std::size_t j = 0; j < slots; ++j) {
    const std::string n = "tx_policy.step[" + std::to_string(j) + "]";
    const Num p = CircuitBuilder::from_bit(present[j]);

    std::map<std::string, Bit> matches;
    auto match_of = [&](const std::string& symbol) -> const Bit& {
      auto it = matches.find(symbol);
      if (it != matches.end()) return it->second;
      const auto& limbs = transition_limbs.at(symbol);
      Bit eq = CircuitBuilder::constant_bit(true);
      for (std::size_t l = 0; l < kDigestLimbs; ++l) {
        eq = b.and_(eq, b.is_equal(action_limbs[j][l], CircuitBuilder::constant(limbs[l]), n + ".limb_eq"),
                    n + ".match");
      }
      return matches.emplace(symbol, eq).first->second;
    };

    Num next = CircuitBuilder::constant_u64(0);
    Num found = CircuitBuilder::constant_u64(0);
    for (std::size_t s = 0; s < dfa_.states.size(); ++s) {
      if (dfa_.states[s].transitions.empty()) continue;
      const Bit in_state = b.is_equal(current, CircuitBuilder::constant_u64(s), n + ".in_state");
      for (const auto& t : dfa_.states[s].transitions) {
        const Bit active = b.and_(b.and_(in_state, match_of(t.symbol), n + ".state_match"), present[j], n + ".active");
        const Num active_num = CircuitBuilder::from_bit(active);
        next = CircuitBuilder::add(next, CircuitBuilder::scale(active_num, field_from_u64(t.target)));
        found = CircuitBuilder::add(found, active_num);
      }
    }
    b.enforce_equal(found, p, n + ".exactly_one");
    current = CircuitBuilder::add(next, b.mul(current, CircuitBuilder::sub(one, p), n + ".keep"));
  }

  Num accept = CircuitBuilder::constant_u64(0);
  for (std::size_t s = 0; s < dfa_.states.size(); ++s) {
    if (!dfa_.states[s].accepting) continue;
    accept = CircuitBuilder::add(
        accept, CircuitBuilder::from_bit(b.is_equal(current, CircuitBuilder::constant_u64(s), "tx_policy.accept")));
  }
  b.enforce_equal(accept, one, "tx_policy.accepting");
  return std::nullopt;
}

template std::vector<FieldT> tx_policy_public_inputs<FirstBytesDigest>(const TxPolicyBounds&, const Digest32&,
                                                                       const PolicyDfa&);
template std::vector<FieldT> tx_policy_public_inputs<Sha256Digest>(const TxPolicyBounds&, const Digest32&,
                                                                   const PolicyDfa&);
template class TxPolicyCircuit<FirstBytesDigest>;
template class TxPolicyCircuit<Sha256Digest>;

}  // namespace nexus::circuits
