#include "nexus/gas_circuit.hpp"

#include <array>

namespace nexus::circuits {
namespace {

constexpr std::size_t kGasBits = 64;
constexpr std::size_t kToleranceBits = 16;
constexpr std::size_t kProductBits = 80;

bool span_ok(std::size_t offset, std::size_t len, std::size_t size) {
  return offset <= size && len <= size - offset;
}

std::vector<Bit> constant_bits(std::uint64_t v, std::size_t n) {
  std::vector<Bit> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) out.push_back(CircuitBuilder::constant_bit(i < 64 && ((v >> i) & 1u) != 0));
  return out;
}

std::array<Byte, 32> slice32(const std::vector<Byte>& bytes, std::size_t offset) {
  std::array<Byte, 32> out;
  for (std::size_t k = 0; k < 32; ++k) out[k] = bytes[offset + k];
  return out;
}

// Allocates a u64 as 64 bits and ties its little-endian bytes to the blob.
std::vector<Bit> bind_u64(CircuitBuilder& b, std::uint64_t value, const std::vector<Byte>& blob, std::size_t offset,
                          const std::string& name) {
  std::vector<Bit> bits;
  bits.reserve(kGasBits);
  for (std::size_t i = 0; i < kGasBits; ++i) bits.push_back(b.alloc_bit(((value >> i) & 1u) != 0, name));
  for (std::size_t k = 0; k < 8; ++k) {
    std::vector<Bit> byte_bits(bits.begin() + static_cast<std::ptrdiff_t>(8 * k),
                               bits.begin() + static_cast<std::ptrdiff_t>(8 * (k + 1)));
    b.enforce_equal(CircuitBuilder::pack_bits(byte_bits), CircuitBuilder::pack_byte(blob[offset + k]),
                    name + ".byte");
  }
  return bits;
}

}  // namespace

std::optional<Error> validate_gas_tuple(const GasTuple& tuple, std::size_t index) {
  const auto& w = tuple.witness;
  const std::string at = "gas tuple " + std::to_string(index) + ": ";
  if (!span_ok(w.content_digest_offset, 32, w.summary_bytes.size())) {
    return make_error(ErrorCode::circuit_witness_invalid, at + "content digest offset out of bounds");
  }
  if (!span_ok(w.tx_digest_offset, 32, w.contents_bytes.size())) {
    return make_error(ErrorCode::circuit_witness_invalid, at + "tx digest offset out of bounds");
  }
  if (!span_ok(w.effects_digest_offset, 32, w.contents_bytes.size())) {
    return make_error(ErrorCode::circuit_witness_invalid, at + "effects digest offset out of bounds");
  }
  if (w.effects_digest_offset != w.tx_digest_offset + 32) {
    return make_error(ErrorCode::circuit_witness_invalid, at + "effects digest must follow the tx digest");
  }
  const std::size_t gas_offsets[] = {w.computation_offset, w.storage_offset, w.rebate_offset};
  for (std::size_t off : gas_offsets) {
    if (!span_ok(off, 8, w.effects_bytes.size())) {
      return make_error(ErrorCode::circuit_witness_invalid, at + "gas field offset out of bounds");
    }
  }
  if (tuple.pub.tolerance_bps > kMaxToleranceBps) {
    return make_error(ErrorCode::circuit_witness_invalid, at + "tolerance above 10000 bps");
  }
  return std::nullopt;
}

bool gas_within_tolerance(std::uint64_t total, std::uint64_t claimed, std::uint16_t tolerance_bps) {
  using U128 = unsigned __int128;
  const U128 window = static_cast<U128>(kMaxToleranceBps) + tolerance_bps;
  return static_cast<U128>(kMaxToleranceBps) * total <= window * claimed &&
         static_cast<U128>(kMaxToleranceBps) * claimed <= window * total;
}

std::vector<FieldT> gas_public_inputs(const std::vector<GasTuplePublic>& tuples) {
  init_curve();
  std::vector<FieldT> out;
  out.reserve(tuples.size() * 6);
  for (const auto& t : tuples) {
    for (const auto& limb : digest_to_limbs(t.checkpoint_digest)) out.push_back(limb);
    for (const auto& limb : digest_to_limbs(t.tx_digest)) out.push_back(limb);
    out.push_back(field_from_u64(t.claimed_total));
    out.push_back(field_from_u64(t.tolerance_bps));
  }
  return out;
}

template <typename D>
std::optional<GasCircuit<D>> GasCircuit<D>::make(std::vector<GasTuple> tuples, Error* error) {
  init_curve();
  if (tuples.empty()) {
    set_error(error, ErrorCode::circuit_witness_invalid, "gas circuit needs at least one tuple");
    return std::nullopt;
  }
  for (std::size_t i = 0; i < tuples.size(); ++i) {
    if (auto err = validate_gas_tuple(tuples[i], i)) {
      if (error) *error = *err;
      return std::nullopt;
    }
  }
  return GasCircuit(std::move(tuples));
}

template <typename D>
std::vector<FieldT> GasCircuit<D>::public_inputs() const {
  std::vector<GasTuplePublic> pubs;
  pubs.reserve(tuples_.size());
  for (const auto& t : tuples_) pubs.push_back(t.pub);
  return gas_public_inputs(pubs);
}

template <typename D>
std::optional<Error> GasCircuit<D>::synthesize(Protoboard& pb) const {
  for (std::size_t i = 0; i < tuples_.size(); ++i) {
    if (auto err = validate_gas_tuple(tuples_[i], i)) return err;
  }

  CircuitBuilder b(pb);

  struct PublicWires {
    std::array<Num, kDigestLimbs> checkpoint;
    std::array<Num, kDigestLimbs> tx;
    Num claimed;
    Num tolerance;
  };
  std::vector<PublicWires> pubs;
  pubs.reserve(tuples_.size());
  for (std::size_t i = 0; i < tuples_.size(); ++i) {
    const auto& p = tuples_[i].pub;
    const std::string n = "gas[" + std::to_string(i) + "]";
    PublicWires w;
    const auto cp = digest_to_limbs(p.checkpoint_digest);
    const auto tx = digest_to_limbs(p.tx_digest);
    for (std::size_t l = 0; l < kDigestLimbs; ++l) w.checkpoint[l] = b.public_input(cp[l], n + ".checkpoint");
    for (std::size_t l = 0; l < kDigestLimbs; ++l) w.tx[l] = b.public_input(tx[l], n + ".tx");
    w.claimed = b.public_input(field_from_u64(p.claimed_total), n + ".claimed");
    w.tolerance = b.public_input(field_from_u64(p.tolerance_bps), n + ".tolerance");
    pubs.push_back(w);
  }
  b.finish_public_inputs();

  const Num scale_bps = CircuitBuilder::constant_u64(kMaxToleranceBps);
  for (std::size_t i = 0; i < tuples_.size(); ++i) {
    const auto& w = tuples_[i].witness;
    const auto& pw = pubs[i];
    const std::string n = "gas[" + std::to_string(i) + "]";

    const auto summary = b.alloc_bytes(w.summary_bytes, n + ".summary");
    const auto contents = b.alloc_bytes(w.contents_bytes, n + ".contents");
    const auto effects = b.alloc_bytes(w.effects_bytes, n + ".effects");

    // Digest chain: checkpoint <- summary <- contents <- (tx, effects).
    b.enforce_digest_eq_limbs(b.digest<D>(summary), pw.checkpoint, n + ".checkpoint_eq");

    const auto contents_digest = b.digest<D>(contents);
    for (std::size_t k = 0; k < 32; ++k) {
      b.enforce_equal(CircuitBuilder::pack_byte(summary[w.content_digest_offset + k]),
                      CircuitBuilder::pack_byte(contents_digest[k]), n + ".contents_eq");
    }

    b.enforce_digest_eq_limbs(slice32(contents, w.tx_digest_offset), pw.tx, n + ".tx_eq");

    const auto effects_digest = b.digest<D>(effects);
    for (std::size_t k = 0; k < 32; ++k) {
      b.enforce_equal(CircuitBuilder::pack_byte(contents[w.effects_digest_offset + k]),
                      CircuitBuilder::pack_byte(effects_digest[k]), n + ".effects_eq");
    }

    // Gas fields.
    const auto comp_bits = bind_u64(b, w.computation_cost, effects, w.computation_offset, n + ".computation");
    const auto stor_bits = bind_u64(b, w.storage_cost, effects, w.storage_offset, n + ".storage");
    const auto reb_bits = bind_u64(b, w.storage_rebate, effects, w.rebate_offset, n + ".rebate");
    b.enforce_le_bits(reb_bits, stor_bits, n + ".rebate_le_storage");

    const Num total = CircuitBuilder::sub(
        CircuitBuilder::add(CircuitBuilder::pack_bits(comp_bits), CircuitBuilder::pack_bits(stor_bits)),
        CircuitBuilder::pack_bits(reb_bits));
    const auto total_bits = b.decompose(total, kGasBits, n + ".total");
    const Num total_packed = CircuitBuilder::pack_bits(total_bits);

    const auto claimed_bits = b.decompose(pw.claimed, kGasBits, n + ".claimed");
    const auto tol_bits = b.decompose(pw.tolerance, kToleranceBits, n + ".tolerance");
    b.enforce_le_bits(tol_bits, constant_bits(kMaxToleranceBps, kToleranceBits), n + ".tolerance_max");

    // Symmetric tolerance window.
    const Num window = CircuitBuilder::add(scale_bps, CircuitBuilder::pack_bits(tol_bits));
    const Num claimed_packed = CircuitBuilder::pack_bits(claimed_bits);

    const Num lhs_total = CircuitBuilder::scale(total_packed, scale_bps.value);
    const Num rhs_claimed = b.mul(window, claimed_packed, n + ".window_claimed");
    b.enforce_le_bits(b.decompose(lhs_total, kProductBits, n + ".lhs_total"),
                      b.decompose(rhs_claimed, kProductBits, n + ".rhs_claimed"), n + ".total_le_claimed");

    const Num lhs_claimed = CircuitBuilder::scale(claimed_packed, scale_bps.value);
    const Num rhs_total = b.mul(window, total_packed, n + ".window_total");
    b.enforce_le_bits(b.decompose(lhs_claimed, kProductBits, n + ".lhs_claimed"),
                      b.decompose(rhs_total, kProductBits, n + ".rhs_total"), n + ".claimed_le_total");
  }
  return std::nullopt;
}

template class GasCircuit<FirstBytesDigest>;
template class GasCircuit<Sha256Digest>;

}  // namespace nexus::circuits
