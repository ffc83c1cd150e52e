#include "nexus/circuit_gadgets.hpp"

#include <memory>
#include <mutex>
#include <optional>

#include <libff/common/profiling.hpp>
#include <libsnark/gadgetlib1/gadgets/hashes/sha256/sha256_gadget.hpp>
#include <libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp>

#include "nexus/hash.hpp"

namespace nexus::circuits {
namespace {

using Constraint = libsnark::r1cs_constraint<FieldT>;

LC one_lc() { return LC(FieldT::one()); }

Bit bit_of_variable(const libsnark::pb_variable<FieldT>& v, bool value) {
  return Bit{LC(v), value, false};
}

std::uint8_t byte_value(const std::array<Bit, 8>& bits) {
  std::uint8_t v = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    if (bits[i].value) v = static_cast<std::uint8_t>(v | (1u << i));
  }
  return v;
}

}  // namespace

void init_curve() {
  static std::once_flag once;
  std::call_once(once, [] {
    libff::inhibit_profiling_info = true;
    libff::inhibit_profiling_counters = true;
    Curve::init_public_params();
  });
}

FieldT field_from_u64(std::uint64_t v) { return FieldT(static_cast<long>(v), true); }

std::array<FieldT, kDigestLimbs> digest_to_limbs(const Digest32& digest) {
  std::array<FieldT, kDigestLimbs> out;
  const FieldT base(256);
  for (std::size_t limb = 0; limb < kDigestLimbs; ++limb) {
    FieldT acc = FieldT::zero();
    FieldT coeff = FieldT::one();
    for (std::size_t k = 0; k < kDigestLimbBytes; ++k) {
      acc += coeff * FieldT(static_cast<long>(digest[limb * kDigestLimbBytes + k]));
      coeff *= base;
    }
    out[limb] = acc;
  }
  return out;
}

bool Byte::is_const() const {
  for (const auto& b : bits) {
    if (!b.is_const) return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Allocation
// ---------------------------------------------------------------------------

Num CircuitBuilder::public_input(const FieldT& value, const std::string& name) {
  libsnark::pb_variable<FieldT> v;
  v.allocate(pb_, name);
  pb_.val(v) = value;
  ++public_count_;
  return Num{LC(v), value, false};
}

void CircuitBuilder::finish_public_inputs() { pb_.set_input_sizes(public_count_); }

Num CircuitBuilder::alloc(const FieldT& value, const std::string& name) {
  libsnark::pb_variable<FieldT> v;
  v.allocate(pb_, name);
  pb_.val(v) = value;
  return Num{LC(v), value, false};
}

Bit CircuitBuilder::alloc_bit(bool value, const std::string& name) {
  libsnark::pb_variable<FieldT> v;
  v.allocate(pb_, name);
  pb_.val(v) = value ? FieldT::one() : FieldT::zero();
  pb_.add_r1cs_constraint(Constraint(LC(v), one_lc() - LC(v), LC()), name + ".boolean");
  return bit_of_variable(v, value);
}

Byte CircuitBuilder::alloc_byte(std::uint8_t value, const std::string& name) {
  Byte out;
  for (std::size_t i = 0; i < 8; ++i) out.bits[i] = alloc_bit(((value >> i) & 1u) != 0, name);
  out.value = value;
  return out;
}

std::vector<Byte> CircuitBuilder::alloc_bytes(std::string_view bytes, const std::string& name) {
  std::vector<Byte> out;
  out.reserve(bytes.size());
  for (char c : bytes) out.push_back(alloc_byte(static_cast<std::uint8_t>(c), name));
  return out;
}

Num CircuitBuilder::constant(const FieldT& value) { return Num{LC(value), value, true}; }

Num CircuitBuilder::constant_u64(std::uint64_t value) { return constant(field_from_u64(value)); }

Bit CircuitBuilder::constant_bit(bool value) {
  return Bit{value ? one_lc() : LC(), value, true};
}

Byte CircuitBuilder::constant_byte(std::uint8_t value) {
  Byte out;
  for (std::size_t i = 0; i < 8; ++i) out.bits[i] = constant_bit(((value >> i) & 1u) != 0);
  out.value = value;
  return out;
}

std::vector<Byte> CircuitBuilder::constant_bytes(std::string_view bytes) {
  std::vector<Byte> out;
  out.reserve(bytes.size());
  for (char c : bytes) out.push_back(constant_byte(static_cast<std::uint8_t>(c)));
  return out;
}

libsnark::pb_variable<FieldT> CircuitBuilder::as_variable(const Bit& b, const std::string& name) {
  if (!b.is_const && b.lc.terms.size() == 1 && b.lc.terms[0].index != 0 && b.lc.terms[0].coeff == FieldT::one()) {
    return libsnark::pb_variable<FieldT>(b.lc.terms[0].index);
  }
  libsnark::pb_variable<FieldT> v;
  v.allocate(pb_, name);
  pb_.val(v) = b.value ? FieldT::one() : FieldT::zero();
  pb_.add_r1cs_constraint(Constraint(one_lc(), b.lc, LC(v)), name + ".materialize");
  return v;
}

// ---------------------------------------------------------------------------
// Arithmetic
// ---------------------------------------------------------------------------

Num CircuitBuilder::add(const Num& a, const Num& b) {
  return Num{a.lc + b.lc, a.value + b.value, a.is_const && b.is_const};
}

Num CircuitBuilder::sub(const Num& a, const Num& b) {
  return Num{a.lc - b.lc, a.value - b.value, a.is_const && b.is_const};
}

Num CircuitBuilder::scale(const Num& a, const FieldT& k) { return Num{a.lc * k, a.value * k, a.is_const}; }

Num CircuitBuilder::mul(const Num& a, const Num& b, const std::string& name) {
  if (a.is_const) return scale(b, a.value);
  if (b.is_const) return scale(a, b.value);
  Num out = alloc(a.value * b.value, name);
  pb_.add_r1cs_constraint(Constraint(a.lc, b.lc, out.lc), name);
  return out;
}

Num CircuitBuilder::from_bit(const Bit& b) {
  return Num{b.lc, b.value ? FieldT::one() : FieldT::zero(), b.is_const};
}

// ---------------------------------------------------------------------------
// Boolean
// ---------------------------------------------------------------------------

Bit CircuitBuilder::and_(const Bit& a, const Bit& b, const std::string& name) {
  if (a.is_const) return a.value ? b : constant_bit(false);
  if (b.is_const) return b.value ? a : constant_bit(false);
  libsnark::pb_variable<FieldT> c;
  c.allocate(pb_, name);
  const bool v = a.value && b.value;
  pb_.val(c) = v ? FieldT::one() : FieldT::zero();
  pb_.add_r1cs_constraint(Constraint(a.lc, b.lc, LC(c)), name);
  return bit_of_variable(c, v);
}

Bit CircuitBuilder::or_(const Bit& a, const Bit& b, const std::string& name) {
  if (a.is_const) return a.value ? constant_bit(true) : b;
  if (b.is_const) return b.value ? constant_bit(true) : a;
  libsnark::pb_variable<FieldT> c;
  c.allocate(pb_, name);
  const bool v = a.value || b.value;
  pb_.val(c) = v ? FieldT::one() : FieldT::zero();
  // a * b = a + b - c
  pb_.add_r1cs_constraint(Constraint(a.lc, b.lc, a.lc + b.lc - LC(c)), name);
  return bit_of_variable(c, v);
}

Bit CircuitBuilder::not_(const Bit& a) { return Bit{one_lc() - a.lc, !a.value, a.is_const}; }

Bit CircuitBuilder::xnor(const Bit& a, const Bit& b, const std::string& name) {
  if (a.is_const) return a.value ? b : not_(b);
  if (b.is_const) return b.value ? a : not_(a);
  libsnark::pb_variable<FieldT> x;
  x.allocate(pb_, name);
  const bool v = a.value != b.value;
  pb_.val(x) = v ? FieldT::one() : FieldT::zero();
  // 2a * b = a + b - x
  pb_.add_r1cs_constraint(Constraint(a.lc * FieldT(2), b.lc, a.lc + b.lc - LC(x)), name);
  return not_(bit_of_variable(x, v));
}

Bit CircuitBuilder::is_equal(const Num& a, const Num& b, const std::string& name) {
  if (a.is_const && b.is_const) return constant_bit(a.value == b.value);
  const Num d = sub(a, b);
  const bool eq = d.value.is_zero();
  Num inv = alloc(eq ? FieldT::zero() : d.value.inverse(), name + ".inv");
  libsnark::pb_variable<FieldT> e;
  e.allocate(pb_, name + ".eq");
  pb_.val(e) = eq ? FieldT::one() : FieldT::zero();
  pb_.add_r1cs_constraint(Constraint(d.lc, inv.lc, one_lc() - LC(e)), name + ".nonzero");
  pb_.add_r1cs_constraint(Constraint(d.lc, LC(e), LC()), name + ".zero");
  return bit_of_variable(e, eq);
}

// ---------------------------------------------------------------------------
// Packing
// ---------------------------------------------------------------------------

Num CircuitBuilder::pack_bits(const std::vector<Bit>& bits_le) {
  LC lc;
  FieldT value = FieldT::zero();
  FieldT coeff = FieldT::one();
  bool all_const = true;
  for (const auto& b : bits_le) {
    lc = lc + b.lc * coeff;
    if (b.value) value += coeff;
    all_const = all_const && b.is_const;
    coeff += coeff;
  }
  return Num{lc, value, all_const};
}

Num CircuitBuilder::pack_byte(const Byte& b) {
  return pack_bits(std::vector<Bit>(b.bits.begin(), b.bits.end()));
}

Num CircuitBuilder::pack_bytes_le(const std::vector<Byte>& bytes) {
  Num acc = constant(FieldT::zero());
  FieldT coeff = FieldT::one();
  const FieldT base(256);
  for (const auto& b : bytes) {
    acc = add(acc, scale(pack_byte(b), coeff));
    coeff *= base;
  }
  return acc;
}

std::array<Num, kDigestLimbs> CircuitBuilder::digest_limbs(const std::array<Byte, 32>& digest) {
  std::array<Num, kDigestLimbs> out;
  for (std::size_t limb = 0; limb < kDigestLimbs; ++limb) {
    std::vector<Byte> seg(digest.begin() + static_cast<std::ptrdiff_t>(limb * kDigestLimbBytes),
                          digest.begin() + static_cast<std::ptrdiff_t>((limb + 1) * kDigestLimbBytes));
    out[limb] = pack_bytes_le(seg);
  }
  return out;
}

std::vector<Bit> CircuitBuilder::decompose(const Num& x, std::size_t n, const std::string& name) {
  const auto big = x.value.as_bigint();
  std::vector<Bit> bits;
  bits.reserve(n);
  for (std::size_t i = 0; i < n; ++i) bits.push_back(alloc_bit(big.test_bit(i), name));
  enforce_equal(pack_bits(bits), x, name + ".pack");
  return bits;
}

// ---------------------------------------------------------------------------
// Enforcement
// ---------------------------------------------------------------------------

void CircuitBuilder::enforce_equal(const Num& a, const Num& b, const std::string& name) {
  pb_.add_r1cs_constraint(Constraint(one_lc(), a.lc - b.lc, LC()), name);
}

void CircuitBuilder::enforce_true(const Bit& b, const std::string& name) {
  pb_.add_r1cs_constraint(Constraint(one_lc(), b.lc, one_lc()), name);
}

void CircuitBuilder::enforce_zero_product(const Num& a, const Num& b, const std::string& name) {
  pb_.add_r1cs_constraint(Constraint(a.lc, b.lc, LC()), name);
}

void CircuitBuilder::enforce_digest_eq_limbs(const std::array<Byte, 32>& digest,
                                             const std::array<Num, kDigestLimbs>& limbs, const std::string& name) {
  const auto packed = digest_limbs(digest);
  for (std::size_t i = 0; i < kDigestLimbs; ++i) enforce_equal(packed[i], limbs[i], name);
}

void CircuitBuilder::enforce_le_bits(const std::vector<Bit>& a_le, const std::vector<Bit>& b_le,
                                     const std::string& name) {
  const std::size_t n = std::max(a_le.size(), b_le.size());
  Bit lt = constant_bit(false);
  Bit eq = constant_bit(true);
  for (std::size_t k = n; k-- > 0;) {
    const Bit a = k < a_le.size() ? a_le[k] : constant_bit(false);
    const Bit b = k < b_le.size() ? b_le[k] : constant_bit(false);
    const Bit a_less_b = and_(not_(a), b, name + ".lt_bit");
    lt = or_(lt, and_(a_less_b, eq, name + ".lt_eq"), name + ".lt");
    eq = and_(eq, xnor(a, b, name + ".xnor"), name + ".eq");
  }
  enforce_true(or_(lt, eq, name + ".le"), name);
}

// ---------------------------------------------------------------------------
// Digest policies
// ---------------------------------------------------------------------------

Digest32 FirstBytesDigest::native(std::string_view bytes) {
  Digest32 out{};
  for (std::size_t i = 0; i < out.size() && i < bytes.size(); ++i) out[i] = static_cast<std::uint8_t>(bytes[i]);
  return out;
}

std::array<Byte, 32> FirstBytesDigest::gadget(CircuitBuilder&, const std::vector<Byte>& bytes) {
  std::array<Byte, 32> out;
  for (std::size_t i = 0; i < 32; ++i) out[i] = i < bytes.size() ? bytes[i] : CircuitBuilder::constant_byte(0);
  return out;
}

Digest32 Sha256Digest::native(std::string_view bytes) { return sha256(bytes); }

std::array<Byte, 32> Sha256Digest::gadget(CircuitBuilder& b, const std::vector<Byte>& bytes) {
  auto& pb = b.pb();

  // Message bits MSB-first per byte, then the fixed padding.
  std::vector<Bit> stream;
  for (const auto& byte : bytes) {
    for (std::size_t i = 8; i-- > 0;) stream.push_back(byte.bits[i]);
  }
  std::string padding(1, static_cast<char>(0x80));
  while ((bytes.size() + padding.size()) % 64 != 56) padding += '\0';
  const std::uint64_t bit_len = static_cast<std::uint64_t>(bytes.size()) * 8;
  for (int i = 7; i >= 0; --i) padding += static_cast<char>((bit_len >> (8 * i)) & 0xFF);
  for (char c : padding) {
    const auto v = static_cast<std::uint8_t>(c);
    for (std::size_t i = 8; i-- > 0;) stream.push_back(CircuitBuilder::constant_bit(((v >> i) & 1u) != 0));
  }

  std::optional<libsnark::pb_variable<FieldT>> zero_var;
  std::optional<libsnark::pb_variable<FieldT>> one_var;
  libsnark::pb_variable_array<FieldT> message;
  message.reserve(stream.size());
  for (const auto& bit : stream) {
    if (bit.is_const) {
      auto& cached = bit.value ? one_var : zero_var;
      if (!cached) cached = b.as_variable(bit, "sha256.const");
      message.push_back(*cached);
    } else {
      message.push_back(b.as_variable(bit, "sha256.msg"));
    }
  }

  libsnark::pb_linear_combination_array<FieldT> chain = libsnark::SHA256_default_IV<FieldT>(pb);
  std::unique_ptr<libsnark::digest_variable<FieldT>> out;
  const std::size_t blocks = message.size() / 512;
  for (std::size_t blk = 0; blk < blocks; ++blk) {
    libsnark::pb_variable_array<FieldT> block(message.begin() + static_cast<std::ptrdiff_t>(blk * 512),
                                              message.begin() + static_cast<std::ptrdiff_t>((blk + 1) * 512));
    auto next = std::make_unique<libsnark::digest_variable<FieldT>>(pb, 256, "sha256.digest");
    libsnark::sha256_compression_function_gadget<FieldT> compress(pb, chain, block, *next, "sha256.compress");
    compress.generate_r1cs_constraints();
    compress.generate_r1cs_witness();
    chain = libsnark::pb_linear_combination_array<FieldT>(next->bits);
    out = std::move(next);
  }

  std::array<Byte, 32> digest;
  for (std::size_t j = 0; j < 32; ++j) {
    for (std::size_t i = 0; i < 8; ++i) {
      const auto& var = out->bits[8 * j + (7 - i)];
      digest[j].bits[i] = Bit{LC(var), pb.val(var) == FieldT::one(), false};
    }
    digest[j].value = byte_value(digest[j].bits);
  }
  return digest;
}

}  // namespace nexus::circuits
