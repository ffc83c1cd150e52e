#pragma once

// nexus/circuit_gadgets.hpp: R1CS building blocks shared by the circuits.
//
// DESIGN:
//   CircuitBuilder wraps a libsnark protoboard over the alt_bn128 scalar
//   field. Every wire carries its native value next to its linear
//   combination, so constraints and witness are produced in one pass:
//   synthesizing with placeholder values yields the constraint system for
//   setup, synthesizing with real values yields the assignment for proving.
//
//   Constants are tracked: operations on constant wires fold natively and
//   emit no constraints. A digest over constant bytes is computed natively.
//
//   Digest gadgets are static policy types:
//     struct D {
//       static constexpr const char* kName;
//       static Digest32 native(std::string_view bytes);
//       static std::array<Byte, 32> gadget(CircuitBuilder&, const std::vector<Byte>&);
//     };
//
// INVARIANT:
//   Bits are little-endian within a byte (bits[0] is the LSB). Digests are
//   exposed as two limbs of 16 little-endian bytes each.
//   Public inputs must be allocated before any other variable.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>
#include <libsnark/relations/variable.hpp>

#include "nexus/types.hpp"

namespace nexus::circuits {

using Curve = libff::alt_bn128_pp;
using FieldT = libff::Fr<Curve>;
using LC = libsnark::linear_combination<FieldT>;
using Protoboard = libsnark::protoboard<FieldT>;

constexpr std::size_t kDigestLimbBytes = 16;
constexpr std::size_t kDigestLimbs = 32 / kDigestLimbBytes;

// Initializes the curve parameters once per process and silences libff
// profiling output.
void init_curve();

FieldT field_from_u64(std::uint64_t v);

// Native limb packing of a 32-byte digest.
std::array<FieldT, kDigestLimbs> digest_to_limbs(const Digest32& digest);

// ---------------------------------------------------------------------------
// Wires
// ---------------------------------------------------------------------------
struct Num {
  LC lc;
  FieldT value;
  bool is_const{false};
};

struct Bit {
  LC lc;
  bool value{false};
  bool is_const{false};
};

struct Byte {
  std::array<Bit, 8> bits;  // little-endian
  std::uint8_t value{0};

  bool is_const() const;
};

// ---------------------------------------------------------------------------
// CircuitBuilder
// ---------------------------------------------------------------------------
class CircuitBuilder {
 public:
  explicit CircuitBuilder(Protoboard& pb) : pb_(pb) {}

  Protoboard& pb() { return pb_; }

  // --- allocation ---
  Num public_input(const FieldT& value, const std::string& name);
  void finish_public_inputs();

  Num alloc(const FieldT& value, const std::string& name);
  Bit alloc_bit(bool value, const std::string& name);
  Byte alloc_byte(std::uint8_t value, const std::string& name);
  std::vector<Byte> alloc_bytes(std::string_view bytes, const std::string& name);

  static Num constant(const FieldT& value);
  static Num constant_u64(std::uint64_t value);
  static Bit constant_bit(bool value);
  static Byte constant_byte(std::uint8_t value);
  static std::vector<Byte> constant_bytes(std::string_view bytes);

  // Materializes a wire as a single protoboard variable (one equality
  // constraint unless it already is one).
  libsnark::pb_variable<FieldT> as_variable(const Bit& b, const std::string& name);

  // --- arithmetic ---
  static Num add(const Num& a, const Num& b);
  static Num sub(const Num& a, const Num& b);
  static Num scale(const Num& a, const FieldT& k);
  Num mul(const Num& a, const Num& b, const std::string& name);
  static Num from_bit(const Bit& b);

  // --- boolean ---
  Bit and_(const Bit& a, const Bit& b, const std::string& name);
  Bit or_(const Bit& a, const Bit& b, const std::string& name);
  static Bit not_(const Bit& a);
  Bit xnor(const Bit& a, const Bit& b, const std::string& name);

  // 1 iff a == b (inverse witness; no separate boolean constraint needed).
  Bit is_equal(const Num& a, const Num& b, const std::string& name);

  // --- packing ---
  static Num pack_bits(const std::vector<Bit>& bits_le);
  static Num pack_byte(const Byte& b);
  static Num pack_bytes_le(const std::vector<Byte>& bytes);
  std::array<Num, kDigestLimbs> digest_limbs(const std::array<Byte, 32>& digest);

  // Allocates `n` bits whose little-endian packing equals `x`. Unsatisfiable
  // when x >= 2^n.
  std::vector<Bit> decompose(const Num& x, std::size_t n, const std::string& name);

  // --- enforcement ---
  void enforce_equal(const Num& a, const Num& b, const std::string& name);
  void enforce_true(const Bit& b, const std::string& name);
  void enforce_zero_product(const Num& a, const Num& b, const std::string& name);
  void enforce_digest_eq_limbs(const std::array<Byte, 32>& digest, const std::array<Num, kDigestLimbs>& limbs,
                               const std::string& name);
  // Lexicographic a <= b over little-endian bit vectors (shorter side is
  // zero-extended).
  void enforce_le_bits(const std::vector<Bit>& a_le, const std::vector<Bit>& b_le, const std::string& name);

  // Digest through policy D, folding natively when every input byte is a
  // constant.
  template <typename D>
  std::array<Byte, 32> digest(const std::vector<Byte>& bytes) {
    bool all_const = true;
    for (const auto& b : bytes) {
      if (!b.is_const()) {
        all_const = false;
        break;
      }
    }
    if (all_const) {
      std::string native;
      native.reserve(bytes.size());
      for (const auto& b : bytes) native += static_cast<char>(b.value);
      const Digest32 d = D::native(native);
      std::array<Byte, 32> out;
      for (std::size_t i = 0; i < 32; ++i) out[i] = constant_byte(d[i]);
      return out;
    }
    return D::gadget(*this, bytes);
  }

  std::size_t constraint_count() const { return pb_.num_constraints(); }

 private:
  Protoboard& pb_;
  std::size_t public_count_{0};
};

// ---------------------------------------------------------------------------
// Digest policies
// ---------------------------------------------------------------------------

// First 32 bytes of the input, zero padded. Test-only stand-in for a hash.
struct FirstBytesDigest {
  static constexpr const char* kName = "first_bytes";
  static Digest32 native(std::string_view bytes);
  static std::array<Byte, 32> gadget(CircuitBuilder& b, const std::vector<Byte>& bytes);
};

// SHA-256 via libsnark's compression function gadget, with the padding
// fixed by the (synthesis-time) input length.
struct Sha256Digest {
  static constexpr const char* kName = "sha256";
  static Digest32 native(std::string_view bytes);
  static std::array<Byte, 32> gadget(CircuitBuilder& b, const std::vector<Byte>& bytes);
};

}  // namespace nexus::circuits
