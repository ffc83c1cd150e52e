#pragma once

// nexus/gas_circuit.hpp: Batched gas-consistency circuit.
//
// DESIGN:
//   One circuit proves N (checkpoint, transaction, claimed gas) tuples. For
//   each tuple the prover shows that the checkpoint summary hashes to the
//   public checkpoint digest, that the summary embeds the digest of the
//   transaction contents, that the contents embed the public transaction
//   digest followed by the effects digest, and that the gas fields read from
//   the effects add up to a total within `tolerance_bps` of the claim:
//
//     total = computation + storage - rebate        (rebate <= storage)
//     10000 * total   <= (10000 + tol) * claimed
//     10000 * claimed <= (10000 + tol) * total
//
//   Public inputs, per tuple in order: checkpoint limbs (2), tx limbs (2),
//   claimed total (1), tolerance bps (1).
//
// INVARIANT:
//   The circuit shape depends on blob lengths and offsets. A key pair is valid
//   only for witnesses with the same shape as the one it was set up with.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nexus/circuit_gadgets.hpp"
#include "nexus/types.hpp"

namespace nexus::circuits {

constexpr std::uint16_t kMaxToleranceBps = 10000;

struct GasTuplePublic {
  Digest32 checkpoint_digest{};
  Digest32 tx_digest{};
  std::uint64_t claimed_total{0};
  std::uint16_t tolerance_bps{0};
};

struct GasTupleWitness {
  std::string summary_bytes;
  std::string contents_bytes;
  std::string effects_bytes;

  std::size_t content_digest_offset{0};  // in summary_bytes
  std::size_t tx_digest_offset{0};       // in contents_bytes
  std::size_t effects_digest_offset{0};  // in contents_bytes, == tx_digest_offset + 32

  std::uint64_t computation_cost{0};
  std::uint64_t storage_cost{0};
  std::uint64_t storage_rebate{0};
  std::size_t computation_offset{0};  // in effects_bytes
  std::size_t storage_offset{0};
  std::size_t rebate_offset{0};
};

struct GasTuple {
  GasTuplePublic pub;
  GasTupleWitness witness;
};

// Structural witness checks run before synthesis.
std::optional<Error> validate_gas_tuple(const GasTuple& tuple, std::size_t index);

// Native evaluation of the tolerance relation, for callers that want to know
// up front whether a claim can be proved.
bool gas_within_tolerance(std::uint64_t total, std::uint64_t claimed, std::uint16_t tolerance_bps);

std::vector<FieldT> gas_public_inputs(const std::vector<GasTuplePublic>& tuples);

template <typename D>
class GasCircuit {
 public:
  static std::optional<GasCircuit> make(std::vector<GasTuple> tuples, Error* error = nullptr);

  std::optional<Error> synthesize(Protoboard& pb) const;
  std::vector<FieldT> public_inputs() const;

  const std::vector<GasTuple>& tuples() const { return tuples_; }

 private:
  explicit GasCircuit(std::vector<GasTuple> tuples) : tuples_(std::move(tuples)) {}

  std::vector<GasTuple> tuples_;
};

extern template class GasCircuit<FirstBytesDigest>;
extern template class GasCircuit<Sha256Digest>;

}  // namespace nexus::circuits
