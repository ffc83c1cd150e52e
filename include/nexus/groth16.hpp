#pragma once

// nexus/groth16.hpp: Groth16 setup, proving and verification.
//
// DESIGN:
//   Thin layer over libsnark's r1cs_gg_ppzksnark on alt_bn128. A circuit is
//   any type with
//     std::optional<Error> synthesize(circuits::Protoboard&) const;
//     std::vector<circuits::FieldT> public_inputs() const;
//   Setup and proving both synthesize the circuit onto a fresh protoboard;
//   setup uses the constraint system only, proving also uses the assignment.
//
//   Keys and proofs serialize through libsnark's stream operators.

#include <optional>
#include <string>
#include <vector>

#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include "nexus/circuit_gadgets.hpp"
#include "nexus/types.hpp"

namespace nexus::groth16 {

using circuits::Curve;
using circuits::FieldT;
using circuits::Protoboard;

using ProvingKey = libsnark::r1cs_gg_ppzksnark_proving_key<Curve>;
using VerificationKey = libsnark::r1cs_gg_ppzksnark_verification_key<Curve>;
using Proof = libsnark::r1cs_gg_ppzksnark_proof<Curve>;

struct Keypair {
  ProvingKey pk;
  VerificationKey vk;
};

// ---------------------------------------------------------------------------
// Protoboard level
// ---------------------------------------------------------------------------
std::optional<Keypair> setup_protoboard(const Protoboard& pb, Error* error = nullptr);
// Fails with circuit_unsatisfied before running the prover.
std::optional<Proof> prove_protoboard(const ProvingKey& pk, const Protoboard& pb, Error* error = nullptr);

std::optional<Error> verify(const VerificationKey& vk, const std::vector<FieldT>& public_inputs, const Proof& proof);

// ---------------------------------------------------------------------------
// Circuit level
// ---------------------------------------------------------------------------
template <typename Circuit>
std::optional<Protoboard> synthesize(const Circuit& circuit, Error* error = nullptr) {
  circuits::init_curve();
  Protoboard pb;
  if (auto err = circuit.synthesize(pb)) {
    if (error) *error = *err;
    return std::nullopt;
  }
  return pb;
}

template <typename Circuit>
std::optional<Error> check_satisfied(const Circuit& circuit) {
  Error err;
  auto pb = synthesize(circuit, &err);
  if (!pb) return err;
  if (!pb->is_satisfied()) return make_error(ErrorCode::circuit_unsatisfied, "constraint system is not satisfied");
  return std::nullopt;
}

template <typename Circuit>
std::optional<Keypair> setup(const Circuit& circuit, Error* error = nullptr) {
  auto pb = synthesize(circuit, error);
  if (!pb) return std::nullopt;
  return setup_protoboard(*pb, error);
}

template <typename Circuit>
std::optional<Proof> prove(const ProvingKey& pk, const Circuit& circuit, Error* error = nullptr) {
  auto pb = synthesize(circuit, error);
  if (!pb) return std::nullopt;
  return prove_protoboard(pk, *pb, error);
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------
std::string serialize_proof(const Proof& proof);
std::optional<Proof> deserialize_proof(const std::string& bytes, Error* error = nullptr);
std::string serialize_verification_key(const VerificationKey& vk);
std::optional<VerificationKey> deserialize_verification_key(const std::string& bytes, Error* error = nullptr);
std::string serialize_proving_key(const ProvingKey& pk);
std::optional<ProvingKey> deserialize_proving_key(const std::string& bytes, Error* error = nullptr);

}  // namespace nexus::groth16
