#include "nexus/groth16.hpp"

#include <sstream>

#include "nexus/observability.hpp"

namespace nexus::groth16 {
namespace {

void emit(const char* action, bool ok, ErrorCode code, std::size_t constraints, std::uint64_t duration_ns) {
  ToolkitEvent ev;
  ev.component = "groth16";
  ev.action = action;
  ev.subject = "alt_bn128";
  ev.ok = ok;
  ev.error = code;
  ev.detail = "constraints=" + std::to_string(constraints);
  ev.duration_ns = duration_ns;
  emit_toolkit_event(ev);
}

template <typename T>
std::string to_stream_bytes(const T& value) {
  std::stringstream ss;
  ss << value;
  return ss.str();
}

template <typename T>
std::optional<T> from_stream_bytes(const std::string& bytes, const char* what, Error* error) {
  circuits::init_curve();
  std::stringstream ss(bytes);
  T value;
  ss >> value;
  if (ss.fail()) {
    set_error(error, ErrorCode::proof_verification_failed, std::string("malformed ") + what);
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<Keypair> setup_protoboard(const Protoboard& pb, Error*) {
  circuits::init_curve();
  std::uint64_t ns = 0;
  Keypair out;
  {
    ScopeTimer timer(ns);
    auto keypair = libsnark::r1cs_gg_ppzksnark_generator<Curve>(pb.get_constraint_system());
    out.pk = std::move(keypair.pk);
    out.vk = std::move(keypair.vk);
  }
  emit("setup", true, ErrorCode::none, pb.num_constraints(), ns);
  return out;
}

std::optional<Proof> prove_protoboard(const ProvingKey& pk, const Protoboard& pb, Error* error) {
  circuits::init_curve();
  if (!pb.is_satisfied()) {
    emit("prove", false, ErrorCode::circuit_unsatisfied, pb.num_constraints(), 0);
    set_error(error, ErrorCode::circuit_unsatisfied, "constraint system is not satisfied by the witness");
    return std::nullopt;
  }
  std::uint64_t ns = 0;
  std::optional<Proof> proof;
  {
    ScopeTimer timer(ns);
    proof = libsnark::r1cs_gg_ppzksnark_prover<Curve>(pk, pb.primary_input(), pb.auxiliary_input());
  }
  emit("prove", true, ErrorCode::none, pb.num_constraints(), ns);
  return proof;
}

std::optional<Error> verify(const VerificationKey& vk, const std::vector<FieldT>& public_inputs, const Proof& proof) {
  circuits::init_curve();
  std::uint64_t ns = 0;
  bool ok = false;
  {
    ScopeTimer timer(ns);
    const libsnark::r1cs_primary_input<FieldT> primary(public_inputs.begin(), public_inputs.end());
    ok = libsnark::r1cs_gg_ppzksnark_verifier_strong_IC<Curve>(vk, primary, proof);
  }
  if (!ok) {
    emit("verify", false, ErrorCode::proof_verification_failed, 0, ns);
    return make_error(ErrorCode::proof_verification_failed, "groth16 proof rejected");
  }
  emit("verify", true, ErrorCode::none, 0, ns);
  return std::nullopt;
}

std::string serialize_proof(const Proof& proof) { return to_stream_bytes(proof); }

std::optional<Proof> deserialize_proof(const std::string& bytes, Error* error) {
  return from_stream_bytes<Proof>(bytes, "proof", error);
}

std::string serialize_verification_key(const VerificationKey& vk) { return to_stream_bytes(vk); }

std::optional<VerificationKey> deserialize_verification_key(const std::string& bytes, Error* error) {
  return from_stream_bytes<VerificationKey>(bytes, "verification key", error);
}

std::string serialize_proving_key(const ProvingKey& pk) { return to_stream_bytes(pk); }

std::optional<ProvingKey> deserialize_proving_key(const std::string& bytes, Error* error) {
  return from_stream_bytes<ProvingKey>(bytes, "proving key", error);
}

}  // namespace nexus::groth16
