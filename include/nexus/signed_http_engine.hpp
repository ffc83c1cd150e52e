#pragma once

// nexus/signed_http_engine.hpp: Invoker / Responder protocol over the
// Signed-HTTP v1 wire format.
//
// DESIGN:
//   SignedHttpEngine carries the policy and a Clock. It hands out an Invoker
//   (signs requests, verifies responses) and a Responder (authenticates
//   requests, applies replay rules, signs responses).
//
//   Responder flow:
//     decode headers -> verify claims -> ReplayStore::begin_or_replay
//       proceed        -> InvokeDecision::proceed   (InboundSession, in-flight)
//       return         -> InvokeDecision::replayed  (cached SignedResponse)
//       conflict       -> InvokeDecision::rejected  (replay_conflict)
//       in_flight      -> InvokeDecision::rejected  (replay_in_flight)
//
//   Replay key is "<leader_id>:<nonce>"; the request hash is
//   sha256(request sig_input).
//
// INVARIANTS:
//   - The clock is read once for authentication and once when signing.
//   - The allow-list is consulted exactly once per request.
//   - An InboundSession that is dropped without finish() releases its
//     in-flight reservation.
//   - ResponderRejection::sign_response never touches the replay store.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "nexus/crypto.hpp"
#include "nexus/signed_http.hpp"
#include "nexus/types.hpp"

namespace nexus::signed_http {

// ---------------------------------------------------------------------------
// Clock
// ---------------------------------------------------------------------------
class Clock {
 public:
  virtual ~Clock() = default;
  virtual std::uint64_t now_ms() const = 0;
};

class SystemClock : public Clock {
 public:
  std::uint64_t now_ms() const override { return system_now_ms(); }
};

// Test clock. set() is not synchronised with readers.
class FixedClock : public Clock {
 public:
  explicit FixedClock(std::uint64_t now_ms) : now_ms_(now_ms) {}
  std::uint64_t now_ms() const override { return now_ms_; }
  void set(std::uint64_t now_ms) { now_ms_ = now_ms; }
  void advance(std::uint64_t delta_ms) { now_ms_ += delta_ms; }

 private:
  std::uint64_t now_ms_;
};

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------
struct SignedResponse {
  std::uint16_t status{0};
  std::string body;
  SignatureHeaders headers;
};

// ---------------------------------------------------------------------------
// ReplayStore
// ---------------------------------------------------------------------------
struct ReplayDecision {
  enum class Kind { proceed, return_response, conflict, in_flight };
  Kind kind{Kind::proceed};
  std::optional<SignedResponse> response;  // set for return_response
};

class ReplayStore {
 public:
  virtual ~ReplayStore() = default;

  // Atomic: an absent key is reserved as in-flight and `proceed` returned.
  virtual ReplayDecision begin_or_replay(const std::string& key, const Digest32& request_hash,
                                         std::uint64_t expires_at_ms, std::uint64_t now_ms) = 0;
  virtual void complete(const std::string& key, const Digest32& request_hash, std::uint64_t expires_at_ms,
                        const SignedResponse& response) = 0;
  virtual void remove(const std::string& key) = 0;
};

class InMemoryReplayStore : public ReplayStore {
 public:
  ReplayDecision begin_or_replay(const std::string& key, const Digest32& request_hash, std::uint64_t expires_at_ms,
                                 std::uint64_t now_ms) override;
  void complete(const std::string& key, const Digest32& request_hash, std::uint64_t expires_at_ms,
                const SignedResponse& response) override;
  void remove(const std::string& key) override;

  std::size_t size() const;

 private:
  struct Entry {
    Digest32 request_hash{};
    std::uint64_t expires_at_ms{0};
    std::optional<SignedResponse> response;  // nullopt while in flight
  };

  mutable std::mutex mu_;
  std::map<std::string, Entry> entries_;
};

// ---------------------------------------------------------------------------
// Key resolvers
// ---------------------------------------------------------------------------
class InvokerKeyResolver {
 public:
  virtual ~InvokerKeyResolver() = default;
  virtual std::optional<Key32> invoker_public_key(const std::string& invoker_id, std::uint64_t kid) const = 0;
};

class ResponderKeyResolver {
 public:
  virtual ~ResponderKeyResolver() = default;
  virtual std::optional<Key32> responder_public_key(const std::string& responder_id, std::uint64_t kid) const = 0;
};

class AllowedLeadersResolver : public InvokerKeyResolver {
 public:
  explicit AllowedLeadersResolver(AllowedLeaders leaders) : leaders_(std::move(leaders)) {}
  std::optional<Key32> invoker_public_key(const std::string& invoker_id, std::uint64_t kid) const override {
    return leaders_.key(invoker_id, kid);
  }

 private:
  AllowedLeaders leaders_;
};

class StaticResponderKey : public ResponderKeyResolver {
 public:
  StaticResponderKey(std::string responder_id, std::uint64_t kid, const Key32& public_key)
      : responder_id_(std::move(responder_id)), kid_(kid), public_key_(public_key) {}
  std::optional<Key32> responder_public_key(const std::string& responder_id, std::uint64_t kid) const override;

 private:
  std::string responder_id_;
  std::uint64_t kid_;
  Key32 public_key_;
};

// ---------------------------------------------------------------------------
// Invoker side
// ---------------------------------------------------------------------------
struct VerifiedResponse {
  std::string responder_id;
  std::uint64_t responder_kid{0};
  std::string nonce;
  std::uint16_t status{0};
  Key32 responder_public_key{};
  Digest32 response_sig_input_sha256{};
};

class OutboundSession {
 public:
  // Stable across calls, so retries resend identical headers.
  const SignatureHeaders& request_headers() const { return headers_; }
  const std::string& nonce() const { return nonce_; }
  const std::string& request_sig_input_bytes() const { return sig_input_; }
  const Digest32& request_sig_input_sha256() const { return sig_input_sha256_; }

  std::optional<VerifiedResponse> verify_response(std::uint16_t status, const ReceivedHeaders& headers,
                                                  const std::string& body, const ResponderKeyResolver& resolver,
                                                  Error* error = nullptr) const;

 private:
  friend class Invoker;
  OutboundSession() = default;

  std::optional<VerifiedResponse> check_response(std::uint16_t status, const ReceivedHeaders& headers,
                                                 const std::string& body, const ResponderKeyResolver& resolver,
                                                 Error* error) const;

  Policy policy_;
  std::shared_ptr<const Clock> clock_;
  std::string expected_responder_id_;
  std::string nonce_;
  std::string sig_input_;
  Digest32 sig_input_sha256_{};
  SignatureHeaders headers_;
};

class Invoker {
 public:
  // 16 random bytes, base64url encoded.
  std::optional<OutboundSession> begin_invoke(const std::string& responder_id, const std::string& method,
                                              const std::string& path, const std::string& query,
                                              const std::string& body, Error* error = nullptr) const;
  std::optional<OutboundSession> begin_invoke_with_nonce(const std::string& responder_id, const std::string& method,
                                                         const std::string& path, const std::string& query,
                                                         const std::string& body, std::string nonce,
                                                         Error* error = nullptr) const;

  const std::string& invoker_id() const { return invoker_id_; }
  std::uint64_t invoker_kid() const { return invoker_kid_; }

 private:
  friend class SignedHttpEngine;
  Invoker(Policy policy, std::shared_ptr<const Clock> clock, std::string invoker_id, std::uint64_t kid,
          crypto::SigningKey key)
      : policy_(policy),
        clock_(std::move(clock)),
        invoker_id_(std::move(invoker_id)),
        invoker_kid_(kid),
        key_(std::move(key)) {}

  Policy policy_;
  std::shared_ptr<const Clock> clock_;
  std::string invoker_id_;
  std::uint64_t invoker_kid_;
  crypto::SigningKey key_;
};

// ---------------------------------------------------------------------------
// Responder side
// ---------------------------------------------------------------------------
struct AuthContext {
  std::string invoker_id;
  std::uint64_t invoker_kid{0};
  std::string responder_id;
  std::uint64_t iat_ms{0};
  std::uint64_t exp_ms{0};
  std::string nonce;
  std::string method;
  std::string path;
  std::string query;
  Key32 invoker_public_key{};
  Digest32 request_sig_input_sha256{};
  // Single clock reading for the request; replay purge and response iat use it.
  std::uint64_t now_ms{0};
};

struct ResponderState;

// A verified request with no replay reservation attached.
class AuthenticatedRequest {
 public:
  const AuthContext& auth_context() const { return ctx_; }
  std::optional<SignedResponse> sign_response(std::uint16_t status, const std::string& body,
                                              Error* error = nullptr) const;

 private:
  friend class Responder;
  AuthenticatedRequest(std::shared_ptr<const ResponderState> state, AuthContext ctx)
      : state_(std::move(state)), ctx_(std::move(ctx)) {}

  std::shared_ptr<const ResponderState> state_;
  AuthContext ctx_;
};

// RAII in-flight reservation. Removes the replay entry unless disarmed.
class InFlightGuard {
 public:
  InFlightGuard(std::shared_ptr<ReplayStore> store, std::string key)
      : store_(std::move(store)), key_(std::move(key)) {}
  InFlightGuard(InFlightGuard&& other) noexcept
      : store_(std::move(other.store_)), key_(std::move(other.key_)), armed_(other.armed_) {
    other.armed_ = false;
  }
  InFlightGuard& operator=(InFlightGuard&&) = delete;
  InFlightGuard(const InFlightGuard&) = delete;
  InFlightGuard& operator=(const InFlightGuard&) = delete;
  ~InFlightGuard() {
    if (armed_ && store_) store_->remove(key_);
  }

  void disarm() { armed_ = false; }
  bool armed() const { return armed_; }

 private:
  std::shared_ptr<ReplayStore> store_;
  std::string key_;
  bool armed_{true};
};

class InboundSession {
 public:
  const AuthContext& auth_context() const { return request_.auth_context(); }

  // Signs, stores the response as completed and releases the reservation.
  // A second call fails with replay_in_flight.
  std::optional<SignedResponse> finish(std::uint16_t status, std::string body, Error* error = nullptr);

 private:
  friend class Responder;
  InboundSession(AuthenticatedRequest request, std::shared_ptr<ReplayStore> store, std::string key,
                 const Digest32& request_hash, std::uint64_t expires_at_ms)
      : request_(std::move(request)),
        store_(store),
        key_(key),
        request_hash_(request_hash),
        expires_at_ms_(expires_at_ms),
        guard_(std::move(store), std::move(key)) {}

  AuthenticatedRequest request_;
  std::shared_ptr<ReplayStore> store_;
  std::string key_;
  Digest32 request_hash_;
  std::uint64_t expires_at_ms_;
  InFlightGuard guard_;
};

struct ResponderRejection {
  enum class Kind { replay_conflict, in_flight };
  Kind kind{Kind::replay_conflict};
  AuthenticatedRequest request;

  const AuthContext& auth_context() const { return request.auth_context(); }
  ErrorCode code() const {
    return kind == Kind::replay_conflict ? ErrorCode::replay_conflict : ErrorCode::replay_in_flight;
  }
  std::optional<SignedResponse> sign_response(std::uint16_t status, const std::string& body,
                                              Error* error = nullptr) const {
    return request.sign_response(status, body, error);
  }
};

struct InvokeDecision {
  enum class Kind { proceed, replayed, rejected };
  Kind kind{Kind::proceed};
  std::optional<InboundSession> session;       // proceed
  std::optional<SignedResponse> response;      // replayed
  std::optional<ResponderRejection> rejection; // rejected
};

struct ResponderState {
  Policy policy;
  std::shared_ptr<const Clock> clock;
  std::string responder_id;
  std::uint64_t responder_kid{0};
  crypto::SigningKey key;
  std::shared_ptr<const InvokerKeyResolver> invoker_keys;
  std::shared_ptr<ReplayStore> replay_store;
};

class Responder {
 public:
  std::optional<InvokeDecision> authenticate_invoke(const std::string& method, const std::string& path,
                                                    const std::string& query, const ReceivedHeaders& headers,
                                                    const std::string& body, Error* error = nullptr) const;

  const std::string& responder_id() const { return state_->responder_id; }
  std::uint64_t responder_kid() const { return state_->responder_kid; }

 private:
  friend class SignedHttpEngine;
  explicit Responder(std::shared_ptr<const ResponderState> state) : state_(std::move(state)) {}

  std::optional<AuthenticatedRequest> verify_inbound(const DecodedSignature& decoded, const std::string& method,
                                                     const std::string& path, const std::string& query,
                                                     const std::string& body, std::uint64_t now_ms,
                                                     Error* error) const;

  std::shared_ptr<const ResponderState> state_;
};

// ---------------------------------------------------------------------------
// SignedHttpEngine
// ---------------------------------------------------------------------------
class SignedHttpEngine {
 public:
  explicit SignedHttpEngine(Policy policy = {}, std::shared_ptr<const Clock> clock = nullptr);

  const Policy& policy() const { return policy_; }
  std::uint64_t now_ms() const { return clock_->now_ms(); }

  Invoker invoker(std::string invoker_id, std::uint64_t kid, crypto::SigningKey key) const;

  Responder responder(std::string responder_id, std::uint64_t kid, crypto::SigningKey key,
                      std::shared_ptr<const InvokerKeyResolver> invoker_keys,
                      std::shared_ptr<ReplayStore> replay_store) const;

  // Allow-list resolver and a fresh InMemoryReplayStore.
  Responder responder_with_in_memory_replay(std::string responder_id, std::uint64_t kid, crypto::SigningKey key,
                                            AllowedLeaders allowed) const;

 private:
  Policy policy_;
  std::shared_ptr<const Clock> clock_;
};

}  // namespace nexus::signed_http
