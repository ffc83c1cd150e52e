#include "nexus/signed_http_engine.hpp"

#include <algorithm>
#include <limits>

#include "nexus/hash.hpp"
#include "nexus/observability.hpp"

namespace nexus::signed_http {
namespace {

constexpr std::size_t kNonceBytes = 16;

void emit(const char* action, const std::string& subject, bool ok, ErrorCode code, std::uint64_t duration_ns,
          std::size_t bytes = 0) {
  ToolkitEvent ev;
  ev.component = "signed_http";
  ev.action = action;
  ev.subject = subject;
  ev.ok = ok;
  ev.error = code;
  ev.duration_ns = duration_ns;
  ev.bytes = bytes;
  emit_toolkit_event(ev);
}

std::uint64_t saturating_add(std::uint64_t a, std::uint64_t b) {
  return a > std::numeric_limits<std::uint64_t>::max() - b ? std::numeric_limits<std::uint64_t>::max() : a + b;
}

// Parses a 32-byte lowercase or uppercase hex digest.
std::optional<Digest32> parse_hex_32(const std::string& hex) {
  auto bytes = from_hex(hex);
  if (!bytes || bytes->size() != 32) return std::nullopt;
  Digest32 out{};
  std::copy(bytes->begin(), bytes->end(), out.begin());
  return out;
}

std::optional<Error> check_body_hash(const std::string& claimed_hex, const std::string& body) {
  auto claimed = parse_hex_32(claimed_hex);
  if (!claimed) {
    return make_error(ErrorCode::sig_invalid_body_sha256_hex, "invalid body_sha256 hex: " + claimed_hex);
  }
  if (*claimed != sha256(body)) return make_error(ErrorCode::sig_body_hash_mismatch, "body hash mismatch");
  return std::nullopt;
}

std::string mismatch(const char* what, const std::string& claimed, const std::string& actual) {
  return std::string(what) + " mismatch (claimed " + claimed + ", actual " + actual + ")";
}

// Fails the operation: reports `err` and emits one failure event.
template <typename T>
std::optional<T> reject(const char* action, const std::string& subject, const Error& err, std::uint64_t ns,
                        Error* error) {
  emit(action, subject, false, err.code, ns);
  if (error) *error = err;
  return std::nullopt;
}

}  // namespace

// ---------------------------------------------------------------------------
// InMemoryReplayStore
// ---------------------------------------------------------------------------

ReplayDecision InMemoryReplayStore::begin_or_replay(const std::string& key, const Digest32& request_hash,
                                                    std::uint64_t expires_at_ms, std::uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  std::erase_if(entries_, [now_ms](const auto& kv) { return kv.second.expires_at_ms < now_ms; });

  auto it = entries_.find(key);
  if (it == entries_.end()) {
    entries_.emplace(key, Entry{request_hash, expires_at_ms, std::nullopt});
    return ReplayDecision{ReplayDecision::Kind::proceed, std::nullopt};
  }
  if (it->second.request_hash != request_hash) return ReplayDecision{ReplayDecision::Kind::conflict, std::nullopt};
  if (!it->second.response) return ReplayDecision{ReplayDecision::Kind::in_flight, std::nullopt};
  return ReplayDecision{ReplayDecision::Kind::return_response, it->second.response};
}

void InMemoryReplayStore::complete(const std::string& key, const Digest32& request_hash, std::uint64_t expires_at_ms,
                                   const SignedResponse& response) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_[key] = Entry{request_hash, expires_at_ms, response};
}

void InMemoryReplayStore::remove(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.erase(key);
}

std::size_t InMemoryReplayStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

// ---------------------------------------------------------------------------
// Key resolvers
// ---------------------------------------------------------------------------

std::optional<Key32> StaticResponderKey::responder_public_key(const std::string& responder_id,
                                                              std::uint64_t kid) const {
  if (responder_id != responder_id_ || kid != kid_) return std::nullopt;
  return public_key_;
}

// ---------------------------------------------------------------------------
// Invoker
// ---------------------------------------------------------------------------

std::optional<OutboundSession> Invoker::begin_invoke(const std::string& responder_id, const std::string& method,
                                                     const std::string& path, const std::string& query,
                                                     const std::string& body, Error* error) const {
  std::uint8_t bytes[kNonceBytes];
  if (!crypto::random_bytes(bytes, sizeof(bytes))) {
    return reject<OutboundSession>("begin_invoke", responder_id,
                                   make_error(ErrorCode::sig_invalid_signature, "nonce generation failed"), 0, error);
  }
  std::string nonce = base64url_encode(std::string_view(reinterpret_cast<const char*>(bytes), sizeof(bytes)));
  return begin_invoke_with_nonce(responder_id, method, path, query, body, std::move(nonce), error);
}

std::optional<OutboundSession> Invoker::begin_invoke_with_nonce(const std::string& responder_id,
                                                                const std::string& method, const std::string& path,
                                                                const std::string& query, const std::string& body,
                                                                std::string nonce, Error* error) const {
  std::uint64_t ns = 0;
  OutboundSession session;
  {
    ScopeTimer timer(ns);
    RequestClaims claims;
    claims.leader_id = invoker_id_;
    claims.leader_kid = invoker_kid_;
    claims.tool_id = responder_id;
    claims.iat_ms = clock_->now_ms();
    claims.exp_ms = saturating_add(claims.iat_ms, policy_.max_validity_ms);
    claims.nonce = nonce;
    claims.method = method;
    claims.path = path;
    claims.query = query;
    claims.body_sha256 = sha256_hex(body);

    Error err;
    auto headers = sign_request(claims, key_, &session.sig_input_, &err);
    if (!headers) return reject<OutboundSession>("begin_invoke", responder_id, err, 0, error);

    session.policy_ = policy_;
    session.clock_ = clock_;
    session.expected_responder_id_ = responder_id;
    session.nonce_ = std::move(nonce);
    session.sig_input_sha256_ = sha256(session.sig_input_);
    session.headers_ = std::move(*headers);
  }
  emit("begin_invoke", responder_id, true, ErrorCode::none, ns, body.size());
  return session;
}

std::optional<VerifiedResponse> OutboundSession::verify_response(std::uint16_t status, const ReceivedHeaders& headers,
                                                                 const std::string& body,
                                                                 const ResponderKeyResolver& resolver,
                                                                 Error* error) const {
  std::uint64_t ns = 0;
  Error err;
  std::optional<VerifiedResponse> out;
  {
    ScopeTimer timer(ns);
    out = check_response(status, headers, body, resolver, &err);
  }
  emit("verify_response", expected_responder_id_, out.has_value(), out ? ErrorCode::none : err.code, ns, body.size());
  if (!out && error) *error = err;
  return out;
}

std::optional<VerifiedResponse> OutboundSession::check_response(std::uint16_t status, const ReceivedHeaders& headers,
                                                                const std::string& body,
                                                                const ResponderKeyResolver& resolver,
                                                                Error* error) const {
  auto fail = [&](ErrorCode code, std::string message) -> std::optional<VerifiedResponse> {
    set_error(error, code, std::move(message));
    return std::nullopt;
  };

  auto decoded = decode_signature_headers(headers, error);
  if (!decoded) return std::nullopt;
  auto claims = decode_response_claims(decoded->sig_input, error);
  if (!claims) return std::nullopt;

  if (claims->status != status) {
    return fail(ErrorCode::sig_status_mismatch,
                mismatch("status", std::to_string(claims->status), std::to_string(status)));
  }

  const std::string who =
      "(tool_id=" + claims->tool_id + ", tool_kid=" + std::to_string(claims->tool_kid) + ")";
  auto tool_public_key = resolver.responder_public_key(claims->tool_id, claims->tool_kid);
  if (!tool_public_key) return fail(ErrorCode::sig_unknown_tool_key, "unknown tool key " + who);

  if (claims->tool_id != expected_responder_id_) {
    return fail(ErrorCode::sig_tool_id_mismatch, mismatch("tool_id", claims->tool_id, expected_responder_id_));
  }

  if (auto body_err = check_body_hash(claims->body_sha256, body)) {
    if (error) *error = *body_err;
    return std::nullopt;
  }

  if (auto window = validate_time_window(claims->iat_ms, claims->exp_ms, clock_->now_ms(), policy_)) {
    if (error) *error = *window;
    return std::nullopt;
  }

  auto claimed_req_hash = parse_hex_32(claims->req_sig_input_sha256);
  if (!claimed_req_hash) {
    return fail(ErrorCode::sig_invalid_req_sig_input_sha256_hex,
                "invalid req_sig_input_sha256 hex: " + claims->req_sig_input_sha256);
  }
  if (*claimed_req_hash != sig_input_sha256_) {
    return fail(ErrorCode::sig_request_binding_mismatch, "response is bound to another request");
  }

  if (claims->nonce != nonce_) return fail(ErrorCode::sig_nonce_mismatch, mismatch("nonce", claims->nonce, nonce_));

  if (!crypto::ed25519_public_key_valid(*tool_public_key)) {
    return fail(ErrorCode::sig_invalid_tool_public_key, "invalid tool public key " + who);
  }
  if (!crypto::ed25519_verify(*tool_public_key, message_to_sign(kDomainResponseV1, decoded->sig_input),
                              decoded->signature)) {
    return fail(ErrorCode::sig_invalid_signature, "invalid signature");
  }

  VerifiedResponse out;
  out.responder_id = claims->tool_id;
  out.responder_kid = claims->tool_kid;
  out.nonce = claims->nonce;
  out.status = claims->status;
  out.responder_public_key = *tool_public_key;
  out.response_sig_input_sha256 = sha256(decoded->sig_input);
  return out;
}

// ---------------------------------------------------------------------------
// Responder
// ---------------------------------------------------------------------------

std::optional<SignedResponse> AuthenticatedRequest::sign_response(std::uint16_t status, const std::string& body,
                                                                  Error* error) const {
  ResponseClaims claims;
  claims.tool_id = state_->responder_id;
  claims.tool_kid = state_->responder_kid;
  claims.iat_ms = ctx_.now_ms;
  claims.exp_ms = saturating_add(claims.iat_ms, state_->policy.max_validity_ms);
  claims.nonce = ctx_.nonce;
  claims.req_sig_input_sha256 = to_hex(ctx_.request_sig_input_sha256);
  claims.status = status;
  claims.body_sha256 = sha256_hex(body);

  auto headers = signed_http::sign_response(claims, state_->key, nullptr, error);
  if (!headers) return std::nullopt;
  return SignedResponse{status, body, std::move(*headers)};
}

std::optional<SignedResponse> InboundSession::finish(std::uint16_t status, std::string body, Error* error) {
  const std::string& subject = request_.auth_context().invoker_id;
  if (!guard_.armed()) {
    return reject<SignedResponse>("finish", subject,
                                  make_error(ErrorCode::replay_in_flight, "session already finished"), 0, error);
  }
  std::uint64_t ns = 0;
  std::optional<SignedResponse> resp;
  {
    ScopeTimer timer(ns);
    Error err;
    resp = request_.sign_response(status, body, &err);
    if (!resp) return reject<SignedResponse>("finish", subject, err, 0, error);
    store_->complete(key_, request_hash_, expires_at_ms_, *resp);
    guard_.disarm();
  }
  emit("finish", subject, true, ErrorCode::none, ns, resp->body.size());
  return resp;
}

std::optional<AuthenticatedRequest> Responder::verify_inbound(const DecodedSignature& decoded,
                                                              const std::string& method, const std::string& path,
                                                              const std::string& query, const std::string& body,
                                                              std::uint64_t now_ms, Error* error) const {
  auto claims = decode_request_claims(decoded.sig_input, error);
  if (!claims) return std::nullopt;

  auto fail = [&](ErrorCode code, std::string message) -> std::optional<AuthenticatedRequest> {
    set_error(error, code, std::move(message));
    return std::nullopt;
  };

  if (claims->tool_id != state_->responder_id) {
    return fail(ErrorCode::sig_tool_id_mismatch, mismatch("tool_id", claims->tool_id, state_->responder_id));
  }
  if (claims->method != method) return fail(ErrorCode::sig_method_mismatch, mismatch("method", claims->method, method));
  if (claims->path != path) return fail(ErrorCode::sig_path_mismatch, mismatch("path", claims->path, path));
  if (claims->query != query) return fail(ErrorCode::sig_query_mismatch, mismatch("query", claims->query, query));

  if (auto body_err = check_body_hash(claims->body_sha256, body)) {
    if (error) *error = *body_err;
    return std::nullopt;
  }

  if (auto window = validate_time_window(claims->iat_ms, claims->exp_ms, now_ms, state_->policy)) {
    if (error) *error = *window;
    return std::nullopt;
  }

  const std::string who =
      "(leader_id=" + claims->leader_id + ", leader_kid=" + std::to_string(claims->leader_kid) + ")";
  auto invoker_key = state_->invoker_keys->invoker_public_key(claims->leader_id, claims->leader_kid);
  if (!invoker_key) return fail(ErrorCode::sig_unknown_leader_key, "unknown leader key " + who);
  if (!crypto::ed25519_public_key_valid(*invoker_key)) {
    return fail(ErrorCode::sig_invalid_leader_public_key, "invalid leader public key " + who);
  }
  if (!crypto::ed25519_verify(*invoker_key, message_to_sign(kDomainRequestV1, decoded.sig_input),
                              decoded.signature)) {
    return fail(ErrorCode::sig_invalid_signature, "invalid signature");
  }

  AuthContext ctx;
  ctx.invoker_id = std::move(claims->leader_id);
  ctx.invoker_kid = claims->leader_kid;
  ctx.responder_id = std::move(claims->tool_id);
  ctx.iat_ms = claims->iat_ms;
  ctx.exp_ms = claims->exp_ms;
  ctx.nonce = std::move(claims->nonce);
  ctx.method = std::move(claims->method);
  ctx.path = std::move(claims->path);
  ctx.query = std::move(claims->query);
  ctx.invoker_public_key = *invoker_key;
  ctx.request_sig_input_sha256 = sha256(decoded.sig_input);
  ctx.now_ms = now_ms;
  return AuthenticatedRequest(state_, std::move(ctx));
}

std::optional<InvokeDecision> Responder::authenticate_invoke(const std::string& method, const std::string& path,
                                                             const std::string& query, const ReceivedHeaders& headers,
                                                             const std::string& body, Error* error) const {
  const std::uint64_t now_ms = state_->clock->now_ms();
  std::uint64_t ns = 0;
  Error err;
  std::optional<AuthenticatedRequest> request;
  {
    ScopeTimer timer(ns);
    auto decoded = decode_signature_headers(headers, &err);
    if (decoded) request = verify_inbound(*decoded, method, path, query, body, now_ms, &err);
  }
  if (!request) return reject<InvokeDecision>("authenticate", state_->responder_id, err, ns, error);

  const AuthContext& ctx = request->auth_context();
  const std::string key = ctx.invoker_id + ":" + ctx.nonce;
  const Digest32 request_hash = ctx.request_sig_input_sha256;
  const std::uint64_t expires_at_ms = ctx.exp_ms;
  const std::string subject = ctx.invoker_id;

  auto replay = state_->replay_store->begin_or_replay(key, request_hash, expires_at_ms, now_ms);
  InvokeDecision decision;
  switch (replay.kind) {
    case ReplayDecision::Kind::proceed:
      decision.kind = InvokeDecision::Kind::proceed;
      decision.session.emplace(InboundSession(std::move(*request), state_->replay_store, key, request_hash,
                                              expires_at_ms));
      emit("authenticate", subject, true, ErrorCode::none, ns, body.size());
      break;
    case ReplayDecision::Kind::return_response:
      decision.kind = InvokeDecision::Kind::replayed;
      decision.response = std::move(replay.response);
      emit("replay", subject, true, ErrorCode::none, ns);
      break;
    case ReplayDecision::Kind::conflict:
      decision.kind = InvokeDecision::Kind::rejected;
      decision.rejection.emplace(ResponderRejection{ResponderRejection::Kind::replay_conflict, std::move(*request)});
      emit("authenticate", subject, false, ErrorCode::replay_conflict, ns);
      break;
    case ReplayDecision::Kind::in_flight:
      decision.kind = InvokeDecision::Kind::rejected;
      decision.rejection.emplace(ResponderRejection{ResponderRejection::Kind::in_flight, std::move(*request)});
      emit("authenticate", subject, false, ErrorCode::replay_in_flight, ns);
      break;
  }
  return decision;
}

// ---------------------------------------------------------------------------
// SignedHttpEngine
// ---------------------------------------------------------------------------

SignedHttpEngine::SignedHttpEngine(Policy policy, std::shared_ptr<const Clock> clock)
    : policy_(policy), clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {}

Invoker SignedHttpEngine::invoker(std::string invoker_id, std::uint64_t kid, crypto::SigningKey key) const {
  return Invoker(policy_, clock_, std::move(invoker_id), kid, std::move(key));
}

Responder SignedHttpEngine::responder(std::string responder_id, std::uint64_t kid, crypto::SigningKey key,
                                      std::shared_ptr<const InvokerKeyResolver> invoker_keys,
                                      std::shared_ptr<ReplayStore> replay_store) const {
  auto state = std::make_shared<ResponderState>();
  state->policy = policy_;
  state->clock = clock_;
  state->responder_id = std::move(responder_id);
  state->responder_kid = kid;
  state->key = std::move(key);
  state->invoker_keys = std::move(invoker_keys);
  state->replay_store = std::move(replay_store);
  return Responder(std::move(state));
}

Responder SignedHttpEngine::responder_with_in_memory_replay(std::string responder_id, std::uint64_t kid,
                                                            crypto::SigningKey key, AllowedLeaders allowed) const {
  return responder(std::move(responder_id), kid, std::move(key),
                   std::make_shared<AllowedLeadersResolver>(std::move(allowed)),
                   std::make_shared<InMemoryReplayStore>());
}

}  // namespace nexus::signed_http
