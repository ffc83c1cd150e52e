#include "nexus/session_store.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <sstream>

#include "nexus/crypto.hpp"
#include "nexus/hash.hpp"
#include "nexus/jsonlite.hpp"
#include "nexus/observability.hpp"

namespace fs = std::filesystem;

namespace nexus::sessions {

struct CryptoStore::State {
  std::optional<std::string> identity_key;      // envelope
  std::map<std::string, std::string> sessions;  // hex id -> envelope
};

namespace {

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return (dir / (".tmp_" + std::to_string(rng()))).string();
}

bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) return false;
  }
  const std::string tmp = make_tmp_name(target.has_parent_path() ? target.parent_path() : fs::path("."));
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::string id_hex(const SessionId& id) {
  return to_hex(std::string_view(reinterpret_cast<const char*>(id.data()), id.size()));
}

void emit(const char* action, bool ok, ErrorCode code, const std::string& path) {
  ToolkitEvent ev;
  ev.component = "session_store";
  ev.action = action;
  ev.subject = path;
  ev.ok = ok;
  ev.error = code;
  emit_toolkit_event(ev);
}

}  // namespace

CryptoStore::CryptoStore(std::string path, std::shared_ptr<const secrets::KeyProvider> provider)
    : path_(std::move(path)), provider_(std::move(provider)) {
  if (!provider_) provider_ = std::make_shared<secrets::NoKeyProvider>();
}

// A missing file is an empty store.
std::optional<CryptoStore::State> CryptoStore::load(Error* error) const {
  State state;
  std::error_code ec;
  if (!fs::exists(path_, ec)) return state;

  std::ifstream ifs(path_, std::ios::binary);
  if (!ifs) {
    set_error(error, ErrorCode::io_error, "cannot read " + path_);
    return std::nullopt;
  }
  std::stringstream ss;
  ss << ifs.rdbuf();

  std::optional<jsonlite::JsonError> jerr;
  jsonlite::Object root = jsonlite::parse(ss.str(), &jerr);
  if (jerr) {
    set_error(error, ErrorCode::config_invalid, path_ + ": " + jerr->message);
    return std::nullopt;
  }
  if (const auto* ik = jsonlite::find(root, "identity_key")) {
    if (const auto* s = jsonlite::as_string(*ik)) state.identity_key = *s;
  }
  state.sessions = jsonlite::get_string_map(root, "sessions");
  return state;
}

std::optional<Error> CryptoStore::save(const State& state) const {
  jsonlite::Object root;
  if (state.identity_key) root["identity_key"] = jsonlite::Value{*state.identity_key};
  jsonlite::Object sessions;
  for (const auto& [id, envelope] : state.sessions) sessions[id] = jsonlite::Value{envelope};
  root["sessions"] = jsonlite::Value{std::move(sessions)};
  if (!atomic_write(path_, jsonlite::to_json(root) + "\n")) {
    return make_error(ErrorCode::io_error, "cannot write " + path_);
  }
  return std::nullopt;
}

std::optional<Error> CryptoStore::truncate() {
  std::lock_guard<std::mutex> lk(mu_);
  auto err = save(State{});
  emit("truncate", !err, err ? err->code : ErrorCode::none, path_);
  return err;
}

std::optional<Key32> CryptoStore::identity_key(Error* error) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto state = load(error);
  if (!state) return std::nullopt;
  if (!state->identity_key) {
    set_error(error, ErrorCode::session_unavailable, "No identity key found");
    return std::nullopt;
  }
  auto secret = secrets::BytesSecret::deserialize(*state->identity_key, *provider_, error);
  if (!secret) return std::nullopt;
  const std::string& raw = secret->value();
  if (raw.size() != Key32{}.size()) {
    set_error(error, ErrorCode::secret_codec, "identity key must be 32 bytes");
    return std::nullopt;
  }
  Key32 out{};
  std::copy(raw.begin(), raw.end(), out.begin());
  crypto::secure_zero(secret->value().data(), secret->value().size());
  return out;
}

std::optional<Error> CryptoStore::set_identity_key(const Key32& key) {
  std::lock_guard<std::mutex> lk(mu_);
  Error err;
  auto state = load(&err);
  if (!state) state = State{};  // unreadable store is replaced

  secrets::BytesSecret secret(std::string(reinterpret_cast<const char*>(key.data()), key.size()));
  auto envelope = secret.serialize(*provider_, &err);
  crypto::secure_zero(secret.value().data(), secret.value().size());
  if (!envelope) return err;
  state->identity_key = std::move(*envelope);
  return save(*state);
}

std::optional<Key32> CryptoStore::generate_identity_key(Error* error) {
  Key32 key{};
  if (!crypto::random_bytes(key.data(), key.size())) {
    set_error(error, ErrorCode::secret_crypto, "cryptography failure: identity key generation");
    return std::nullopt;
  }
  if (auto err = set_identity_key(key)) {
    crypto::secure_zero(key.data(), key.size());
    set_error(error, err->code, err->message);
    return std::nullopt;
  }
  return key;
}

std::optional<Session> CryptoStore::get_active_session(Error* error) {
  std::lock_guard<std::mutex> lk(mu_);
  Error load_err;
  auto state = load(&load_err);
  if (!state) state = State{};

  if (state->sessions.empty()) {
    emit("checkout", false, ErrorCode::session_unavailable, path_);
    set_error(error, ErrorCode::session_unavailable, "No active sessions found");
    return std::nullopt;
  }
  auto it = state->sessions.begin();
  auto id_bytes = from_hex(it->first);
  if (!id_bytes || id_bytes->size() != SessionId{}.size()) {
    set_error(error, ErrorCode::config_invalid, "malformed session id: " + it->first);
    return std::nullopt;
  }
  auto secret = secrets::BytesSecret::deserialize(it->second, *provider_, error);
  if (!secret) return std::nullopt;

  Session session;
  std::copy(id_bytes->begin(), id_bytes->end(), session.id.begin());
  session.state = std::move(*secret).into_inner();

  state->sessions.erase(it);
  if (auto err = save(*state)) {
    set_error(error, err->code, err->message);
    return std::nullopt;
  }
  emit("checkout", true, ErrorCode::none, path_);
  return session;
}

std::optional<Error> CryptoStore::insert_locked(const Session& session) {
  Error err;
  auto state = load(&err);
  if (!state) state = State{};

  secrets::BytesSecret secret(session.state);
  auto envelope = secret.serialize(*provider_, &err);
  if (!envelope) return err;
  state->sessions[id_hex(session.id)] = std::move(*envelope);
  return save(*state);
}

std::optional<Error> CryptoStore::insert_session(const Session& session) {
  std::lock_guard<std::mutex> lk(mu_);
  return insert_locked(session);
}

std::optional<Error> CryptoStore::release_session(const Session& session) {
  std::lock_guard<std::mutex> lk(mu_);
  auto err = insert_locked(session);
  emit("release", !err, err ? err->code : ErrorCode::none, path_);
  return err;
}

std::optional<size_t> CryptoStore::session_count(Error* error) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto state = load(error);
  if (!state) return std::nullopt;
  return state->sessions.size();
}

// ---------------------------------------------------------------------------
// SessionLease
// ---------------------------------------------------------------------------

std::optional<SessionLease> SessionLease::acquire(CryptoStore& store, Error* error) {
  auto session = store.get_active_session(error);
  if (!session) return std::nullopt;
  return SessionLease(store, std::move(*session));
}

SessionLease::SessionLease(SessionLease&& other) noexcept
    : store_(other.store_), session_(std::move(other.session_)) {
  other.session_.reset();
}

std::optional<Error> SessionLease::release() {
  if (!session_) return std::nullopt;
  auto err = store_->release_session(*session_);
  if (!err) session_.reset();
  return err;
}

SessionLease::~SessionLease() {
  if (!session_) return;
  if (auto err = release()) emit("lease_drop", false, err->code, store_->path());
}

}  // namespace nexus::sessions
