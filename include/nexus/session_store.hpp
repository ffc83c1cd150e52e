#pragma once

// nexus/session_store.hpp: Identity key and session store on top of the
// secret envelope.
//
// FILE FORMAT (JSON):
//   { "identity_key": <envelope of 32 raw bytes>,          (optional)
//     "sessions": { "<hex(session id)>": <envelope of session state> } }
//
// DESIGN:
//   Every mutation is load, modify, atomic write (temp file + rename). A
//   checked-out session is removed from the file before it is handed out, so
//   a second checkout cannot observe it until it is released.
//
// INVARIANT:
//   get_active_session() always picks the lowest session id. Checkouts are
//   serialised within the process by a mutex.

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "nexus/secret_store.hpp"
#include "nexus/types.hpp"

namespace nexus::sessions {

using SessionId = std::array<std::uint8_t, 32>;

// Opaque ratchet session: the id plus the serialised state bytes.
struct Session {
  SessionId id{};
  std::string state;

  bool operator==(const Session& other) const { return id == other.id && state == other.state; }
};

class CryptoStore {
 public:
  CryptoStore(std::string path, std::shared_ptr<const secrets::KeyProvider> provider);

  const std::string& path() const { return path_; }

  // Clears identity key and sessions.
  std::optional<Error> truncate();

  std::optional<Key32> identity_key(Error* error = nullptr) const;
  std::optional<Error> set_identity_key(const Key32& key);
  // Generates, persists and returns a fresh identity key.
  std::optional<Key32> generate_identity_key(Error* error = nullptr);

  // Removes the session with the lowest id and persists the removal.
  std::optional<Session> get_active_session(Error* error = nullptr);
  std::optional<Error> release_session(const Session& session);
  std::optional<Error> insert_session(const Session& session);
  std::optional<size_t> session_count(Error* error = nullptr) const;

 private:
  struct State;

  std::optional<State> load(Error* error) const;
  std::optional<Error> save(const State& state) const;
  std::optional<Error> insert_locked(const Session& session);

  std::string path_;
  std::shared_ptr<const secrets::KeyProvider> provider_;
  mutable std::mutex mu_;
};

// ---------------------------------------------------------------------------
// SessionLease: scoped checkout
// ---------------------------------------------------------------------------
// Re-inserts the session on release() or destruction, whichever comes first.
// A destructor-time release failure is reported through the event log only.
class SessionLease {
 public:
  static std::optional<SessionLease> acquire(CryptoStore& store, Error* error = nullptr);

  SessionLease(SessionLease&& other) noexcept;
  SessionLease& operator=(SessionLease&&) = delete;
  SessionLease(const SessionLease&) = delete;
  SessionLease& operator=(const SessionLease&) = delete;
  ~SessionLease();

  Session& session() { return *session_; }
  const Session& session() const { return *session_; }

  std::optional<Error> release();

 private:
  SessionLease(CryptoStore& store, Session session) : store_(&store), session_(std::move(session)) {}

  CryptoStore* store_;
  std::optional<Session> session_;
};

}  // namespace nexus::sessions
