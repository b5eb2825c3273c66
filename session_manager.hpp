#pragma once
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "authenticator.hpp"
#include "credential_store.hpp"
#include "provider_client.hpp"
#include "session.hpp"

namespace mvs {

class Journal;

struct SessionStatus {
  bool authenticated{false};
  std::string identity;
  std::optional<std::string> installation;
  int64_t timestamp_ms{0};
};

// ============================================================
// SessionManager: sole owner of the live Session.
//
// Locking: `mu` is the process-wide state mutex (shared with the
// AlarmAggregator). It guards the in-memory session only; store
// and network I/O run with it released. A restore (load + probe +
// optional relogin) is single-flight: concurrent callers wait for
// the one in progress and see its outcome. `generation_` changes
// on every adopt / logout so a slow restore or save cannot
// resurrect a session that was replaced meanwhile.
// ============================================================
class SessionManager {
public:
  SessionManager(std::mutex& mu, CredentialStore& store, Authenticator& auth,
                 ClientFactory factory, Journal* journal = nullptr);

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  // live session, restored from disk if needed.
  // throws Error(NOT_AUTHENTICATED); transport errors pass through
  Session ensure_session();

  // adopt a freshly authenticated session; false if it could not be persisted
  bool complete_login(Session s);

  // throws Error(NO_ACTIVE_SESSION); false if it could not be persisted
  bool select_installation(const std::string& id);

  void logout();

  std::optional<Session> current() const;
  SessionStatus status() const;

  // provider client bound to the live session (created on first use)
  std::shared_ptr<ProviderClient> client();

private:
  struct Restored {
    std::optional<Session> session;
    bool refreshed{false};   // token replaced by a relogin; must be saved
    bool discard{false};     // stored credentials rejected; file should go
  };

  Restored restore();
  bool persist(const Session& s, uint64_t gen);
  bool discard_stale(uint64_t gen);

  std::mutex& mu_;
  std::condition_variable cv_;
  std::mutex persist_mu_;   // orders store writes; never taken while holding mu_

  CredentialStore& store_;
  Authenticator& auth_;
  ClientFactory factory_;
  Journal* journal_;

  std::optional<Session> live_;
  std::shared_ptr<ProviderClient> client_;
  uint64_t generation_{0};
  bool restoring_{false};
  uint64_t restore_round_{0};
};

} // namespace mvs
