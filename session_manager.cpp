#include "session_manager.hpp"
#include "errors.hpp"
#include "journal.hpp"

#include <iostream>
#include <variant>

namespace mvs {

SessionManager::SessionManager(std::mutex& mu, CredentialStore& store, Authenticator& auth,
                               ClientFactory factory, Journal* journal)
  : mu_(mu), store_(store), auth_(auth), factory_(std::move(factory)), journal_(journal) {}

// Runs without mu_ held: file read, probe round trip and (maybe) a relogin.
SessionManager::Restored SessionManager::restore() {
  Restored r;

  auto stored = store_.load();
  if(!stored){
    std::cout << "[SESSION] no stored session\n";
    return r;
  }

  if(auth_.probe(*stored)){
    std::cout << "[SESSION] stored session for " << stored->identity << " is valid\n";
    if(journal_) journal_->log_auth(stored->identity, "restore", true, "probe ok");
    r.session = std::move(stored);
    return r;
  }

  std::cout << "[SESSION] stored token rejected, logging in again as " << stored->identity << "\n";

  LoginResult res;
  try{
    res = auth_.login(stored->identity, stored->secret);
  } catch(const Error& e){
    if(e.kind() != ErrorKind::INVALID_CREDENTIALS) throw;
    std::cerr << "[SESSION] stored credentials rejected, discarding session\n";
    if(journal_) journal_->log_auth(stored->identity, "restore", false, "credentials rejected");
    r.discard = true;
    return r;
  }

  if(auto* s = std::get_if<Session>(&res)){
    s->installation = stored->installation;
    if(journal_) journal_->log_auth(s->identity, "restore", true, "relogin");
    r.session = std::move(*s);
    r.refreshed = true;
    return r;
  }

  std::cerr << "[SESSION] relogin needs a second factor; interactive login required\n";
  if(journal_) journal_->log_auth(stored->identity, "restore", false, "otp required");
  return r;
}

bool SessionManager::discard_stale(uint64_t gen) {
  std::scoped_lock plk(persist_mu_);
  {
    std::scoped_lock lk(mu_);
    if(gen != generation_) return true;  // a newer session owns the file now
  }
  return store_.clear();
}

bool SessionManager::persist(const Session& s, uint64_t gen) {
  std::scoped_lock plk(persist_mu_);
  {
    std::scoped_lock lk(mu_);
    if(gen != generation_) return true;  // superseded; the newer state is saved by its writer
  }
  return store_.save(s);
}

Session SessionManager::ensure_session() {
  std::unique_lock<std::mutex> lk(mu_);
  if(live_) return *live_;

  if(restoring_){
    const uint64_t round = restore_round_;
    cv_.wait(lk, [&]{ return restore_round_ != round; });
    if(live_) return *live_;
    throw Error(ErrorKind::NOT_AUTHENTICATED, "not logged in");
  }

  restoring_ = true;
  const uint64_t gen = generation_;
  lk.unlock();

  Restored r;
  try{
    r = restore();
  } catch(...){
    lk.lock();
    restoring_ = false;
    ++restore_round_;
    cv_.notify_all();
    throw;
  }

  lk.lock();
  restoring_ = false;
  ++restore_round_;

  if(r.session && gen == generation_){
    r.session->timestamp_ms = r.refreshed ? now_ms_utc() : r.session->timestamp_ms;
    live_ = r.session;
    client_.reset();
    const uint64_t adopted_gen = ++generation_;
    Session out = *live_;
    cv_.notify_all();
    lk.unlock();

    std::cout << "[SESSION] session adopted for " << out.identity << "\n";
    if(r.refreshed && !persist(out, adopted_gen))
      std::cerr << "[SESSION] refreshed session could not be saved\n";
    return out;
  }

  cv_.notify_all();
  if(live_) return *live_;   // a login completed while we were restoring
  lk.unlock();

  if(r.discard && !discard_stale(gen))
    std::cerr << "[SESSION] stale session file could not be removed\n";
  throw Error(ErrorKind::NOT_AUTHENTICATED, "not logged in");
}

bool SessionManager::complete_login(Session s) {
  s.timestamp_ms = now_ms_utc();

  uint64_t gen;
  {
    std::scoped_lock lk(mu_);
    live_ = s;
    client_.reset();
    gen = ++generation_;
  }
  cv_.notify_all();

  std::cout << "[SESSION] logged in as " << s.identity << "\n";
  if(journal_) journal_->log_auth(s.identity, "login", true, "");
  return persist(s, gen);
}

bool SessionManager::select_installation(const std::string& id) {
  Session snap;
  uint64_t gen;
  {
    std::scoped_lock lk(mu_);
    if(!live_) throw Error(ErrorKind::NO_ACTIVE_SESSION, "log in before selecting an installation");
    live_->installation = id;
    snap = *live_;
    gen = ++generation_;
  }

  std::cout << "[SESSION] installation " << id << " selected\n";
  return persist(snap, gen);
}

void SessionManager::logout() {
  std::string who;
  {
    std::scoped_lock lk(mu_);
    if(live_) who = live_->identity;
    live_.reset();
    client_.reset();
    ++generation_;
  }
  bool cleared;
  {
    std::scoped_lock plk(persist_mu_);
    cleared = store_.clear();
  }
  if(!cleared) std::cerr << "[SESSION] WARNING: session file could not be removed\n";

  std::cout << "[SESSION] logged out\n";
  if(journal_) journal_->log_auth(who, "logout", true, "");
}

std::optional<Session> SessionManager::current() const {
  std::scoped_lock lk(mu_);
  return live_;
}

SessionStatus SessionManager::status() const {
  std::scoped_lock lk(mu_);
  SessionStatus st;
  if(!live_) return st;
  st.authenticated = true;
  st.identity      = live_->identity;
  st.installation  = live_->installation;
  st.timestamp_ms  = live_->timestamp_ms;
  return st;
}

std::shared_ptr<ProviderClient> SessionManager::client() {
  ensure_session();

  std::scoped_lock lk(mu_);
  if(!live_) throw Error(ErrorKind::NOT_AUTHENTICATED, "not logged in");
  if(!client_) client_ = factory_(*live_);
  return client_;
}

} // namespace mvs
