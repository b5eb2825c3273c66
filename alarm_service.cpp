#include "alarm_service.hpp"
#include "errors.hpp"
#include "journal.hpp"

#include <iostream>
#include <variant>

namespace mvs {

AlarmService::AlarmService(std::mutex& mu, SessionManager& sessions, Authenticator& auth,
                           AlarmAggregator& agg, CommandPolicy& policy, Journal* journal)
  : mu_(mu), sessions_(sessions), auth_(auth), agg_(agg), policy_(policy), journal_(journal) {}

void AlarmService::set_panel_listener(PanelListener l) {
  std::scoped_lock lk(listener_mu_);
  listener_ = std::move(l);
}

void AlarmService::publish(const PanelState& st) {
  PanelListener l;
  {
    std::scoped_lock lk(listener_mu_);
    l = listener_;
  }
  if(l) l(st);
}

// ============================================================
// authentication
// ============================================================

bool AlarmService::login(const std::string& identity, const std::string& secret) {
  std::scoped_lock clk(challenge_mu_);
  pending_.reset();

  LoginResult r;
  try{
    r = auth_.login(identity, secret);
  } catch(const Error& e){
    if(journal_) journal_->log_auth(identity, "login", false, e.status());
    throw;
  }

  if(auto* s = std::get_if<Session>(&r)){
    if(!sessions_.complete_login(*s))
      std::cerr << "[SESSION] WARNING: session is active but could not be saved\n";
    return true;
  }

  pending_ = std::get<OtpChallenge>(std::move(r));
  if(journal_) journal_->log_auth(identity, "login", true, "otp required");
  return false;
}

std::vector<PhoneTarget> AlarmService::otp_targets() const {
  std::scoped_lock clk(challenge_mu_);
  if(!pending_) throw Error(ErrorKind::NO_PENDING_CHALLENGE, "no second-factor challenge is pending");
  return pending_->targets;
}

void AlarmService::request_otp(int phone_id) {
  std::scoped_lock clk(challenge_mu_);
  if(!pending_) throw Error(ErrorKind::NO_PENDING_CHALLENGE, "no second-factor challenge is pending");

  try{
    auth_.send_otp(*pending_, phone_id);
  } catch(const Error& e){
    if(journal_) journal_->log_auth(pending_->identity, "otp_sent", false, e.status());
    throw;
  }
  if(journal_) journal_->log_auth(pending_->identity, "otp_sent", true, "phone " + std::to_string(phone_id));
}

void AlarmService::verify_otp(const std::string& code) {
  std::scoped_lock clk(challenge_mu_);
  if(!pending_) throw Error(ErrorKind::NO_PENDING_CHALLENGE, "no second-factor challenge is pending");

  const std::string identity = pending_->identity;
  Session s;
  try{
    s = auth_.verify_otp(*pending_, code);
  } catch(const Error& e){
    if(journal_) journal_->log_auth(identity, "otp_verify", false, e.status());
    if(e.kind() == ErrorKind::OTP_EXPIRED || e.kind() == ErrorKind::OTP_ATTEMPTS_EXHAUSTED)
      pending_.reset();
    throw;
  }

  pending_.reset();
  if(journal_) journal_->log_auth(identity, "otp_verify", true, "");
  if(!sessions_.complete_login(s))
    std::cerr << "[SESSION] WARNING: session is active but could not be saved\n";
}

SessionStatus AlarmService::status() const {
  return sessions_.status();
}

void AlarmService::logout() {
  {
    std::scoped_lock clk(challenge_mu_);
    pending_.reset();
  }
  sessions_.logout();
  {
    std::scoped_lock lk(mu_);
    last_zones_.clear();
  }
}

// ============================================================
// installations
// ============================================================

std::vector<Installation> AlarmService::installations() {
  return sessions_.client()->list_installations();
}

void AlarmService::select_installation(const std::string& id) {
  try{
    sessions_.ensure_session();
  } catch(const Error& e){
    if(e.kind() != ErrorKind::NOT_AUTHENTICATED) throw;
  }
  if(!sessions_.select_installation(id))
    std::cerr << "[SESSION] WARNING: installation selected but could not be saved\n";
}

std::string AlarmService::installation(ProviderClient& client) {
  Session s = sessions_.ensure_session();
  if(s.installation && !s.installation->empty()) return *s.installation;

  auto list = client.list_installations();
  if(list.size() != 1){
    throw Error(ErrorKind::NO_INSTALLATION,
                list.empty() ? std::string("no installation on this account")
                             : std::to_string(list.size()) + " installations, select one first");
  }

  std::cout << "[ALARM] using the only installation " << list.front().numinst << "\n";
  select_installation(list.front().numinst);
  return list.front().numinst;
}

// ============================================================
// panel
// ============================================================

std::optional<ZoneSnapshot> AlarmService::last_zones(const std::string& inst) const {
  std::scoped_lock lk(mu_);
  auto it = last_zones_.find(inst);
  if(it == last_zones_.end()) return std::nullopt;
  return it->second;
}

void AlarmService::remember(const std::string& inst, const ZoneSnapshot& z) {
  std::scoped_lock lk(mu_);
  last_zones_[inst] = z;
}

// Publishes the panel as it stands after a failed command: a fresh read when
// the provider answers, the last known zones otherwise.
void AlarmService::settle(ProviderClient& client, const std::string& inst,
                          const std::optional<ZoneSnapshot>& last) {
  ZoneSnapshot z = last ? *last : ZoneSnapshot{};
  try{
    z = client.fetch_zone_states(inst);
    remember(inst, z);
  } catch(const std::exception& e){
    std::cerr << "[ALARM] panel state unavailable after failure: " << e.what() << "\n";
  }

  PanelState st = agg_.resolve(z);
  if(journal_) journal_->log_panel(inst, st);
  publish(st);
}

PanelState AlarmService::run(TransitionKind kind, const char* name, const Command& cmd) {
  auto client = sessions_.client();
  std::string inst = installation(*client);

  auto last = last_zones(inst);

  CommandRequest req;
  req.installation = inst;
  req.command = name;
  if(last) req.last_known = resolve_panel(*last);

  if(!policy_.permit(req)){
    if(journal_) journal_->log_command(inst, name, false, to_string(ErrorKind::COMMAND_REJECTED));
    throw Error(ErrorKind::COMMAND_REJECTED, std::string(name) + " refused by the " + policy_.name() + " policy");
  }

  TransitionGuard guard(agg_, kind);
  publish(agg_.resolve(last ? *last : ZoneSnapshot{}));

  try{
    cmd(*client, inst);
  } catch(const std::exception& e){
    guard.end();
    auto* err = dynamic_cast<const Error*>(&e);
    std::string status = err ? err->status() : to_string(ErrorKind::COMMAND_FAILED);
    std::cerr << "[ALARM] " << name << " failed: " << status << ": " << e.what() << "\n";
    if(journal_) journal_->log_command(inst, name, false, status);
    settle(*client, inst, last);
    throw;
  }

  guard.end();
  if(journal_) journal_->log_command(inst, name, true, "");

  ZoneSnapshot z = client->fetch_zone_states(inst);
  remember(inst, z);

  PanelState st = agg_.resolve(z);
  std::cout << "[ALARM] " << name << " done, panel " << to_string(st.mode) << " (" << st.summary() << ")\n";
  if(journal_) journal_->log_panel(inst, st);
  publish(st);
  return st;
}

PanelState AlarmService::arm_away() {
  return run(TransitionKind::ARMING, to_string(ArmMode::AWAY),
             [](ProviderClient& c, const std::string& inst){ c.arm(inst, ArmMode::AWAY); });
}

PanelState AlarmService::arm_home() {
  return run(TransitionKind::ARMING, to_string(ArmMode::HOME),
             [](ProviderClient& c, const std::string& inst){ c.arm(inst, ArmMode::HOME); });
}

PanelState AlarmService::arm_night() {
  return run(TransitionKind::ARMING, to_string(ArmMode::NIGHT),
             [](ProviderClient& c, const std::string& inst){ c.arm(inst, ArmMode::NIGHT); });
}

PanelState AlarmService::disarm(const std::string& code) {
  return run(TransitionKind::DISARMING, "disarm",
             [&code](ProviderClient& c, const std::string& inst){ c.disarm(inst, code); });
}

PanelState AlarmService::active_alarms() {
  auto client = sessions_.client();
  std::string inst = installation(*client);

  if(agg_.in_flight()){
    auto last = last_zones(inst);
    return agg_.resolve(last ? *last : ZoneSnapshot{});
  }

  ZoneSnapshot z = client->fetch_zone_states(inst);
  remember(inst, z);

  PanelState st = agg_.resolve(z);
  if(journal_) journal_->log_panel(inst, st);
  publish(st);
  return st;
}

} // namespace mvs
