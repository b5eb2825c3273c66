#include "authenticator.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iostream>

namespace mvs {

const char* to_string(AuthState s) {
  switch(s){
    case AuthState::IDLE:                return "IDLE";
    case AuthState::CREDENTIALS_PENDING: return "CREDENTIALS_PENDING";
    case AuthState::OTP_PENDING:         return "OTP_PENDING";
    case AuthState::AUTHENTICATED:       return "AUTHENTICATED";
    case AuthState::FAILED:              return "FAILED";
  }
  return "UNKNOWN";
}

AuthFsm::AuthFsm() {
  transitions_.insert({AuthState::IDLE, AuthState::CREDENTIALS_PENDING});
  transitions_.insert({AuthState::CREDENTIALS_PENDING, AuthState::AUTHENTICATED});
  transitions_.insert({AuthState::CREDENTIALS_PENDING, AuthState::OTP_PENDING});
  transitions_.insert({AuthState::CREDENTIALS_PENDING, AuthState::FAILED});
  transitions_.insert({AuthState::OTP_PENDING, AuthState::OTP_PENDING});
  transitions_.insert({AuthState::OTP_PENDING, AuthState::AUTHENTICATED});
  transitions_.insert({AuthState::OTP_PENDING, AuthState::FAILED});
}

bool AuthFsm::switch_to(AuthState next, const std::string& event_label) {
  bool allowed = false;
  auto range = transitions_.equal_range(state_);
  for(auto it = range.first; it != range.second; ++it){
    if(it->second == next){ allowed = true; break; }
  }

  if(!allowed){
    std::cerr << "[AUTH] INVALID transition: " << to_string(state_) << " -> " << to_string(next)
              << " (event=" << event_label << ")\n";
    return false;
  }

  std::cout << "[AUTH] " << to_string(state_) << " -> " << to_string(next)
            << " (event=" << event_label << ")\n";
  state_ = next;
  return true;
}

// ============================================================

Authenticator::Authenticator(AuthTransport& transport, AuthPolicy policy)
  : transport_(transport), policy_(std::move(policy))
{
  if(policy_.max_otp_attempts < 1) policy_.max_otp_attempts = 1;
  if(!policy_.clock) policy_.clock = now_ms_utc;
}

LoginResult Authenticator::login(const std::string& identity, const std::string& secret) {
  AuthFsm fsm;
  fsm.switch_to(AuthState::CREDENTIALS_PENDING, "login");

  LoginReply reply;
  try{
    reply = transport_.login(identity, secret);
  } catch(const Error& e){
    if(e.kind() == ErrorKind::INVALID_CREDENTIALS)
      fsm.switch_to(AuthState::FAILED, "credentials_rejected");
    throw;
  }

  if(!reply.otp_required){
    fsm.switch_to(AuthState::AUTHENTICATED, "credentials_accepted");
    Session s;
    s.identity      = identity;
    s.secret        = secret;
    s.timestamp_ms  = policy_.clock();
    s.token         = reply.token;
    s.refresh_token = reply.refresh_token;
    return s;
  }

  if(reply.phones.empty() || reply.otp_hash.empty()){
    fsm.switch_to(AuthState::FAILED, "otp_data_missing");
    throw Error(ErrorKind::PROTOCOL, "second factor required but no phone targets were offered");
  }

  fsm.switch_to(AuthState::OTP_PENDING, "second_factor_required");

  OtpChallenge ch;
  ch.identity  = identity;
  ch.secret    = secret;
  ch.pre_token = reply.pre_token;
  ch.otp_hash  = reply.otp_hash;
  ch.targets   = std::move(reply.phones);
  ch.issued_ms = policy_.clock();
  ch.fsm       = fsm;
  return ch;
}

bool Authenticator::expired(OtpChallenge& ch) {
  if(policy_.clock() - ch.issued_ms <= policy_.otp_window_ms) return false;
  ch.fsm.switch_to(AuthState::FAILED, "otp_expired");
  return true;
}

void Authenticator::send_otp(OtpChallenge& ch, int phone_id) {
  if(ch.fsm.get() != AuthState::OTP_PENDING)
    throw Error(ErrorKind::NO_PENDING_CHALLENGE, "no second-factor challenge is pending");

  auto it = std::find_if(ch.targets.begin(), ch.targets.end(),
                         [phone_id](const PhoneTarget& p){ return p.id == phone_id; });
  if(it == ch.targets.end())
    throw Error(ErrorKind::OTP_NOT_SENT, "unknown phone id " + std::to_string(phone_id));

  transport_.send_otp(ch.identity, ch.pre_token, phone_id, ch.otp_hash);

  ch.chosen = phone_id;
  ch.issued_ms = policy_.clock();
  ch.fsm.switch_to(AuthState::OTP_PENDING, "otp_sent");
  std::cout << "[AUTH] code sent to phone id " << phone_id << "\n";
}

Session Authenticator::verify_otp(OtpChallenge& ch, const std::string& code) {
  if(ch.fsm.get() == AuthState::FAILED){
    if(ch.attempts >= policy_.max_otp_attempts)
      throw Error(ErrorKind::OTP_ATTEMPTS_EXHAUSTED, "too many wrong codes; log in again");
    throw Error(ErrorKind::OTP_EXPIRED, "the code window has closed; log in again");
  }
  if(ch.fsm.get() != AuthState::OTP_PENDING)
    throw Error(ErrorKind::NO_PENDING_CHALLENGE, "no second-factor challenge is pending");
  if(!ch.chosen)
    throw Error(ErrorKind::OTP_NOT_SENT, "choose a phone and send the code first");
  if(expired(ch))
    throw Error(ErrorKind::OTP_EXPIRED, "the code window has closed; log in again");

  LoginReply reply;
  try{
    reply = transport_.verify_otp(ch.identity, ch.secret, ch.pre_token, ch.otp_hash, code);
  } catch(const Error& e){
    if(e.kind() != ErrorKind::INVALID_OTP) throw;

    ch.attempts++;
    if(ch.attempts >= policy_.max_otp_attempts){
      ch.fsm.switch_to(AuthState::FAILED, "otp_attempts_exhausted");
      throw Error(ErrorKind::OTP_ATTEMPTS_EXHAUSTED, "too many wrong codes; log in again");
    }
    ch.fsm.switch_to(AuthState::OTP_PENDING, "otp_rejected");
    throw Error(ErrorKind::INVALID_OTP,
                "wrong code (" + std::to_string(policy_.max_otp_attempts - ch.attempts) + " attempts left)");
  }

  ch.fsm.switch_to(AuthState::AUTHENTICATED, "otp_verified");

  Session s;
  s.identity      = ch.identity;
  s.secret        = ch.secret;
  s.timestamp_ms  = policy_.clock();
  s.token         = reply.token;
  s.refresh_token = reply.refresh_token;
  return s;
}

bool Authenticator::probe(const Session& s) {
  if(s.token.empty()) return false;
  return transport_.probe(s);
}

} // namespace mvs
