#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "provider_client.hpp"
#include "session.hpp"

namespace mvs {

// =========================== login FSM ===========================
//   IDLE -> CREDENTIALS_PENDING          login()
//   CREDENTIALS_PENDING -> AUTHENTICATED  accepted, no 2FA
//   CREDENTIALS_PENDING -> OTP_PENDING    accepted, 2FA required
//   CREDENTIALS_PENDING -> FAILED         rejected
//   OTP_PENDING -> OTP_PENDING            wrong code / code (re)sent
//   OTP_PENDING -> AUTHENTICATED          correct code in window
//   OTP_PENDING -> FAILED                 expired / attempts exhausted
// ================================================================
enum class AuthState { IDLE = 0, CREDENTIALS_PENDING, OTP_PENDING, AUTHENTICATED, FAILED };

const char* to_string(AuthState s);

class AuthFsm {
public:
  AuthFsm();

  AuthState get() const { return state_; }

  // false (and logged) for a transition not in the matrix
  bool switch_to(AuthState next, const std::string& event_label);

private:
  AuthState state_{AuthState::IDLE};
  std::multimap<AuthState, AuthState> transitions_;
};

// Transient second-factor challenge. Owned by the caller between
// login() and verify_otp(); never persisted.
struct OtpChallenge {
  std::string identity;
  std::string secret;
  std::string pre_token;
  std::string otp_hash;
  std::vector<PhoneTarget> targets;
  std::optional<int> chosen;   // phone id the code was sent to
  int64_t issued_ms{0};        // start of the code window
  int attempts{0};             // wrong codes so far
  AuthFsm fsm;
};

using LoginResult = std::variant<Session, OtpChallenge>;

struct AuthPolicy {
  int max_otp_attempts{3};
  int64_t otp_window_ms{5 * 60 * 1000};
  std::function<int64_t()> clock{now_ms_utc};
};

class Authenticator {
public:
  explicit Authenticator(AuthTransport& transport, AuthPolicy policy = {});

  // Session when no second factor is needed, OtpChallenge otherwise.
  // throws Error(INVALID_CREDENTIALS)
  LoginResult login(const std::string& identity, const std::string& secret);

  // choose a target and have the code delivered; restarts the code window
  void send_otp(OtpChallenge& ch, int phone_id);

  // throws INVALID_OTP (retry allowed), OTP_ATTEMPTS_EXHAUSTED, OTP_EXPIRED,
  // OTP_NOT_SENT, NO_PENDING_CHALLENGE
  Session verify_otp(OtpChallenge& ch, const std::string& code);

  bool probe(const Session& s);

  const AuthPolicy& policy() const { return policy_; }

private:
  bool expired(OtpChallenge& ch);

  AuthTransport& transport_;
  AuthPolicy policy_;
};

} // namespace mvs
