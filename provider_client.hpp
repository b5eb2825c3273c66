#pragma once
// ============================================================
// Remote provider collaborator.
//
// AuthTransport   - unauthenticated side (login, OTP, token probe)
// ProviderClient  - bound to one Session (installations, zones,
//                   arm / disarm); dropped on logout
//
// All calls block on the network and throw mvs::Error:
//   TRANSPORT for network / HTTP failures, PROTOCOL for answers
//   that cannot be understood, the auth kinds where they apply.
// ============================================================

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "session.hpp"
#include "zone_state.hpp"

namespace mvs {

struct LoginReply {
  bool otp_required{false};

  // set when !otp_required
  std::string token;
  std::string refresh_token;

  // set when otp_required
  std::string pre_token;              // token of the half-authenticated login
  std::string otp_hash;
  std::vector<PhoneTarget> phones;
};

class AuthTransport {
public:
  virtual ~AuthTransport() = default;

  // throws Error(INVALID_CREDENTIALS)
  virtual LoginReply login(const std::string& identity, const std::string& secret) = 0;

  // deliver a code to phone_id
  virtual void send_otp(const std::string& identity, const std::string& pre_token,
                        int phone_id, const std::string& otp_hash) = 0;

  // throws Error(INVALID_OTP) on a wrong code; reply never has otp_required
  virtual LoginReply verify_otp(const std::string& identity, const std::string& secret,
                                const std::string& pre_token, const std::string& otp_hash,
                                const std::string& code) = 0;

  // cheap authenticated round trip; false = token rejected
  virtual bool probe(const Session& s) = 0;
};

enum class ArmMode { AWAY, HOME, NIGHT };

inline const char* to_string(ArmMode m) {
  switch(m){
    case ArmMode::AWAY:  return "arm_away";
    case ArmMode::HOME:  return "arm_home";
    case ArmMode::NIGHT: return "arm_night";
  }
  return "arm";
}

class ProviderClient {
public:
  virtual ~ProviderClient() = default;

  virtual std::vector<Installation> list_installations() = 0;

  // complete snapshot or throw
  virtual ZoneSnapshot fetch_zone_states(const std::string& installation) = 0;

  // return once the panel confirmed; throw Error(COMMAND_FAILED) otherwise
  virtual void arm(const std::string& installation, ArmMode mode) = 0;
  virtual void disarm(const std::string& installation, const std::string& code) = 0;
};

using ClientFactory = std::function<std::shared_ptr<ProviderClient>(const Session&)>;

} // namespace mvs
