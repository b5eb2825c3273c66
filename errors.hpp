#pragma once
#include <stdexcept>
#include <string>

namespace mvs {

enum class ErrorKind {
  INVALID_CREDENTIALS,
  INVALID_OTP,
  OTP_EXPIRED,
  OTP_ATTEMPTS_EXHAUSTED,
  OTP_NOT_SENT,
  NO_PENDING_CHALLENGE,
  NOT_AUTHENTICATED,
  NO_ACTIVE_SESSION,
  NO_INSTALLATION,
  TRANSITION_ALREADY_IN_FLIGHT,
  COMMAND_REJECTED,
  COMMAND_FAILED,
  TRANSPORT,
  PROTOCOL
};

// stable status token, independent of any UI language
inline const char* to_string(ErrorKind k) {
  switch(k){
    case ErrorKind::INVALID_CREDENTIALS:          return "invalid_credentials";
    case ErrorKind::INVALID_OTP:                  return "invalid_otp";
    case ErrorKind::OTP_EXPIRED:                  return "otp_expired";
    case ErrorKind::OTP_ATTEMPTS_EXHAUSTED:       return "otp_attempts_exhausted";
    case ErrorKind::OTP_NOT_SENT:                 return "otp_not_sent";
    case ErrorKind::NO_PENDING_CHALLENGE:         return "no_pending_challenge";
    case ErrorKind::NOT_AUTHENTICATED:            return "not_authenticated";
    case ErrorKind::NO_ACTIVE_SESSION:            return "no_active_session";
    case ErrorKind::NO_INSTALLATION:              return "no_installation";
    case ErrorKind::TRANSITION_ALREADY_IN_FLIGHT: return "transition_already_in_flight";
    case ErrorKind::COMMAND_REJECTED:             return "command_rejected";
    case ErrorKind::COMMAND_FAILED:               return "command_failed";
    case ErrorKind::TRANSPORT:                    return "transport_error";
    case ErrorKind::PROTOCOL:                     return "protocol_error";
  }
  return "unknown";
}

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const { return kind_; }
  const char* status() const { return to_string(kind_); }

private:
  ErrorKind kind_;
};

} // namespace mvs
