#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mvs {

inline int64_t now_ms_utc() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// ============================================================
// Session: the one authenticated identity a process works with.
// Owned by SessionManager; everything else gets copies.
// ============================================================
struct Session {
  std::string identity;                    // user id (DNI/NIE)
  std::string secret;                      // password
  std::optional<std::string> installation; // selected numinst
  int64_t timestamp_ms{0};                 // adoption / refresh time (UTC ms)

  std::string token;                       // provider "hash"
  std::string refresh_token;

  bool operator==(const Session& o) const {
    return identity == o.identity && secret == o.secret &&
           installation == o.installation && timestamp_ms == o.timestamp_ms &&
           token == o.token && refresh_token == o.refresh_token;
  }
  bool operator!=(const Session& o) const { return !(*this == o); }
};

struct Installation {
  std::string numinst;
  std::string alias;
  std::string panel;
  std::string type;
};

// phone number the provider can deliver an OTP to
struct PhoneTarget {
  int id{0};
  std::string phone;
};

} // namespace mvs
