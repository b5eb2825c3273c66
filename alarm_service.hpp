#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "alarm_aggregator.hpp"
#include "authenticator.hpp"
#include "command_policy.hpp"
#include "provider_client.hpp"
#include "session_manager.hpp"

namespace mvs {

class Journal;

// receives every published panel state (transient ones included)
using PanelListener = std::function<void(const PanelState&)>;

// ============================================================
// AlarmService: the command surface used by the CLI / host.
//
//   login -> [request_otp -> verify_otp] -> commands ... -> logout
//
// `mu` must be the same mutex given to SessionManager and
// AlarmAggregator. The service never holds it across a provider
// call; the pending OTP challenge has its own lock.
// ============================================================
class AlarmService {
public:
  AlarmService(std::mutex& mu, SessionManager& sessions, Authenticator& auth,
               AlarmAggregator& agg, CommandPolicy& policy, Journal* journal = nullptr);

  AlarmService(const AlarmService&) = delete;
  AlarmService& operator=(const AlarmService&) = delete;

  void set_panel_listener(PanelListener l);

  // true: authenticated and persisted. false: a second factor is pending,
  // see otp_targets() / request_otp() / verify_otp()
  bool login(const std::string& identity, const std::string& secret);

  // phones of the pending challenge; throws NO_PENDING_CHALLENGE
  std::vector<PhoneTarget> otp_targets() const;
  void request_otp(int phone_id);
  void verify_otp(const std::string& code);

  SessionStatus status() const;
  void logout();

  std::vector<Installation> installations();
  void select_installation(const std::string& id);

  PanelState arm_away();
  PanelState arm_home();
  PanelState arm_night();
  // empty code = the default disarm request
  PanelState disarm(const std::string& code = "");

  PanelState active_alarms();

private:
  using Command = std::function<void(ProviderClient&, const std::string&)>;

  // selected installation, picked automatically when there is exactly one
  std::string installation(ProviderClient& client);

  PanelState run(TransitionKind kind, const char* name, const Command& cmd);
  std::optional<ZoneSnapshot> last_zones(const std::string& inst) const;
  void remember(const std::string& inst, const ZoneSnapshot& z);
  void publish(const PanelState& st);
  void settle(ProviderClient& client, const std::string& inst,
              const std::optional<ZoneSnapshot>& last);

  std::mutex& mu_;
  SessionManager& sessions_;
  Authenticator& auth_;
  AlarmAggregator& agg_;
  CommandPolicy& policy_;
  Journal* journal_;

  mutable std::mutex challenge_mu_;
  std::optional<OtpChallenge> pending_;

  std::map<std::string, ZoneSnapshot> last_zones_;   // guarded by mu_

  std::mutex listener_mu_;
  PanelListener listener_;
};

} // namespace mvs
