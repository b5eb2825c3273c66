#pragma once
#include <cstdint>
#include <string>

namespace mvs {

struct Config {
  // local state
  std::string state_dir;        // ~/.my_verisure
  std::string session_file;     // <state_dir>/session.json
  std::string journal_file;     // <state_dir>/journal.db; "" disables the journal
  std::string zone_message_map; // optional JSON file for status-message classification

  // remote endpoint
  std::string api_host{"customers.securitasdirect.es"};
  std::string api_port{"443"};
  std::string api_target{"/owa-api/graphql"};
  bool verify_tls{true};
  std::string country{"ES"};
  std::string lang{"es"};

  // second factor
  int max_otp_attempts{3};
  int64_t otp_window_ms{300000};

  // command status polling
  int64_t poll_interval_ms{5000};
  int arm_poll_attempts{30};
  int status_poll_attempts{10};

  // direct | approve | autonomous
  std::string command_policy{"direct"};
  int autonomous_max_actions{1};
};

// defaults rooted at $HOME (or MY_VERISURE_HOME)
Config default_config();

// JSON file overlaid on default_config(), then environment overrides.
// throws std::runtime_error on an unreadable file or a mistyped key
Config load_config(const std::string& path);

// MY_VERISURE_HOME, MY_VERISURE_API_HOST, MY_VERISURE_INSECURE_TLS
void apply_env_overrides(Config& cfg);

} // namespace mvs
