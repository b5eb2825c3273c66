// verisure_cli.cpp
// ============================================================
// Command-line front end: one command per invocation, session
// persisted between runs in the credential file.
// ============================================================

#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <termios.h>
#include <unistd.h>

#include "alarm_aggregator.hpp"
#include "alarm_service.hpp"
#include "authenticator.hpp"
#include "command_policy.hpp"
#include "config.hpp"
#include "credential_store.hpp"
#include "errors.hpp"
#include "graphql_client.hpp"
#include "journal.hpp"
#include "session_manager.hpp"

static void usage(){
  std::cerr <<
    "Usage: verisure_cli [--config FILE] <command> [args]\n"
    "  login USER [PASSWORD]   log in (asks for the code when a second factor is needed)\n"
    "  status                  show the stored session\n"
    "  logout                  forget the session\n"
    "  installations           list installations\n"
    "  select NUMINST          choose the installation commands act on\n"
    "  alarms                  show the panel state and active zones\n"
    "  arm-away | arm-home | arm-night\n"
    "  disarm [CODE]\n";
}

static std::string read_line(const std::string& prompt){
  std::cout << prompt << std::flush;
  std::string s;
  if(!std::getline(std::cin, s))
    throw mvs::Error(mvs::ErrorKind::NOT_AUTHENTICATED, "input closed");
  return s;
}

static std::string read_secret(const std::string& prompt){
  termios old{};
  bool tty = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &old) == 0;
  if(tty){
    termios quiet = old;
    quiet.c_lflag &= ~ECHO;
    ::tcsetattr(STDIN_FILENO, TCSANOW, &quiet);
  }

  std::cout << prompt << std::flush;
  std::string s;
  bool ok = static_cast<bool>(std::getline(std::cin, s));

  if(tty){
    ::tcsetattr(STDIN_FILENO, TCSANOW, &old);
    std::cout << "\n";
  }
  if(!ok) throw mvs::Error(mvs::ErrorKind::NOT_AUTHENTICATED, "input closed");
  return s;
}

static bool ask_approval(const mvs::CommandRequest& req){
  std::string a = read_line("Send " + req.command + " to " + req.installation + "? [y/N] ");
  return a == "y" || a == "Y" || a == "yes";
}

static void print_panel(const mvs::PanelState& st){
  std::cout << "Panel: " << mvs::to_string(st.mode) << "\n";
  std::cout << "Active alarms: " << st.summary() << "\n";
  if(st.multiple){
    for(const auto& l : st.active_labels) std::cout << "  - " << l << "\n";
  }
}

static void interactive_otp(mvs::AlarmService& svc){
  auto phones = svc.otp_targets();
  std::cout << "A verification code is required. Available phones:\n";
  for(const auto& p : phones) std::cout << "  " << p.id << ": " << p.phone << "\n";

  int id = phones.front().id;
  if(phones.size() > 1){
    std::string s = read_line("Phone id: ");
    try{
      id = std::stoi(s);
    } catch(const std::exception&){
      throw mvs::Error(mvs::ErrorKind::OTP_NOT_SENT, "'" + s + "' is not a phone id");
    }
  }
  svc.request_otp(id);

  while(true){
    std::string code = read_line("Code: ");
    try{
      svc.verify_otp(code);
      return;
    } catch(const mvs::Error& e){
      if(e.kind() != mvs::ErrorKind::INVALID_OTP) throw;
      std::cerr << e.what() << "\n";
    }
  }
}

int main(int argc, char** argv){
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if(args.size() >= 2 && args[0] == "--config"){
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if(args.empty()){
    usage();
    return 2;
  }

  const std::string cmd = args[0];
  auto need = [&](size_t lo, size_t hi){ return args.size() - 1 >= lo && args.size() - 1 <= hi; };

  bool known =
    (cmd == "login" && need(1, 2)) || (cmd == "select" && need(1, 1)) || (cmd == "disarm" && need(0, 1)) ||
    ((cmd == "status" || cmd == "logout" || cmd == "installations" || cmd == "alarms" ||
      cmd == "arm-away" || cmd == "arm-home" || cmd == "arm-night") && need(0, 0));
  if(!known){
    usage();
    return 2;
  }

  try{
    mvs::Config cfg = config_path.empty() ? mvs::default_config() : mvs::load_config(config_path);

    mvs::ZoneMessageMap messages;
    if(!cfg.zone_message_map.empty()) messages = mvs::ZoneMessageMap::load_file(cfg.zone_message_map);

    mvs::CredentialStore store(cfg.session_file);
    if(!store.ensure_private_dir())
      std::cerr << "[CLI] state directory unavailable, session will not be kept\n";

    mvs::Journal journal;
    mvs::Journal* jp = nullptr;
    if(!cfg.journal_file.empty()){
      try{
        journal.start(cfg.journal_file);
        jp = &journal;
      } catch(const std::runtime_error& e){
        std::cerr << "[JOURNAL] disabled: " << e.what() << "\n";
      }
    }

    mvs::GraphqlSettings gs = mvs::graphql_settings(cfg);
    mvs::PollPolicy poll = mvs::poll_policy(cfg);
    auto gql = std::make_shared<mvs::HttpsGraphqlTransport>(gs);

    mvs::GraphqlAuthClient auth_transport(gql, gs);
    mvs::AuthPolicy ap;
    ap.max_otp_attempts = cfg.max_otp_attempts;
    ap.otp_window_ms = cfg.otp_window_ms;
    mvs::Authenticator auth(auth_transport, ap);

    std::mutex state_mu;
    mvs::ClientFactory factory = [gql, gs, messages, poll](const mvs::Session& s){
      return std::make_shared<mvs::GraphqlProviderClient>(gql, gs, s, messages, poll);
    };
    mvs::SessionManager sessions(state_mu, store, auth, factory, jp);
    mvs::AlarmAggregator agg(state_mu);

    mvs::CommandDecision decide = ask_approval;
    if(cfg.command_policy == "autonomous") decide = [](const mvs::CommandRequest&){ return true; };
    auto policy = mvs::make_policy(cfg.command_policy, decide, cfg.autonomous_max_actions);

    mvs::AlarmService svc(state_mu, sessions, auth, agg, *policy, jp);
    svc.set_panel_listener([](const mvs::PanelState& st){
      if(st.mode == mvs::PanelMode::ARMING || st.mode == mvs::PanelMode::DISARMING)
        std::cout << "[CLI] " << mvs::to_string(st.mode) << "...\n";
    });

    if(cmd == "login"){
      std::string pw = args.size() > 2 ? args[2] : read_secret("Password: ");
      if(!svc.login(args[1], pw)) interactive_otp(svc);
      std::cout << "Logged in as " << args[1] << "\n";
    }
    else if(cmd == "status"){
      try{
        sessions.ensure_session();
      } catch(const mvs::Error& e){
        if(e.kind() != mvs::ErrorKind::NOT_AUTHENTICATED) throw;
      }
      auto st = svc.status();
      std::cout << "Authenticated: " << (st.authenticated ? "yes" : "no") << "\n";
      if(st.authenticated){
        std::cout << "User: " << st.identity << "\n";
        std::cout << "Installation: " << (st.installation ? *st.installation : "(none)") << "\n";
      }
    }
    else if(cmd == "logout"){
      svc.logout();
      std::cout << "Logged out\n";
    }
    else if(cmd == "installations"){
      auto list = svc.installations();
      auto selected = svc.status().installation;
      for(const auto& i : list){
        bool sel = selected && *selected == i.numinst;
        std::cout << (sel ? "* " : "  ") << i.numinst << "  " << i.alias
                  << "  panel=" << i.panel << "  type=" << i.type << "\n";
      }
    }
    else if(cmd == "select"){
      svc.select_installation(args[1]);
      std::cout << "Installation " << args[1] << " selected\n";
    }
    else if(cmd == "alarms")    print_panel(svc.active_alarms());
    else if(cmd == "arm-away")  print_panel(svc.arm_away());
    else if(cmd == "arm-home")  print_panel(svc.arm_home());
    else if(cmd == "arm-night") print_panel(svc.arm_night());
    else if(cmd == "disarm")    print_panel(svc.disarm(args.size() > 1 ? args[1] : ""));

    journal.stop();
    return 0;

  } catch(const mvs::Error& e){
    std::cerr << "error: " << e.status() << ": " << e.what() << "\n";
    return 1;
  } catch(const std::exception& e){
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
