#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace mvs {

using json = nlohmann::json;

static std::string home_dir() {
  const char* h = std::getenv("HOME");
  return (h && *h) ? std::string(h) : std::string(".");
}

static void set_state_dir(Config& cfg, const std::string& dir) {
  cfg.state_dir    = dir;
  cfg.session_file = dir + "/session.json";
  cfg.journal_file = dir + "/journal.db";
}

Config default_config() {
  Config cfg;
  set_state_dir(cfg, home_dir() + "/.my_verisure");
  apply_env_overrides(cfg);
  return cfg;
}

void apply_env_overrides(Config& cfg) {
  if(const char* v = std::getenv("MY_VERISURE_HOME"); v && *v){
    set_state_dir(cfg, v);
  }
  if(const char* v = std::getenv("MY_VERISURE_API_HOST"); v && *v){
    cfg.api_host = v;
  }
  if(const char* v = std::getenv("MY_VERISURE_INSECURE_TLS"); v && *v){
    std::string s(v);
    cfg.verify_tls = !(s == "1" || s == "true" || s == "yes");
  }
}

template <typename T>
static void take(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return;
  try{
    out = it->get<T>();
  } catch(const json::exception&){
    throw std::runtime_error(std::string("config key '") + key + "' has the wrong type");
  }
}

Config load_config(const std::string& path) {
  std::ifstream f(path);
  if(!f) throw std::runtime_error("cannot open config file: " + path);

  json j;
  try{
    f >> j;
  } catch(const json::parse_error& e){
    throw std::runtime_error("config file " + path + " is not valid JSON: " + e.what());
  }
  if(!j.is_object()) throw std::runtime_error("config file " + path + " must hold a JSON object");

  Config cfg;
  set_state_dir(cfg, home_dir() + "/.my_verisure");

  std::string state_dir;
  take(j, "state_dir", state_dir);
  if(!state_dir.empty()) set_state_dir(cfg, state_dir);

  take(j, "session_file", cfg.session_file);
  take(j, "journal_file", cfg.journal_file);
  take(j, "zone_message_map", cfg.zone_message_map);
  take(j, "api_host", cfg.api_host);
  take(j, "api_port", cfg.api_port);
  take(j, "api_target", cfg.api_target);
  take(j, "verify_tls", cfg.verify_tls);
  take(j, "country", cfg.country);
  take(j, "lang", cfg.lang);
  take(j, "max_otp_attempts", cfg.max_otp_attempts);
  take(j, "otp_window_ms", cfg.otp_window_ms);
  take(j, "poll_interval_ms", cfg.poll_interval_ms);
  take(j, "arm_poll_attempts", cfg.arm_poll_attempts);
  take(j, "status_poll_attempts", cfg.status_poll_attempts);
  take(j, "command_policy", cfg.command_policy);
  take(j, "autonomous_max_actions", cfg.autonomous_max_actions);

  if(cfg.max_otp_attempts < 1) throw std::runtime_error("max_otp_attempts must be >= 1");
  if(cfg.poll_interval_ms < 0) throw std::runtime_error("poll_interval_ms must be >= 0");

  apply_env_overrides(cfg);
  std::cout << "[CONFIG] loaded " << path << "\n";
  return cfg;
}

} // namespace mvs
