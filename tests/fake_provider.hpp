#pragma once
// In-memory stand-ins for the remote provider.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "provider_client.hpp"

namespace mvs::test {

inline std::string make_temp_dir() {
  char tmpl[] = "/tmp/mvs_test_XXXXXX";
  char* p = ::mkdtemp(tmpl);
  if(!p) throw std::runtime_error("mkdtemp failed");
  return p;
}

struct TempDir {
  std::string path{make_temp_dir()};
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  std::string file(const std::string& name) const { return path + "/" + name; }
};

class FakeAuthTransport : public AuthTransport {
public:
  std::string identity{"12345678Z"};
  std::string secret{"s3cret"};
  bool require_otp{false};
  std::string good_code{"123456"};
  std::vector<PhoneTarget> phones{{1, "***123"}, {2, "***456"}};
  std::string otp_hash{"otp-hash"};
  bool probe_throws{false};
  std::chrono::milliseconds probe_delay{0};

  std::atomic<int> login_calls{0};
  std::atomic<int> probe_calls{0};
  std::atomic<int> send_calls{0};
  std::atomic<int> verify_calls{0};
  int last_phone{-1};

  LoginReply login(const std::string& id, const std::string& pw) override {
    login_calls++;
    pass_gate();
    if(id != identity || pw != secret)
      throw Error(ErrorKind::INVALID_CREDENTIALS, "invalid user or password");

    LoginReply r;
    if(require_otp){
      r.otp_required = true;
      r.pre_token = "pre-token";
      r.otp_hash = otp_hash;
      r.phones = phones;
      return r;
    }
    r.token = issue();
    r.refresh_token = "refresh-" + r.token;
    return r;
  }

  void send_otp(const std::string&, const std::string&, int phone_id, const std::string&) override {
    send_calls++;
    last_phone = phone_id;
  }

  LoginReply verify_otp(const std::string&, const std::string&, const std::string&,
                        const std::string&, const std::string& code) override {
    verify_calls++;
    if(code != good_code) throw Error(ErrorKind::INVALID_OTP, "code rejected");
    LoginReply r;
    r.token = issue();
    r.refresh_token = "refresh-" + r.token;
    return r;
  }

  bool probe(const Session& s) override {
    if(probe_delay.count() > 0) std::this_thread::sleep_for(probe_delay);
    probe_calls++;
    if(probe_throws) throw Error(ErrorKind::TRANSPORT, "network unreachable");
    std::scoped_lock lk(mu_);
    return tokens_.count(s.token) > 0;
  }

  std::string issue() {
    std::scoped_lock lk(mu_);
    std::string t = "tok-" + std::to_string(++seq_);
    tokens_.insert(t);
    return t;
  }

  void revoke_all() {
    std::scoped_lock lk(mu_);
    tokens_.clear();
  }

  // logins block inside the provider until release()
  void hold() {
    std::scoped_lock lk(gate_mu_);
    open_ = false;
  }
  void release() {
    {
      std::scoped_lock lk(gate_mu_);
      open_ = true;
    }
    gate_cv_.notify_all();
  }
  void wait_for_blocked_login() {
    std::unique_lock<std::mutex> lk(gate_mu_);
    gate_cv_.wait(lk, [&]{ return waiting_ > 0; });
  }

private:
  void pass_gate() {
    std::unique_lock<std::mutex> lk(gate_mu_);
    waiting_++;
    gate_cv_.notify_all();
    gate_cv_.wait(lk, [&]{ return open_; });
    waiting_--;
  }

  std::mutex mu_;
  std::set<std::string> tokens_;
  int seq_{0};

  std::mutex gate_mu_;
  std::condition_variable gate_cv_;
  bool open_{true};
  int waiting_{0};
};

class FakeProvider : public ProviderClient {
public:
  std::vector<Installation> installs{{"1001", "Casa", "PNL1", "PLUS"}};
  bool fail_commands{false};
  bool crash_commands{false};   // fail with a plain runtime_error

  std::atomic<int> list_calls{0};
  std::atomic<int> fetch_calls{0};
  std::atomic<int> arm_calls{0};
  std::atomic<int> disarm_calls{0};
  std::string last_disarm_code;

  std::vector<Installation> list_installations() override {
    list_calls++;
    return installs;
  }

  ZoneSnapshot fetch_zone_states(const std::string&) override {
    fetch_calls++;
    std::scoped_lock lk(mu_);
    return zones_;
  }

  void arm(const std::string&, ArmMode mode) override {
    arm_calls++;
    pass_gate();
    if(crash_commands) throw std::runtime_error("provider client crashed");
    if(fail_commands) throw Error(ErrorKind::COMMAND_FAILED, "panel refused");
    std::scoped_lock lk(mu_);
    zones_ = ZoneSnapshot{};
    switch(mode){
      case ArmMode::AWAY:  zones_.set(ZoneKind::INTERNAL_TOTAL, true); break;
      case ArmMode::HOME:  zones_.set(ZoneKind::INTERNAL_DAY, true); break;
      case ArmMode::NIGHT: zones_.set(ZoneKind::INTERNAL_NIGHT, true); break;
    }
  }

  void disarm(const std::string&, const std::string& code) override {
    disarm_calls++;
    pass_gate();
    if(fail_commands) throw Error(ErrorKind::COMMAND_FAILED, "panel refused");
    std::scoped_lock lk(mu_);
    last_disarm_code = code;
    zones_ = ZoneSnapshot{};
  }

  void set_zones(const ZoneSnapshot& z) {
    std::scoped_lock lk(mu_);
    zones_ = z;
  }

  // commands block inside the provider until release()
  void hold() {
    std::scoped_lock lk(gate_mu_);
    open_ = false;
  }
  void release() {
    {
      std::scoped_lock lk(gate_mu_);
      open_ = true;
    }
    gate_cv_.notify_all();
  }
  void wait_for_blocked_command() {
    std::unique_lock<std::mutex> lk(gate_mu_);
    gate_cv_.wait(lk, [&]{ return waiting_ > 0; });
  }

private:
  void pass_gate() {
    std::unique_lock<std::mutex> lk(gate_mu_);
    waiting_++;
    gate_cv_.notify_all();
    gate_cv_.wait(lk, [&]{ return open_; });
    waiting_--;
  }

  std::mutex mu_;
  ZoneSnapshot zones_;

  std::mutex gate_mu_;
  std::condition_variable gate_cv_;
  bool open_{true};
  int waiting_{0};
};

} // namespace mvs::test
