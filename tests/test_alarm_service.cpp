#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <mutex>
#include <vector>

#include "alarm_service.hpp"
#include "errors.hpp"
#include "fake_provider.hpp"

using namespace mvs;

class AlarmServiceTest : public ::testing::Test {
protected:
  AlarmServiceTest()
    : store(dir.file("session.json")),
      auth(transport),
      provider(std::make_shared<test::FakeProvider>()),
      sessions(mu, store, auth, [this](const Session&){ return provider; }),
      agg(mu) {}

  std::unique_ptr<AlarmService> make_service(CommandPolicy& policy) {
    auto svc = std::make_unique<AlarmService>(mu, sessions, auth, agg, policy);
    svc->set_panel_listener([this](const PanelState& st){
      std::scoped_lock lk(seen_mu);
      seen.push_back(st.mode);
    });
    return svc;
  }

  std::unique_ptr<AlarmService> logged_in() {
    auto svc = make_service(direct);
    EXPECT_TRUE(svc->login(transport.identity, transport.secret));
    return svc;
  }

  std::vector<PanelMode> published() {
    std::scoped_lock lk(seen_mu);
    return seen;
  }

  template <typename F>
  ErrorKind kind_of(F&& f) {
    try{
      f();
    } catch(const Error& e){
      return e.kind();
    }
    ADD_FAILURE() << "no mvs::Error thrown";
    return ErrorKind::PROTOCOL;
  }

  test::TempDir dir;
  std::mutex mu;
  CredentialStore store;
  test::FakeAuthTransport transport;
  Authenticator auth;
  std::shared_ptr<test::FakeProvider> provider;
  SessionManager sessions;
  AlarmAggregator agg;
  DirectExecutePolicy direct;

  std::mutex seen_mu;
  std::vector<PanelMode> seen;
};

TEST_F(AlarmServiceTest, CommandsNeedLogin) {
  auto svc = make_service(direct);
  EXPECT_EQ(kind_of([&]{ svc->arm_away(); }), ErrorKind::NOT_AUTHENTICATED);
  EXPECT_EQ(kind_of([&]{ svc->active_alarms(); }), ErrorKind::NOT_AUTHENTICATED);
  EXPECT_EQ(kind_of([&]{ svc->select_installation("1001"); }), ErrorKind::NO_ACTIVE_SESSION);
  EXPECT_EQ(provider->arm_calls.load(), 0);
}

TEST_F(AlarmServiceTest, ArmHomePublishesTransitionThenResult) {
  auto svc = logged_in();

  PanelState st = svc->arm_home();
  EXPECT_EQ(st.mode, PanelMode::ARMED_HOME);
  EXPECT_EQ(st.summary(), "Interna Día");
  EXPECT_FALSE(agg.in_flight().has_value());

  auto modes = published();
  ASSERT_EQ(modes.size(), 2u);
  EXPECT_EQ(modes[0], PanelMode::ARMING);
  EXPECT_EQ(modes[1], PanelMode::ARMED_HOME);
}

TEST_F(AlarmServiceTest, SingleInstallationIsSelectedAutomatically) {
  auto svc = logged_in();
  svc->arm_away();

  EXPECT_EQ(svc->status().installation, std::optional<std::string>("1001"));
  auto saved = store.load();
  ASSERT_TRUE(saved.has_value());
  EXPECT_EQ(saved->installation, std::optional<std::string>("1001"));
}

TEST_F(AlarmServiceTest, SeveralInstallationsNeedSelection) {
  provider->installs.push_back({"1002", "Oficina", "PNL2", "PLUS"});
  auto svc = logged_in();

  EXPECT_EQ(kind_of([&]{ svc->arm_away(); }), ErrorKind::NO_INSTALLATION);
  EXPECT_EQ(provider->arm_calls.load(), 0);
  EXPECT_FALSE(agg.in_flight().has_value());

  svc->select_installation("1002");
  EXPECT_EQ(svc->arm_away().mode, PanelMode::ARMED_AWAY);
}

TEST_F(AlarmServiceTest, FailedCommandEndsTransition) {
  auto svc = logged_in();
  provider->fail_commands = true;

  ZoneSnapshot day;
  day.set(ZoneKind::INTERNAL_DAY, true);
  provider->set_zones(day);

  EXPECT_EQ(kind_of([&]{ svc->arm_night(); }), ErrorKind::COMMAND_FAILED);
  EXPECT_FALSE(agg.in_flight().has_value());

  // the panel is read again once the failure is known
  auto seen_modes = published();
  ASSERT_EQ(seen_modes.size(), 2u);
  EXPECT_EQ(seen_modes.front(), PanelMode::ARMING);
  EXPECT_EQ(seen_modes.back(), PanelMode::ARMED_HOME);
  EXPECT_EQ(provider->fetch_calls.load(), 1);

  provider->fail_commands = false;
  EXPECT_EQ(svc->arm_night().mode, PanelMode::ARMED_NIGHT);
}

TEST_F(AlarmServiceTest, ForeignFailureStillSettles) {
  auto svc = logged_in();
  provider->crash_commands = true;

  EXPECT_THROW(svc->arm_away(), std::runtime_error);
  EXPECT_FALSE(agg.in_flight().has_value());
  auto seen_modes = published();
  ASSERT_FALSE(seen_modes.empty());
  EXPECT_EQ(seen_modes.back(), PanelMode::DISARMED);

  provider->crash_commands = false;
  EXPECT_EQ(svc->arm_away().mode, PanelMode::ARMED_AWAY);
}

TEST_F(AlarmServiceTest, OneTransitionAtATime) {
  auto svc = logged_in();
  svc->active_alarms();
  int fetches = provider->fetch_calls;

  provider->hold();
  auto first = std::async(std::launch::async, [&]{ return svc->arm_away(); });
  provider->wait_for_blocked_command();

  EXPECT_EQ(kind_of([&]{ svc->disarm(); }), ErrorKind::TRANSITION_ALREADY_IN_FLIGHT);
  EXPECT_EQ(kind_of([&]{ svc->arm_home(); }), ErrorKind::TRANSITION_ALREADY_IN_FLIGHT);

  PanelState during = svc->active_alarms();
  EXPECT_EQ(during.mode, PanelMode::ARMING);
  EXPECT_EQ(provider->fetch_calls.load(), fetches);

  provider->release();
  EXPECT_EQ(first.get().mode, PanelMode::ARMED_AWAY);
  EXPECT_EQ(provider->arm_calls.load(), 1);
  EXPECT_EQ(provider->disarm_calls.load(), 0);
  EXPECT_FALSE(agg.in_flight().has_value());
}

TEST_F(AlarmServiceTest, DisarmPassesCode) {
  auto svc = logged_in();
  svc->arm_away();

  PanelState st = svc->disarm("DARM2");
  EXPECT_EQ(st.mode, PanelMode::DISARMED);
  EXPECT_EQ(provider->last_disarm_code, "DARM2");

  svc->disarm();
  EXPECT_EQ(provider->last_disarm_code, "");
}

TEST_F(AlarmServiceTest, ActiveAlarmsReportsEveryZone) {
  auto svc = logged_in();
  provider->set_zones(ZoneSnapshot::from_states({{ZoneKind::INTERNAL_DAY, true},
                                                 {ZoneKind::EXTERNAL, true}}));

  PanelState st = svc->active_alarms();
  EXPECT_EQ(st.mode, PanelMode::ARMED_HOME);
  EXPECT_EQ(st.active_count, 2u);
  EXPECT_TRUE(st.multiple);
  EXPECT_EQ(st.summary(), "Múltiples (2)");
}

TEST_F(AlarmServiceTest, RejectingPolicyStopsCommand) {
  ConditionalApprovePolicy never([](const CommandRequest&){ return false; });
  auto svc = make_service(never);
  ASSERT_TRUE(svc->login(transport.identity, transport.secret));

  EXPECT_EQ(kind_of([&]{ svc->arm_away(); }), ErrorKind::COMMAND_REJECTED);
  EXPECT_EQ(provider->arm_calls.load(), 0);
  EXPECT_FALSE(agg.in_flight().has_value());
  EXPECT_TRUE(published().empty());
}

TEST_F(AlarmServiceTest, ApproverSeesLastKnownState) {
  std::optional<CommandRequest> asked;
  ConditionalApprovePolicy approve([&](const CommandRequest& r){ asked = r; return true; });
  auto svc = make_service(approve);
  ASSERT_TRUE(svc->login(transport.identity, transport.secret));

  svc->active_alarms();
  svc->arm_night();

  ASSERT_TRUE(asked.has_value());
  EXPECT_EQ(asked->command, "arm_night");
  EXPECT_EQ(asked->installation, "1001");
  ASSERT_TRUE(asked->last_known.has_value());
  EXPECT_EQ(asked->last_known->mode, PanelMode::DISARMED);
}

TEST_F(AlarmServiceTest, SecondFactorLogin) {
  transport.require_otp = true;
  auto svc = make_service(direct);

  EXPECT_FALSE(svc->login(transport.identity, transport.secret));
  EXPECT_FALSE(svc->status().authenticated);
  ASSERT_EQ(svc->otp_targets().size(), 2u);

  svc->request_otp(1);
  EXPECT_EQ(kind_of([&]{ svc->verify_otp("000000"); }), ErrorKind::INVALID_OTP);
  svc->verify_otp("123456");

  EXPECT_TRUE(svc->status().authenticated);
  EXPECT_TRUE(store.load().has_value());
  EXPECT_EQ(kind_of([&]{ svc->otp_targets(); }), ErrorKind::NO_PENDING_CHALLENGE);
}

TEST_F(AlarmServiceTest, ExhaustedChallengeIsDropped) {
  transport.require_otp = true;
  auto svc = make_service(direct);
  EXPECT_FALSE(svc->login(transport.identity, transport.secret));
  svc->request_otp(2);

  EXPECT_EQ(kind_of([&]{ svc->verify_otp("1"); }), ErrorKind::INVALID_OTP);
  EXPECT_EQ(kind_of([&]{ svc->verify_otp("2"); }), ErrorKind::INVALID_OTP);
  EXPECT_EQ(kind_of([&]{ svc->verify_otp("3"); }), ErrorKind::OTP_ATTEMPTS_EXHAUSTED);
  EXPECT_EQ(kind_of([&]{ svc->verify_otp("123456"); }), ErrorKind::NO_PENDING_CHALLENGE);
  EXPECT_FALSE(svc->status().authenticated);
}

TEST_F(AlarmServiceTest, OtpCallsWithoutChallenge) {
  auto svc = make_service(direct);
  EXPECT_EQ(kind_of([&]{ svc->request_otp(1); }), ErrorKind::NO_PENDING_CHALLENGE);
  EXPECT_EQ(kind_of([&]{ svc->verify_otp("123456"); }), ErrorKind::NO_PENDING_CHALLENGE);
}

TEST_F(AlarmServiceTest, WrongPasswordLeavesNoSession) {
  auto svc = make_service(direct);
  EXPECT_EQ(kind_of([&]{ svc->login(transport.identity, "wrong"); }), ErrorKind::INVALID_CREDENTIALS);
  EXPECT_FALSE(svc->status().authenticated);
  EXPECT_FALSE(store.load().has_value());
}

TEST_F(AlarmServiceTest, LogoutEndsSession) {
  auto svc = logged_in();
  svc->arm_home();
  svc->logout();

  EXPECT_FALSE(svc->status().authenticated);
  EXPECT_FALSE(store.load().has_value());
  EXPECT_EQ(kind_of([&]{ svc->active_alarms(); }), ErrorKind::NOT_AUTHENTICATED);
}
