#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "fake_provider.hpp"
#include "session_manager.hpp"

using namespace mvs;

class SessionManagerTest : public ::testing::Test {
protected:
  SessionManagerTest()
    : store(dir.file("state/session.json")), auth(transport) {}

  std::unique_ptr<SessionManager> make_manager() {
    return std::make_unique<SessionManager>(mu, store, auth, [this](const Session&){
      clients_made++;
      return std::make_shared<test::FakeProvider>();
    });
  }

  Session fresh_session() {
    Session s;
    s.identity = transport.identity;
    s.secret = transport.secret;
    s.token = transport.issue();
    s.refresh_token = "refresh-" + s.token;
    return s;
  }

  ErrorKind ensure_fails(SessionManager& m) {
    try{
      m.ensure_session();
    } catch(const Error& e){
      return e.kind();
    }
    ADD_FAILURE() << "ensure_session succeeded";
    return ErrorKind::PROTOCOL;
  }

  test::TempDir dir;
  std::mutex mu;
  CredentialStore store;
  test::FakeAuthTransport transport;
  Authenticator auth;
  int clients_made{0};
};

TEST_F(SessionManagerTest, NothingStoredIsNotAuthenticated) {
  auto m = make_manager();
  EXPECT_EQ(ensure_fails(*m), ErrorKind::NOT_AUTHENTICATED);
  EXPECT_FALSE(m->status().authenticated);
  EXPECT_EQ(transport.probe_calls.load(), 0);
}

TEST_F(SessionManagerTest, RestartRestoresWithoutLogin) {
  {
    auto first = make_manager();
    ASSERT_TRUE(first->complete_login(fresh_session()));
    ASSERT_TRUE(first->select_installation("1001"));
  }

  auto second = make_manager();
  Session s = second->ensure_session();
  EXPECT_EQ(s.identity, "12345678Z");
  ASSERT_TRUE(s.installation.has_value());
  EXPECT_EQ(*s.installation, "1001");
  EXPECT_EQ(transport.login_calls.load(), 0);
  EXPECT_EQ(transport.probe_calls.load(), 1);

  // already live: no second probe
  second->ensure_session();
  EXPECT_EQ(transport.probe_calls.load(), 1);
  EXPECT_TRUE(second->status().authenticated);
}

TEST_F(SessionManagerTest, LogoutForgetsEverything) {
  auto m = make_manager();
  ASSERT_TRUE(m->complete_login(fresh_session()));
  ASSERT_TRUE(store.load().has_value());

  m->logout();
  EXPECT_FALSE(store.load().has_value());
  EXPECT_FALSE(m->current().has_value());
  EXPECT_EQ(ensure_fails(*m), ErrorKind::NOT_AUTHENTICATED);

  auto restarted = make_manager();
  EXPECT_EQ(ensure_fails(*restarted), ErrorKind::NOT_AUTHENTICATED);
}

TEST_F(SessionManagerTest, RevokedTokenIsRefreshedTransparently) {
  Session old = fresh_session();
  old.installation = "1001";
  ASSERT_TRUE(store.save(old));
  transport.revoke_all();

  auto m = make_manager();
  Session s = m->ensure_session();
  EXPECT_EQ(transport.login_calls.load(), 1);
  EXPECT_NE(s.token, old.token);
  EXPECT_EQ(s.installation, old.installation);

  auto saved = store.load();
  ASSERT_TRUE(saved.has_value());
  EXPECT_EQ(saved->token, s.token);
  EXPECT_EQ(saved->installation, old.installation);
}

TEST_F(SessionManagerTest, RefreshNeedingSecondFactorRequiresLogin) {
  ASSERT_TRUE(store.save(fresh_session()));
  transport.revoke_all();
  transport.require_otp = true;

  auto m = make_manager();
  EXPECT_EQ(ensure_fails(*m), ErrorKind::NOT_AUTHENTICATED);
  EXPECT_EQ(transport.login_calls.load(), 1);
  EXPECT_TRUE(store.load().has_value());
}

TEST_F(SessionManagerTest, ChangedPasswordDiscardsStoredSession) {
  ASSERT_TRUE(store.save(fresh_session()));
  transport.revoke_all();
  transport.secret = "changed";

  auto m = make_manager();
  EXPECT_EQ(ensure_fails(*m), ErrorKind::NOT_AUTHENTICATED);
  EXPECT_FALSE(store.load().has_value());
}

TEST_F(SessionManagerTest, RejectedRestoreKeepsConcurrentLogin) {
  Session stale;
  stale.identity = transport.identity;
  stale.secret = "old";
  stale.token = "dead";
  ASSERT_TRUE(store.save(stale));

  auto m = make_manager();
  transport.hold();
  std::optional<Session> restored;
  std::thread restorer([&]{ restored = m->ensure_session(); });
  transport.wait_for_blocked_login();

  Session fresh = fresh_session();
  ASSERT_TRUE(m->complete_login(fresh));
  transport.release();
  restorer.join();

  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(restored->token, fresh.token);
  EXPECT_EQ(m->current()->token, fresh.token);
  auto saved = store.load();
  ASSERT_TRUE(saved.has_value());
  EXPECT_EQ(saved->token, fresh.token);

  auto restarted = make_manager();
  EXPECT_EQ(restarted->ensure_session().token, fresh.token);
}

TEST_F(SessionManagerTest, SelectNeedsSession) {
  auto m = make_manager();
  try{
    m->select_installation("1001");
    FAIL() << "expected no_active_session";
  } catch(const Error& e){
    EXPECT_EQ(e.kind(), ErrorKind::NO_ACTIVE_SESSION);
  }
}

TEST_F(SessionManagerTest, SelectIsPersisted) {
  auto m = make_manager();
  ASSERT_TRUE(m->complete_login(fresh_session()));
  ASSERT_TRUE(m->select_installation("2002"));

  EXPECT_EQ(m->status().installation, std::optional<std::string>("2002"));
  auto saved = store.load();
  ASSERT_TRUE(saved.has_value());
  EXPECT_EQ(saved->installation, std::optional<std::string>("2002"));
  EXPECT_EQ(*saved, *m->current());
}

TEST_F(SessionManagerTest, ConcurrentRestoreProbesOnce) {
  ASSERT_TRUE(store.save(fresh_session()));
  transport.probe_delay = std::chrono::milliseconds(100);

  auto m = make_manager();
  std::atomic<int> ok{0};
  std::vector<std::thread> threads;
  for(int i = 0; i < 6; i++){
    threads.emplace_back([&]{
      Session s = m->ensure_session();
      if(s.identity == "12345678Z") ok++;
    });
  }
  for(auto& t : threads) t.join();

  EXPECT_EQ(ok.load(), 6);
  EXPECT_EQ(transport.probe_calls.load(), 1);
}

TEST_F(SessionManagerTest, TransportErrorPassesThrough) {
  ASSERT_TRUE(store.save(fresh_session()));
  transport.probe_throws = true;

  auto m = make_manager();
  EXPECT_EQ(ensure_fails(*m), ErrorKind::TRANSPORT);
  EXPECT_TRUE(store.load().has_value());

  transport.probe_throws = false;
  EXPECT_NO_THROW(m->ensure_session());
}

TEST_F(SessionManagerTest, NewLoginReplacesSession) {
  auto m = make_manager();
  Session s = fresh_session();
  s.installation = "1001";
  ASSERT_TRUE(m->complete_login(s));

  Session other = fresh_session();
  ASSERT_TRUE(m->complete_login(other));
  EXPECT_EQ(m->current()->token, other.token);
  EXPECT_FALSE(m->current()->installation.has_value());
  EXPECT_EQ(store.load()->token, other.token);
}

TEST_F(SessionManagerTest, ClientIsBoundToTheLiveSession) {
  auto m = make_manager();
  EXPECT_THROW(m->client(), Error);
  EXPECT_EQ(clients_made, 0);

  ASSERT_TRUE(m->complete_login(fresh_session()));
  auto c1 = m->client();
  auto c2 = m->client();
  EXPECT_EQ(c1, c2);
  EXPECT_EQ(clients_made, 1);

  ASSERT_TRUE(m->complete_login(fresh_session()));
  auto c3 = m->client();
  EXPECT_NE(c1, c3);
  EXPECT_EQ(clients_made, 2);
}
