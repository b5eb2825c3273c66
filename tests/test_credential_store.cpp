#include <gtest/gtest.h>

#include <fstream>
#include <sys/stat.h>

#include "credential_store.hpp"
#include "fake_provider.hpp"

using namespace mvs;

static Session sample() {
  Session s;
  s.identity = "12345678Z";
  s.secret = "s3cret";
  s.installation = "1001";
  s.timestamp_ms = 1717171717000;
  s.token = "tok-1";
  s.refresh_token = "refresh-tok-1";
  return s;
}

static void write_file(const std::string& path, const std::string& body) {
  std::ofstream f(path);
  f << body;
}

TEST(CredentialStore, SaveThenLoadRoundTrips) {
  test::TempDir dir;
  CredentialStore store(dir.file("state/session.json"));

  Session s = sample();
  ASSERT_TRUE(store.save(s));
  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, s);
}

TEST(CredentialStore, NoInstallationRoundTrips) {
  test::TempDir dir;
  CredentialStore store(dir.file("session.json"));

  Session s = sample();
  s.installation.reset();
  ASSERT_TRUE(store.save(s));
  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_FALSE(loaded->installation.has_value());
  EXPECT_EQ(*loaded, s);
}

TEST(CredentialStore, PrivatePermissions) {
  test::TempDir dir;
  std::string state = dir.file("state");
  CredentialStore store(state + "/session.json");
  ASSERT_TRUE(store.save(sample()));

  struct stat st{};
  ASSERT_EQ(::stat(state.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0700u);
  ASSERT_EQ(::stat((state + "/session.json").c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST(CredentialStore, TightensLooseDirectory) {
  test::TempDir dir;
  std::string state = dir.file("state");
  ASSERT_EQ(::mkdir(state.c_str(), 0755), 0);

  CredentialStore store(state + "/session.json");
  ASSERT_TRUE(store.save(sample()));

  struct stat st{};
  ASSERT_EQ(::stat(state.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0700u);
}

TEST(CredentialStore, MissingFileIsAbsent) {
  test::TempDir dir;
  CredentialStore store(dir.file("nope/session.json"));
  EXPECT_FALSE(store.load().has_value());
}

TEST(CredentialStore, MalformedFileIsAbsent) {
  test::TempDir dir;
  std::string path = dir.file("session.json");
  CredentialStore store(path);

  const char* bodies[] = {
    "",
    "{not json",
    "[]",
    R"({"version":1,"secret":"x","timestamp":1})",
    R"({"version":1,"identity":"a","secret":"x","timestamp":"yesterday"})",
    R"({"version":1,"identity":"a","secret":"x","timestamp":1,"installation":42})",
    R"({"version":2,"identity":"a","secret":"x","timestamp":1})",
    R"({"identity":"a","secret":"x","timestamp":1})",
  };
  for(const char* b : bodies){
    write_file(path, b);
    EXPECT_FALSE(store.load().has_value()) << b;
  }
}

TEST(CredentialStore, DecodeAcceptsMinimalRecord) {
  auto s = CredentialStore::decode(R"({"version":1,"identity":"a","secret":"x","timestamp":5})");
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->identity, "a");
  EXPECT_EQ(s->timestamp_ms, 5);
  EXPECT_TRUE(s->token.empty());
  EXPECT_FALSE(s->installation.has_value());
}

TEST(CredentialStore, SaveReplacesWholeFile) {
  test::TempDir dir;
  CredentialStore store(dir.file("session.json"));

  Session a = sample();
  Session b = sample();
  b.identity = "87654321X";
  b.installation.reset();
  ASSERT_TRUE(store.save(a));
  ASSERT_TRUE(store.save(b));
  EXPECT_EQ(*store.load(), b);
}

TEST(CredentialStore, ClearIsIdempotent) {
  test::TempDir dir;
  CredentialStore store(dir.file("session.json"));
  ASSERT_TRUE(store.save(sample()));

  EXPECT_TRUE(store.clear());
  EXPECT_FALSE(store.load().has_value());
  EXPECT_TRUE(store.clear());
}

TEST(CredentialStore, SaveFailsWithoutThrowing) {
  test::TempDir dir;
  write_file(dir.file("blocker"), "x");
  CredentialStore store(dir.file("blocker/session.json"));
  EXPECT_FALSE(store.save(sample()));
  EXPECT_FALSE(store.load().has_value());
}
