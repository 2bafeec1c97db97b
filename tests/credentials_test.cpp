#include "mailsync/mailbox/credentials.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <sys/stat.h>

using namespace mailsync;
using namespace mailsync::test;

TEST(CredentialValidationTest, Principal) {
  EXPECT_FALSE(principal_problem("alice@example.com"));
  EXPECT_TRUE(principal_problem(""));
  EXPECT_TRUE(principal_problem("alice"));
  EXPECT_TRUE(principal_problem("alice@localhost"));
}

TEST(CredentialValidationTest, AppPassword) {
  EXPECT_FALSE(password_problem("abcdefghijklmnop"));
  EXPECT_FALSE(password_problem("abcd efgh ijkl mnop"));
  EXPECT_TRUE(password_problem("ABCD EFGH IJKL MNOP"));
  EXPECT_EQ(normalize_secret(AuthMode::Password, "abcd efgh ijkl mnop"),
            "abcdefghijklmnop");
}

TEST(CredentialValidationTest, RegularPassword) {
  EXPECT_FALSE(password_problem("Correct-Horse9"));
  EXPECT_TRUE(password_problem("short1A!"));
  EXPECT_TRUE(password_problem("alllowercaseletters"));
  EXPECT_TRUE(password_problem("Passsword-123"));
  EXPECT_TRUE(password_problem(std::string(65, 'a') + "A1"));
  EXPECT_TRUE(password_problem("Tab\tinside-Pass1"));
  EXPECT_EQ(normalize_secret(AuthMode::Password, "Correct-Horse9"),
            "Correct-Horse9");
}

TEST(CredentialValidationTest, OAuthToken) {
  EXPECT_FALSE(secret_problem(AuthMode::OAuth, "ya29.a0AfH6SM"));
  EXPECT_TRUE(secret_problem(AuthMode::OAuth, ""));
  EXPECT_TRUE(secret_problem(AuthMode::OAuth, "ya29 a0"));
}

class FileCredentialStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = make_temp_dir();
    ASSERT_FALSE(dir_.empty());
  }
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::string dir_;
};

TEST_F(FileCredentialStoreTest, PutGetRemove) {
  FileCredentialStore store(std::filesystem::path(dir_) / "nested" / "creds.json");
  const auto user = principal("alice@example.com");

  auto missing = store.get(user);
  ASSERT_TRUE(missing.has_value());
  EXPECT_FALSE(missing->has_value());

  ASSERT_TRUE(store.put(user, "abcdefghijklmnop").has_value());
  auto found = store.get(user);
  ASSERT_TRUE(found.has_value());
  ASSERT_TRUE(found->has_value());
  EXPECT_EQ(**found, "abcdefghijklmnop");

  struct stat st{};
  ASSERT_EQ(::stat(store.path().c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0600);

  auto removed = store.remove(user);
  ASSERT_TRUE(removed.has_value());
  EXPECT_TRUE(*removed);
  auto again = store.remove(user);
  ASSERT_TRUE(again.has_value());
  EXPECT_FALSE(*again);
}

TEST_F(FileCredentialStoreTest, KeepsOtherPrincipals) {
  FileCredentialStore store(std::filesystem::path(dir_) / "creds.json");
  ASSERT_TRUE(store.put(principal("a@example.com"), "first").has_value());
  ASSERT_TRUE(store.put(principal("b@example.com"), "second").has_value());
  ASSERT_TRUE(store.remove(principal("a@example.com")).has_value());

  auto b = store.get(principal("b@example.com"));
  ASSERT_TRUE(b.has_value());
  ASSERT_TRUE(b->has_value());
  EXPECT_EQ(**b, "second");
}
