#include "mailsync/quota/auth_attempt_limiter.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace mailsync;
using namespace mailsync::test;
using namespace std::chrono_literals;

class AuthAttemptLimiterTest : public ::testing::Test {
protected:
  AuthLimiterConfig cfg_{};
  AuthAttemptLimiter limiter_{cfg_};
  Principal user_ = principal("alice@example.com");
  util::TimePoint t0_ = util::Clock::now();
};

TEST_F(AuthAttemptLimiterTest, AllowsUntilThreshold) {
  for (int i = 0; i < 4; ++i) {
    limiter_.record_failure(user_, t0_);
    EXPECT_TRUE(limiter_.check(user_, t0_).has_value()) << i;
  }
  EXPECT_EQ(limiter_.failure_count(user_, t0_), 4);
}

TEST_F(AuthAttemptLimiterTest, FifthFailureLocksOutForTwoMinutes) {
  for (int i = 0; i < 5; ++i) {
    limiter_.record_failure(user_, t0_);
  }
  auto denied = limiter_.check(user_, t0_);
  ASSERT_FALSE(denied.has_value());
  EXPECT_EQ(denied.error(), Error::LockedOut);
  EXPECT_EQ(limiter_.lockout_remaining(user_, t0_), 120s);

  EXPECT_FALSE(limiter_.check(user_, t0_ + 119s).has_value());
  EXPECT_TRUE(limiter_.check(user_, t0_ + 121s).has_value());
}

TEST_F(AuthAttemptLimiterTest, LockoutGrowsAndIsCapped) {
  EXPECT_EQ(limiter_.lockout_duration(4), 0s);
  EXPECT_EQ(limiter_.lockout_duration(5), 2min);
  EXPECT_EQ(limiter_.lockout_duration(6), 4min);
  EXPECT_EQ(limiter_.lockout_duration(7), 8min);
  EXPECT_EQ(limiter_.lockout_duration(50), 64min);
}

TEST_F(AuthAttemptLimiterTest, FailuresOutsideWindowAreForgotten) {
  for (int i = 0; i < 4; ++i) {
    limiter_.record_failure(user_, t0_);
  }
  const auto later = t0_ + std::chrono::seconds(cfg_.window_sec) + 1s;
  limiter_.record_failure(user_, later);
  EXPECT_TRUE(limiter_.check(user_, later).has_value());
  EXPECT_EQ(limiter_.failure_count(user_, later), 1);
}

TEST_F(AuthAttemptLimiterTest, SuccessClearsHistory) {
  for (int i = 0; i < 5; ++i) {
    limiter_.record_failure(user_, t0_);
  }
  limiter_.record_success(user_);
  EXPECT_TRUE(limiter_.check(user_, t0_).has_value());
  EXPECT_EQ(limiter_.failure_count(user_, t0_), 0);
  EXPECT_EQ(limiter_.lockout_remaining(user_, t0_), 0s);
}

TEST_F(AuthAttemptLimiterTest, PrincipalsAreTrackedSeparately) {
  for (int i = 0; i < 5; ++i) {
    limiter_.record_failure(user_, t0_);
  }
  EXPECT_TRUE(limiter_.check(principal("bob@example.com"), t0_).has_value());
}
