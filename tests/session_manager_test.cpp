#include "mailsync/quota/auth_attempt_limiter.hpp"
#include "mailsync/quota/quota_guard.hpp"
#include "mailsync/session/session_manager.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace mailsync;
using namespace mailsync::test;
using namespace std::chrono_literals;

class SessionManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    box_ = std::make_shared<FakeMailbox>();
    manager_ = std::make_unique<SessionManager>(
        io_.get_executor(), cfg_, fake_factory(box_), quota_, limiter_);
    manager_->set_sleep(sleep_.fn());
    manager_->set_clock(clock_.fn());
    manager_->set_mirror(&store_);
  }

  void TearDown() override {
    if (manager_) {
      run_coro(io_, manager_->shutdown(200ms));
    }
  }

  auto login(std::string_view who = "alice@example.com")
      -> Result<SessionInfo> {
    return run_coro(io_, manager_->authenticate(principal(who), kAppPassword));
  }

  boost::asio::io_context io_;
  SessionConfig cfg_ = fast_session_config();
  QuotaGuard quota_{generous_quota()};
  AuthAttemptLimiter limiter_{AuthLimiterConfig{}};
  std::shared_ptr<FakeMailbox> box_;
  RecordingSleep sleep_;
  ManualClock clock_;
  InMemoryStateStore store_;
  std::unique_ptr<SessionManager> manager_;
};

TEST_F(SessionManagerTest, AuthenticateOpensConnectedSession) {
  auto info = login();
  ASSERT_TRUE(info.has_value()) << info.error().message();
  EXPECT_EQ(info->state, SessionState::Connected);
  EXPECT_EQ(info->retry_count, 0);
  EXPECT_GT(info->owner_pid, 0);
  EXPECT_EQ(manager_->count_for(principal("alice@example.com")), 1);
  EXPECT_EQ(box_->connects, 1);
  EXPECT_EQ(box_->auths, 1);
  EXPECT_EQ(store_.session_record_count(), 1u);
  EXPECT_TRUE(sleep_.delays().empty());
}

TEST_F(SessionManagerTest, InvalidPrincipalMakesNoRemoteCall) {
  auto info = login("not-an-address");
  ASSERT_FALSE(info.has_value());
  EXPECT_EQ(info.error(), Error::ValidationFailed);
  EXPECT_EQ(box_->transports_made, 0);
  EXPECT_EQ(box_->remote_calls(), 0);
}

TEST_F(SessionManagerTest, InvalidSecretMakesNoRemoteCall) {
  auto info = run_coro(
      io_, manager_->authenticate(principal("alice@example.com"), "short"));
  ASSERT_FALSE(info.has_value());
  EXPECT_EQ(info.error(), Error::ValidationFailed);
  EXPECT_EQ(box_->remote_calls(), 0);
}

TEST_F(SessionManagerTest, SixthSessionEvictsLeastRecentlyActive) {
  std::vector<SessionId> ids;
  for (int i = 0; i < 5; ++i) {
    auto info = login();
    ASSERT_TRUE(info.has_value());
    ids.push_back(info->id);
    clock_.advance(1s);
  }
  EXPECT_EQ(manager_->count_for(principal("alice@example.com")), 5);

  auto sixth = login();
  ASSERT_TRUE(sixth.has_value());
  EXPECT_EQ(manager_->count_for(principal("alice@example.com")), 5);
  EXPECT_FALSE(manager_->find(ids.front()).has_value());
  for (std::size_t i = 1; i < ids.size(); ++i) {
    EXPECT_TRUE(manager_->find(ids[i]).has_value()) << i;
  }
  EXPECT_TRUE(manager_->find(sixth->id).has_value());
  EXPECT_EQ(box_->logouts, 1);
  EXPECT_EQ(store_.session_record_count(), 5u);
}

TEST_F(SessionManagerTest, OtherPrincipalsDoNotCountTowardsCap) {
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(login().has_value());
  }
  ASSERT_TRUE(login("bob@example.com").has_value());
  EXPECT_EQ(manager_->count_for(principal("alice@example.com")), 5);
  EXPECT_EQ(box_->logouts, 0);
  EXPECT_EQ(manager_->stats(clock_.now()).total, 6);
}

TEST_F(SessionManagerTest, FiveRejectedLoginsLockOutWithoutRemoteCall) {
  for (int i = 0; i < 5; ++i) {
    box_->auth_failures.push_back(Error::AuthenticationFailed);
  }
  for (int i = 0; i < 5; ++i) {
    auto info = login();
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error(), Error::AuthenticationFailed) << i;
  }
  // A rejected login is never retried.
  EXPECT_EQ(box_->auths, 5);
  EXPECT_TRUE(sleep_.delays().empty());

  const auto calls = box_->remote_calls();
  const auto made = box_->transports_made;
  auto locked = login();
  ASSERT_FALSE(locked.has_value());
  EXPECT_EQ(locked.error(), Error::LockedOut);
  EXPECT_EQ(box_->remote_calls(), calls);
  EXPECT_EQ(box_->transports_made, made);
  EXPECT_EQ(limiter_.lockout_remaining(principal("alice@example.com"),
                                       clock_.now()),
            120s);
}

TEST_F(SessionManagerTest, TransientConnectFailuresAreRetriedWithBackoff) {
  box_->connect_failures = {Error::ConnectionFailed, Error::Timeout};
  auto info = login();
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->retry_count, 2);
  EXPECT_EQ(box_->connects, 3);
  EXPECT_EQ(sleep_.delays(),
            (std::vector<std::chrono::milliseconds>{2000ms, 4000ms}));
}

TEST_F(SessionManagerTest, ConnectGivesUpAfterMaxRetries) {
  for (int i = 0; i < 10; ++i) {
    box_->connect_failures.push_back(Error::ConnectionFailed);
  }
  auto info = login();
  ASSERT_FALSE(info.has_value());
  EXPECT_EQ(info.error(), Error::ConnectionFailed);
  EXPECT_EQ(box_->connects, cfg_.max_retries);
  EXPECT_EQ(manager_->count_for(principal("alice@example.com")), 0);
  // Connection trouble is not a credential failure.
  EXPECT_EQ(limiter_.failure_count(principal("alice@example.com"),
                                   clock_.now()),
            0);
}

TEST_F(SessionManagerTest, ThirdKeepaliveFailureReconnectsWithBackoff) {
  auto info = login();
  ASSERT_TRUE(info.has_value());
  box_->noop_failures = {Error::ConnectionFailed, Error::ConnectionFailed,
                         Error::ConnectionFailed};

  EXPECT_FALSE(run_coro(io_, manager_->keepalive(info->id)).has_value());
  EXPECT_FALSE(run_coro(io_, manager_->keepalive(info->id)).has_value());
  EXPECT_EQ(manager_->find(info->id)->keepalive_failures, 2);
  EXPECT_EQ(box_->connects, 1);

  box_->connect_failures = {Error::ConnectionFailed, Error::ConnectionFailed};
  auto third = run_coro(io_, manager_->keepalive(info->id));
  ASSERT_TRUE(third.has_value()) << third.error().message();

  EXPECT_EQ(sleep_.delays(),
            (std::vector<std::chrono::milliseconds>{2000ms, 4000ms, 8000ms}));
  auto after = manager_->find(info->id);
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after->state, SessionState::Connected);
  EXPECT_EQ(after->keepalive_failures, 0);
  EXPECT_EQ(after->retry_count, 3);
}

TEST_F(SessionManagerTest, ReconnectScheduleIsCappedAndEndsInError) {
  auto info = login();
  ASSERT_TRUE(info.has_value());
  box_->noop_failures = {Error::Timeout, Error::Timeout, Error::Timeout};
  for (int i = 0; i < 10; ++i) {
    box_->connect_failures.push_back(Error::ConnectionFailed);
  }

  (void)run_coro(io_, manager_->keepalive(info->id));
  (void)run_coro(io_, manager_->keepalive(info->id));
  auto third = run_coro(io_, manager_->keepalive(info->id));
  ASSERT_FALSE(third.has_value());

  EXPECT_EQ(sleep_.delays(),
            (std::vector<std::chrono::milliseconds>{2000ms, 4000ms, 8000ms,
                                                    15000ms, 15000ms}));
  EXPECT_EQ(manager_->find(info->id)->state, SessionState::Error);
}

TEST_F(SessionManagerTest, ExhaustedSessionStaysInError) {
  box_->fill("INBOX", 3);
  auto info = login();
  ASSERT_TRUE(info.has_value());
  box_->noop_failures = {Error::Timeout, Error::Timeout, Error::Timeout};
  for (int i = 0; i < cfg_.max_retries; ++i) {
    box_->connect_failures.push_back(Error::ConnectionFailed);
  }
  for (int i = 0; i < 3; ++i) {
    (void)run_coro(io_, manager_->keepalive(info->id));
  }
  ASSERT_EQ(manager_->find(info->id)->state, SessionState::Error);

  sleep_.clear();
  const int connects = box_->connects;
  auto page = run_coro(io_, manager_->fetch_page(info->id, "INBOX", "", 10));
  ASSERT_FALSE(page.has_value());
  EXPECT_EQ(page.error(), Error::ConnectionFailed);
  EXPECT_EQ(box_->fetches, 0);

  auto ping = run_coro(io_, manager_->keepalive(info->id));
  ASSERT_FALSE(ping.has_value());
  EXPECT_EQ(box_->connects, connects);
  EXPECT_TRUE(sleep_.delays().empty());
  EXPECT_EQ(manager_->find(info->id)->state, SessionState::Error);
}

TEST_F(SessionManagerTest, KeepaliveSuccessResetsFailures) {
  auto info = login();
  ASSERT_TRUE(info.has_value());
  box_->noop_failures = {Error::ConnectionFailed};
  EXPECT_FALSE(run_coro(io_, manager_->keepalive(info->id)).has_value());
  EXPECT_TRUE(run_coro(io_, manager_->keepalive(info->id)).has_value());
  EXPECT_EQ(manager_->find(info->id)->keepalive_failures, 0);
  EXPECT_TRUE(run_coro(io_, manager_->is_alive(info->id)));
}

TEST_F(SessionManagerTest, DisconnectIsIdempotent) {
  auto info = login();
  ASSERT_TRUE(info.has_value());
  run_coro(io_, manager_->disconnect(info->id));
  run_coro(io_, manager_->disconnect(info->id));
  EXPECT_FALSE(manager_->find(info->id).has_value());
  EXPECT_EQ(box_->logouts, 1);
  EXPECT_EQ(store_.session_record_count(), 0u);

  auto gone = run_coro(io_, manager_->keepalive(info->id));
  ASSERT_FALSE(gone.has_value());
  EXPECT_EQ(gone.error(), Error::NotFound);
}

TEST_F(SessionManagerTest, SweepRemovesStaleAndProbesIdle) {
  auto old_session = login();
  ASSERT_TRUE(old_session.has_value());
  clock_.advance(std::chrono::seconds(cfg_.stale_after_sec - 30));
  auto idle = login("bob@example.com");
  ASSERT_TRUE(idle.has_value());
  clock_.advance(std::chrono::seconds(cfg_.keepalive_interval_sec + 1));

  auto removed = run_coro(io_, manager_->sweep_once(clock_.now()));
  EXPECT_EQ(removed, 1u);
  EXPECT_FALSE(manager_->find(old_session->id).has_value());
  EXPECT_TRUE(manager_->find(idle->id).has_value());
  EXPECT_EQ(box_->noops, 1);
}

TEST_F(SessionManagerTest, RoutedOperationReconnectsOnceAfterDrop) {
  box_->fill("INBOX", 5);
  auto info = login();
  ASSERT_TRUE(info.has_value());
  box_->fetch_failures = {Error::ConnectionFailed};

  auto page = run_coro(io_, manager_->fetch_page(info->id, "INBOX", "", 10));
  ASSERT_TRUE(page.has_value()) << page.error().message();
  EXPECT_EQ(page->items.size(), 5u);
  EXPECT_EQ(box_->connects, 2);
  EXPECT_EQ(manager_->find(info->id)->state, SessionState::Connected);
}

TEST_F(SessionManagerTest, RoutedOperationWaitsOutServerThrottling) {
  box_->fill("INBOX", 1);
  auto info = login();
  ASSERT_TRUE(info.has_value());
  box_->fetch_failures = {Error::RateLimited};

  auto page = run_coro(io_, manager_->fetch_page(info->id, "INBOX", "", 10));
  ASSERT_TRUE(page.has_value());
  ASSERT_EQ(sleep_.delays().size(), 1u);
  EXPECT_GE(sleep_.delays().front(), 180ms);
  EXPECT_LE(sleep_.delays().front(), 320ms);
  EXPECT_EQ(box_->connects, 1);
}

TEST_F(SessionManagerTest, RoutedOperationOnUnknownSession) {
  auto r = run_coro(io_, manager_->list_folders(SessionId{"missing"}));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::NotFound);
}

TEST_F(SessionManagerTest, SelectRecordsFolder) {
  box_->fill("Archive", 3);
  auto info = login();
  ASSERT_TRUE(info.has_value());
  auto status = run_coro(io_, manager_->select_folder(info->id, "Archive"));
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->exists, 3);
  EXPECT_EQ(manager_->find(info->id)->selected_folder, "Archive");
}

TEST_F(SessionManagerTest, ShutdownLogsOutEverySession) {
  ASSERT_TRUE(login().has_value());
  ASSERT_TRUE(login("bob@example.com").has_value());
  manager_->start();
  EXPECT_TRUE(manager_->is_running());

  run_coro(io_, manager_->shutdown(500ms));
  EXPECT_FALSE(manager_->is_running());
  EXPECT_TRUE(manager_->list().empty());
  EXPECT_EQ(box_->logouts, 2);
  EXPECT_EQ(store_.session_record_count(), 0u);
}

TEST_F(SessionManagerTest, ShutdownIsBoundedWhenLogoutHangs) {
  auto info = login();
  ASSERT_TRUE(info.has_value());
  box_->logout_delay = 5s;

  const auto started = std::chrono::steady_clock::now();
  run_coro(io_, manager_->shutdown(100ms));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_LT(elapsed, 1s);
  EXPECT_EQ(box_->logouts, 1);
  EXPECT_TRUE(manager_->list().empty());
  EXPECT_EQ(store_.session_record_count(), 0u);
}

TEST_F(SessionManagerTest, ShutdownCancelsReconnectInProgress) {
  auto info = login();
  ASSERT_TRUE(info.has_value());
  box_->noop_failures = {Error::Timeout, Error::Timeout, Error::Timeout};
  (void)run_coro(io_, manager_->keepalive(info->id));
  (void)run_coro(io_, manager_->keepalive(info->id));

  // The third failure starts the reconnect schedule with a real 2s wait.
  manager_->set_sleep(default_sleep());
  std::optional<Result<void>> outcome;
  boost::asio::co_spawn(io_, manager_->keepalive(info->id),
                        [&](std::exception_ptr ep, Result<void> r) {
                          if (!ep) {
                            outcome = r;
                          }
                        });
  io_.restart();
  io_.poll();
  ASSERT_FALSE(outcome.has_value());

  const auto started = std::chrono::steady_clock::now();
  run_coro(io_, manager_->shutdown(200ms));
  const auto elapsed = std::chrono::steady_clock::now() - started;
  io_.restart();
  io_.poll();

  EXPECT_LT(elapsed, 1s);
  ASSERT_TRUE(outcome.has_value());
  ASSERT_FALSE(outcome->has_value());
  EXPECT_EQ(outcome->error(), Error::Cancelled);
  EXPECT_EQ(box_->connects, 1);
  EXPECT_TRUE(manager_->list().empty());
  EXPECT_EQ(store_.session_record_count(), 0u);

  auto later = login("bob@example.com");
  ASSERT_FALSE(later.has_value());
  EXPECT_EQ(later.error(), Error::Cancelled);
}

TEST_F(SessionManagerTest, BackgroundLoopSweepsOnItsInterval) {
  cfg_.sweep_interval_sec = 1;
  manager_ = std::make_unique<SessionManager>(
      io_.get_executor(), cfg_, fake_factory(box_), quota_, limiter_);
  manager_->set_sleep(sleep_.fn());
  manager_->set_clock(clock_.fn());
  manager_->set_mirror(&store_);

  auto info = login();
  ASSERT_TRUE(info.has_value());
  clock_.advance(std::chrono::seconds(cfg_.stale_after_sec + 1));
  manager_->start();

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (manager_->find(info->id).has_value() &&
         std::chrono::steady_clock::now() < deadline) {
    io_.restart();
    io_.run_for(50ms);
  }
  EXPECT_FALSE(manager_->find(info->id).has_value());
  EXPECT_EQ(box_->logouts, 1);
  EXPECT_EQ(store_.session_record_count(), 0u);
  EXPECT_TRUE(manager_->is_running());
}
