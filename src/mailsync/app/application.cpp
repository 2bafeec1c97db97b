#include "mailsync/app/application.hpp"

#include "mailsync/classify/classifier.hpp"
#include "mailsync/config/config.hpp"
#include "mailsync/mailbox/credentials.hpp"
#include "mailsync/mailbox/transport.hpp"
#include "mailsync/quota/auth_attempt_limiter.hpp"
#include "mailsync/quota/quota_guard.hpp"
#include "mailsync/session/session_manager.hpp"
#include "mailsync/storage/mysql_state_store.hpp"
#include "mailsync/sync/batch_coordinator.hpp"
#include "mailsync/sync/reconciler.hpp"
#include "mailsync/util/redact.hpp"

#include <csignal>
#include <cstdlib>

namespace mailsync {

Application::Application(SystemConfig config)
    : config_(std::move(config)), signals_(io_, SIGINT, SIGTERM) {
  store_ = std::make_unique<storage::MySQLStateStore>(io_.get_executor(),
                                                      config_.database);
  quota_ = std::make_unique<QuotaGuard>(config_.quota);
  limiter_ = std::make_unique<AuthAttemptLimiter>(config_.auth_limiter);
  sessions_ = std::make_unique<SessionManager>(
      io_.get_executor(), config_.session,
      make_transport_factory(io_.get_executor(), config_.mailbox), *quota_,
      *limiter_);
  sessions_->set_mirror(store_.get());
  classifier_ = create_keyword_classifier();
  batch_ = std::make_unique<BatchCoordinator>(*store_, *sessions_, *classifier_,
                                              *quota_, config_.batch,
                                              config_.cache);
  reconciler_ = std::make_unique<Reconciler>(*store_, *sessions_);
  credentials_ = std::make_unique<FileCredentialStore>(
      expand_home(config_.mailbox.credentials_file));
  arm_signals();
}

Application::~Application() { close(); }

auto Application::arm_signals() -> void {
  signals_.async_wait([this](const boost::system::error_code &ec, int signo) {
    if (ec) {
      return;
    }
    interrupted_.store(true, std::memory_order_release);
    log::warn("Received signal {}, stopping at the next page boundary", signo);
    batch_->cancel();
    arm_signals();
  });
}

auto Application::run_void(task<void> op) noexcept -> void {
  try {
    auto fut =
        boost::asio::co_spawn(io_, std::move(op), boost::asio::use_future);
    while (fut.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      if (io_.run_one() == 0) {
        io_.restart();
      }
    }
    fut.get();
  } catch (const std::exception &e) {
    log::error("Shutdown step failed: {}", e.what());
  }
}

auto Application::open() -> Result<void> {
  auto opened = run(store_->open());
  if (!opened) {
    return opened;
  }
  opened_ = true;
  return ok();
}

auto Application::close() noexcept -> void {
  if (!opened_) {
    return;
  }
  opened_ = false;
  const auto grace = std::chrono::milliseconds(config_.session.shutdown_grace_ms);
  run_void(sessions_->shutdown(grace));
  run_void(store_->close());
  boost::system::error_code ec;
  signals_.cancel(ec);
}

auto Application::stored_secret(const Principal &principal)
    -> Result<std::optional<std::string>> {
  if (const char *env = std::getenv("MAILSYNC_SECRET"); env && *env) {
    return ok(std::optional<std::string>{env});
  }
  return credentials_->get(principal);
}

auto Application::connect(const Principal &principal, std::string secret)
    -> task<Result<SessionId>> {
  auto info = co_await sessions_->authenticate(principal, secret);
  if (!info) {
    co_return fail(info.error());
  }
  sessions_->start();
  co_return ok(info->id);
}

auto Application::lockout_remaining(const Principal &principal) const
    -> std::chrono::seconds {
  return limiter_->lockout_remaining(principal, util::Clock::now());
}

auto Application::store() -> StateStore & { return *store_; }
auto Application::sessions() -> SessionManager & { return *sessions_; }
auto Application::batch() -> BatchCoordinator & { return *batch_; }
auto Application::reconciler() -> Reconciler & { return *reconciler_; }
auto Application::credentials() -> CredentialStore & { return *credentials_; }

} // namespace mailsync
