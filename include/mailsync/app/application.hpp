#pragma once

#include "mailsync/config/system_config.hpp"
#include "mailsync/core/coroutine.hpp"
#include "mailsync/core/error.hpp"
#include "mailsync/util/id.hpp"
#include "mailsync/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace mailsync {

class AuthAttemptLimiter;
class BatchCoordinator;
class Classifier;
class CredentialStore;
class QuotaGuard;
class Reconciler;
class SessionManager;
class StateStore;

// Wires the components of one command invocation onto a single io_context.
// SIGINT/SIGTERM cancel the running batch at its next page boundary; close()
// then logs every session out within the configured grace period.
class Application {
public:
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig & {
    return config_;
  }

  // Opens the store and applies pending migrations.
  [[nodiscard]] auto open() -> Result<void>;
  auto close() noexcept -> void;

  // Secret for `principal`: MAILSYNC_SECRET, then the credential store.
  // nullopt when neither has one.
  [[nodiscard]] auto stored_secret(const Principal &principal)
      -> Result<std::optional<std::string>>;

  // Authenticates the configured principal and starts the session sweep.
  [[nodiscard]] auto connect(const Principal &principal, std::string secret)
      -> task<Result<SessionId>>;

  // Seconds of lockout left for `principal`, for the user message.
  [[nodiscard]] auto lockout_remaining(const Principal &principal) const
      -> std::chrono::seconds;

  [[nodiscard]] auto interrupted() const noexcept -> bool {
    return interrupted_.load(std::memory_order_acquire);
  }

  // Runs `op` to completion on the application's io_context.
  template <typename T> auto run(task<Result<T>> op) -> Result<T> {
    auto fut = boost::asio::co_spawn(io_, std::move(op), boost::asio::use_future);
    while (fut.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      if (io_.run_one() == 0) {
        io_.restart();
      }
    }
    try {
      return fut.get();
    } catch (const std::exception &e) {
      log::error("Command failed: {}", e.what());
      return fail(Error::Unknown);
    }
  }

  [[nodiscard]] auto store() -> StateStore &;
  [[nodiscard]] auto sessions() -> SessionManager &;
  [[nodiscard]] auto batch() -> BatchCoordinator &;
  [[nodiscard]] auto reconciler() -> Reconciler &;
  [[nodiscard]] auto credentials() -> CredentialStore &;

private:
  auto arm_signals() -> void;
  auto run_void(task<void> op) noexcept -> void;

  SystemConfig config_;
  boost::asio::io_context io_{1};
  boost::asio::signal_set signals_;
  std::atomic<bool> interrupted_{false};
  bool opened_{false};

  std::unique_ptr<StateStore> store_;
  std::unique_ptr<QuotaGuard> quota_;
  std::unique_ptr<AuthAttemptLimiter> limiter_;
  std::unique_ptr<SessionManager> sessions_;
  std::unique_ptr<Classifier> classifier_;
  std::unique_ptr<BatchCoordinator> batch_;
  std::unique_ptr<Reconciler> reconciler_;
  std::unique_ptr<CredentialStore> credentials_;
};

} // namespace mailsync
