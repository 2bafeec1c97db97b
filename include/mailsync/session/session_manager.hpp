#pragma once

#include "mailsync/config/system_config.hpp"
#include "mailsync/core/coroutine.hpp"
#include "mailsync/core/error.hpp"
#include "mailsync/mailbox/transport.hpp"
#include "mailsync/model/session.hpp"
#include "mailsync/quota/auth_attempt_limiter.hpp"
#include "mailsync/quota/quota_guard.hpp"
#include "mailsync/util/async_mutex.hpp"
#include "mailsync/util/backoff.hpp"
#include "mailsync/util/id.hpp"
#include "mailsync/util/time.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mailsync {

class StateStore;

// Owns every live mailbox session of the process.
//
// The session map is guarded by one mutex that is never held across a
// network call. Each session additionally serializes its own transport with
// an AsyncMutex, so a background probe and a foreground fetch never
// interleave on one connection.
class SessionManager {
public:
  using ClockFn = std::function<util::TimePoint()>;

  SessionManager(boost::asio::any_io_executor executor,
                 const SessionConfig &config, TransportFactory factory,
                 QuotaGuard &quota, AuthAttemptLimiter &limiter);
  ~SessionManager();

  SessionManager(const SessionManager &) = delete;
  SessionManager &operator=(const SessionManager &) = delete;

  // Test seams and optional wiring; call before start().
  auto set_sleep(SleepFn sleep) -> void { sleep_ = std::move(sleep); }
  auto set_clock(ClockFn clock) -> void { clock_ = std::move(clock); }
  // Session records are mirrored to `store` when set.
  auto set_mirror(StateStore *store) -> void { mirror_ = store; }

  // Validates, checks the lockout, evicts the least recently active session
  // of the principal when it is at the cap, then connects and logs in.
  // Connection errors are retried with backoff; a rejected login is not.
  [[nodiscard]] auto authenticate(const Principal &principal,
                                  std::string_view secret)
      -> task<Result<SessionInfo>>;

  // One probe. A success resets the failure count; reaching the failure
  // threshold moves the session to error and runs the reconnect schedule.
  [[nodiscard]] auto keepalive(const SessionId &id) -> task<Result<void>>;

  // Probes without reconnecting; a failed probe leaves the session in error.
  [[nodiscard]] auto is_alive(const SessionId &id) -> task<bool>;

  // Idempotent. The session leaves the map before the remote logout, so it
  // is gone even when logout fails.
  auto disconnect(const SessionId &id) -> task<void>;

  // Disconnects stale sessions and probes idle connected ones. Returns the
  // number of sessions removed.
  auto sweep_once(util::TimePoint now) -> task<std::size_t>;

  [[nodiscard]] auto list() const -> std::vector<SessionInfo>;
  [[nodiscard]] auto stats(util::TimePoint now) const -> SessionStats;
  [[nodiscard]] auto find(const SessionId &id) const
      -> std::optional<SessionInfo>;
  [[nodiscard]] auto count_for(const Principal &principal) const -> int;

  // === Routed mailbox operations ===
  [[nodiscard]] auto list_folders(const SessionId &id)
      -> task<Result<std::vector<Folder>>>;
  [[nodiscard]] auto select_folder(const SessionId &id, std::string_view folder)
      -> task<Result<FolderStatus>>;
  [[nodiscard]] auto fetch_page(const SessionId &id, std::string_view folder,
                                std::string_view cursor, int size)
      -> task<Result<MailPage>>;
  [[nodiscard]] auto mutate_label(const SessionId &id, std::string_view folder,
                                  std::string_view item_id,
                                  std::string_view label, MutationOp op)
      -> task<Result<void>>;
  [[nodiscard]] auto has_label(const SessionId &id, std::string_view folder,
                               std::string_view item_id, std::string_view label)
      -> task<Result<bool>>;

  // Background sweep/keepalive loop.
  auto start() -> void;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  // Stops the loop and cancels every pending reconnect, then gives every
  // session a graceful logout. The whole call is bounded by `grace`; sessions
  // still open at the deadline are dropped locally. Terminal: later
  // authenticate calls fail with Error::Cancelled.
  auto shutdown(std::chrono::milliseconds grace) -> task<void>;

private:
  struct Session {
    Session(boost::asio::any_io_executor executor, SessionInfo info_in,
            std::unique_ptr<MailboxTransport> transport_in, std::string secret_in)
        : info(std::move(info_in)), transport(std::move(transport_in)),
          secret(std::move(secret_in)), io_lock(std::move(executor)) {}

    SessionInfo info;                      // guarded by SessionManager::mu_
    bool retries_exhausted{false};         // guarded by SessionManager::mu_
    std::unique_ptr<MailboxTransport> transport; // guarded by io_lock
    std::string secret;
    util::AsyncMutex io_lock;
  };
  using SessionPtr = std::shared_ptr<Session>;

  [[nodiscard]] auto now() const -> util::TimePoint { return clock_(); }
  [[nodiscard]] auto get(const SessionId &id) const -> SessionPtr;
  [[nodiscard]] auto detach(const SessionId &id) -> SessionPtr;
  [[nodiscard]] auto detach_lru(const Principal &principal) -> SessionPtr;

  // Connect + login with the backoff schedule. Caller holds the io lock.
  [[nodiscard]] auto open_transport(MailboxTransport &transport,
                                    const Principal &principal,
                                    std::string_view secret, int max_attempts,
                                    bool wait_first, int *attempts_used)
      -> task<Result<void>>;
  [[nodiscard]] auto reconnect(const SessionPtr &session) -> task<Result<void>>;
  // Backoff wait that returns false as soon as shutdown begins.
  [[nodiscard]] auto pause(std::chrono::milliseconds delay) -> task<bool>;
  [[nodiscard]] auto is_tracked(const SessionPtr &session) const -> bool;
  [[nodiscard]] auto is_exhausted(const SessionPtr &session) const -> bool;
  auto close_session(const SessionPtr &session, std::string_view reason)
      -> task<void>;

  template <typename T, typename Op>
  auto routed(const SessionId &id, Op op) -> task<Result<T>>;

  auto set_state(const SessionPtr &session, SessionState state) -> void;
  auto touch(const SessionPtr &session) -> void;
  auto mirror_save(const SessionPtr &session) -> task<void>;
  auto mirror_delete(const SessionId &id) -> task<void>;

  auto sweep_loop() -> task<void>;

  boost::asio::any_io_executor executor_;
  SessionConfig cfg_;
  TransportFactory factory_;
  QuotaGuard &quota_;
  AuthAttemptLimiter &limiter_;
  util::RetryBackoff backoff_;
  SleepFn sleep_;
  ClockFn clock_;
  StateStore *mirror_{nullptr};

  mutable std::mutex mu_;
  ankerl::unordered_dense::map<SessionId, SessionPtr> sessions_;

  std::atomic<bool> running_{false};
  std::atomic<bool> loop_done_{true};
  std::atomic<bool> stopping_{false};
  std::shared_ptr<boost::asio::steady_timer> sweep_timer_;
  // Never expires; cancelled by shutdown to wake every pause().
  boost::asio::steady_timer stop_signal_;
};

} // namespace mailsync
