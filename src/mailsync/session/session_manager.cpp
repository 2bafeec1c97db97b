#include "mailsync/session/session_manager.hpp"

#include "mailsync/core/asio_awaitable.hpp"
#include "mailsync/mailbox/credentials.hpp"
#include "mailsync/storage/state_store.hpp"
#include "mailsync/util/log.hpp"
#include "mailsync/util/redact.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>

#include <unistd.h>

#include <algorithm>
#include <exception>

namespace mailsync {

namespace {

[[nodiscard]] auto backoff_config(const SessionConfig &cfg)
    -> util::RetryBackoff::Config {
  return {.base = std::chrono::milliseconds(cfg.backoff_base_ms),
          .cap = std::chrono::milliseconds(cfg.backoff_cap_ms),
          .jitter = cfg.backoff_jitter,
          .max_attempts = cfg.max_retries};
}

[[nodiscard]] auto user_tag(const Principal &principal) -> std::string {
  return util::hash_principal(principal.value());
}

} // namespace

SessionManager::SessionManager(boost::asio::any_io_executor executor,
                               const SessionConfig &config,
                               TransportFactory factory, QuotaGuard &quota,
                               AuthAttemptLimiter &limiter)
    : executor_(std::move(executor)), cfg_(config),
      factory_(std::move(factory)), quota_(quota), limiter_(limiter),
      backoff_(backoff_config(config)), sleep_(default_sleep()),
      clock_([] { return util::Clock::now(); }), stop_signal_(executor_) {
  stop_signal_.expires_at(boost::asio::steady_timer::time_point::max());
}

SessionManager::~SessionManager() {
  stop();
  if (!loop_done_.load(std::memory_order_acquire)) {
    log::warn("SessionManager destroyed before its sweep loop finished");
  }
}

// === Lookup ===

auto SessionManager::get(const SessionId &id) const -> SessionPtr {
  std::lock_guard lock(mu_);
  auto it = sessions_.find(id);
  return it == sessions_.end() ? nullptr : it->second;
}

auto SessionManager::detach(const SessionId &id) -> SessionPtr {
  std::lock_guard lock(mu_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  auto session = std::move(it->second);
  sessions_.erase(it);
  return session;
}

auto SessionManager::detach_lru(const Principal &principal) -> SessionPtr {
  std::lock_guard lock(mu_);
  int held = 0;
  auto victim = sessions_.end();
  for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
    if (it->second->info.principal != principal) {
      continue;
    }
    ++held;
    if (victim == sessions_.end() ||
        it->second->info.last_activity < victim->second->info.last_activity) {
      victim = it;
    }
  }
  if (held < cfg_.max_per_principal || victim == sessions_.end()) {
    return nullptr;
  }
  auto session = std::move(victim->second);
  sessions_.erase(victim);
  return session;
}

auto SessionManager::is_tracked(const SessionPtr &session) const -> bool {
  std::lock_guard lock(mu_);
  auto it = sessions_.find(session->info.id);
  return it != sessions_.end() && it->second == session;
}

auto SessionManager::is_exhausted(const SessionPtr &session) const -> bool {
  std::lock_guard lock(mu_);
  return session->info.state == SessionState::Error &&
         session->retries_exhausted;
}

auto SessionManager::find(const SessionId &id) const
    -> std::optional<SessionInfo> {
  std::lock_guard lock(mu_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second->info;
}

auto SessionManager::count_for(const Principal &principal) const -> int {
  std::lock_guard lock(mu_);
  return static_cast<int>(std::ranges::count_if(sessions_, [&](const auto &kv) {
    return kv.second->info.principal == principal;
  }));
}

auto SessionManager::list() const -> std::vector<SessionInfo> {
  std::lock_guard lock(mu_);
  std::vector<SessionInfo> out;
  out.reserve(sessions_.size());
  for (const auto &[id, session] : sessions_) {
    out.push_back(session->info);
  }
  std::ranges::sort(out, [](const SessionInfo &a, const SessionInfo &b) {
    return a.last_activity > b.last_activity;
  });
  return out;
}

auto SessionManager::stats(util::TimePoint now) const -> SessionStats {
  const auto threshold = std::chrono::seconds(cfg_.stale_after_sec);
  std::lock_guard lock(mu_);
  SessionStats stats;
  for (const auto &[id, session] : sessions_) {
    const auto &info = session->info;
    ++stats.total;
    if (info.state == SessionState::Connected) {
      ++stats.active;
    }
    if (info.is_stale(now, threshold)) {
      ++stats.stale;
    }
    ++stats.by_principal[info.principal.str()];
  }
  return stats;
}

auto SessionManager::set_state(const SessionPtr &session, SessionState state)
    -> void {
  std::lock_guard lock(mu_);
  session->info.state = state;
}

auto SessionManager::touch(const SessionPtr &session) -> void {
  const auto t = now();
  std::lock_guard lock(mu_);
  session->info.last_activity = t;
}

// === Mirror ===

auto SessionManager::mirror_save(const SessionPtr &session) -> task<void> {
  if (mirror_ == nullptr) {
    co_return;
  }
  SessionInfo snapshot;
  {
    std::lock_guard lock(mu_);
    snapshot = session->info;
  }
  if (auto r = co_await mirror_->save_session_record(snapshot); !r) {
    log::warn("Failed to record session {}: {}", snapshot.id,
              r.error().message());
  }
}

auto SessionManager::mirror_delete(const SessionId &id) -> task<void> {
  if (mirror_ == nullptr) {
    co_return;
  }
  if (auto r = co_await mirror_->delete_session_record(id); !r) {
    log::warn("Failed to drop session record {}: {}", id, r.error().message());
  }
}

// === Connect / authenticate ===

auto SessionManager::pause(std::chrono::milliseconds delay) -> task<bool> {
  using namespace awaitable_ops;
  if (stopping_.load(std::memory_order_acquire)) {
    co_return false;
  }
  (void)co_await (sleep_(delay) || stop_signal_.async_wait(use_nothrow));
  co_return !stopping_.load(std::memory_order_acquire);
}

auto SessionManager::open_transport(MailboxTransport &transport,
                                    const Principal &principal,
                                    std::string_view secret, int max_attempts,
                                    bool wait_first, int *attempts_used)
    -> task<Result<void>> {
  Result<void> last = fail(Error::ConnectionFailed);
  for (int attempt = 0; attempt < max_attempts; ++attempt) {
    if (stopping_.load(std::memory_order_acquire)) {
      co_return fail(Error::Cancelled);
    }
    if (wait_first || attempt > 0) {
      const auto delay = backoff_.delay_for(wait_first ? attempt : attempt - 1);
      log::debug("Connecting user {} in {}ms (attempt {}/{})",
                 user_tag(principal), delay.count(), attempt + 1,
                 max_attempts);
      if (!co_await pause(delay)) {
        co_return fail(Error::Cancelled);
      }
    }
    if (attempts_used != nullptr) {
      *attempts_used = attempt + 1;
    }

    last = co_await transport.connect();
    if (last) {
      last = co_await transport.authenticate(principal, secret);
      if (last) {
        co_return ok();
      }
    }

    const auto ec = last.error();
    if (ec == Error::AuthenticationFailed) {
      co_return last;
    }
    if (!is_transient(ec) && ec != Error::RateLimited) {
      co_return last;
    }
    log::warn("Connection attempt {}/{} for user {} failed: {}", attempt + 1,
              max_attempts, user_tag(principal),
              util::sanitize_error(ec.message()));
  }
  co_return last;
}

auto SessionManager::authenticate(const Principal &principal,
                                  std::string_view secret)
    -> task<Result<SessionInfo>> {
  if (auto problem = principal_problem(principal.value())) {
    log::warn("Rejected principal: {}", *problem);
    co_return fail(Error::ValidationFailed);
  }

  if (auto allowed = limiter_.check(principal, now()); !allowed) {
    log::warn("Authentication for user {} locked out for {}s",
              user_tag(principal),
              limiter_.lockout_remaining(principal, now()).count());
    co_return fail(allowed.error());
  }

  auto transport = factory_();
  const auto mode = transport->auth_mode();
  if (auto problem = secret_problem(mode, secret)) {
    log::warn("Rejected {} secret for user {}: {}", to_string_view(mode),
              user_tag(principal), *problem);
    co_return fail(Error::ValidationFailed);
  }
  auto clean_secret = normalize_secret(mode, secret);

  if (auto victim = detach_lru(principal)) {
    log::info("User {} at {} sessions, evicting least recently active {}",
              user_tag(principal), cfg_.max_per_principal, victim->info.id);
    co_await close_session(victim, "evicted");
  }

  int attempts = 0;
  auto opened = co_await open_transport(*transport, principal, clean_secret,
                                        std::max(1, cfg_.max_retries), false,
                                        &attempts);
  if (!opened) {
    if (opened.error() == Error::AuthenticationFailed) {
      limiter_.record_failure(principal, now());
    }
    log::warn("Authentication for user {} failed after {} attempt(s): {}",
              user_tag(principal), attempts, opened.error().message());
    co_return fail(opened.error());
  }
  limiter_.record_success(principal);

  const auto t = now();
  SessionInfo info;
  info.id = generate_session_id();
  info.principal = principal;
  info.state = SessionState::Connected;
  info.auth_mode = mode;
  info.created_at = t;
  info.last_activity = t;
  info.retry_count = attempts - 1;
  info.owner_pid = static_cast<std::int64_t>(::getpid());

  auto session = std::make_shared<Session>(executor_, info, std::move(transport),
                                           std::move(clean_secret));

  // A concurrent authenticate may have filled the slots while this one was
  // connecting.
  std::vector<SessionPtr> overflow;
  while (auto extra = detach_lru(principal)) {
    overflow.push_back(std::move(extra));
  }
  {
    std::lock_guard lock(mu_);
    sessions_.emplace(info.id, session);
  }
  for (const auto &victim : overflow) {
    co_await close_session(victim, "evicted");
  }

  co_await mirror_save(session);
  log::info("Session {} opened for user {} ({})", info.id, user_tag(principal),
            to_string_view(mode));
  co_return ok(std::move(info));
}

auto SessionManager::reconnect(const SessionPtr &session) -> task<Result<void>> {
  auto guard = co_await session->io_lock.lock();
  // Shutdown or disconnect may have dropped the session while this one
  // waited for the lock.
  if (stopping_.load(std::memory_order_acquire) || !is_tracked(session)) {
    co_return fail(Error::Cancelled);
  }
  set_state(session, SessionState::Connecting);

  Principal principal;
  {
    std::lock_guard lock(mu_);
    principal = session->info.principal;
  }

  int attempts = 0;
  auto result = co_await open_transport(*session->transport, principal,
                                        session->secret,
                                        std::max(1, cfg_.max_retries), true,
                                        &attempts);
  if (result &&
      (stopping_.load(std::memory_order_acquire) || !is_tracked(session))) {
    if (auto r = co_await session->transport->logout(); !r) {
      log::debug("Logout of dropped session {} failed: {}", session->info.id,
                 r.error().message());
    }
    result = fail(Error::Cancelled);
  }
  if (!result && result.error() == Error::Cancelled) {
    set_state(session, SessionState::Disconnected);
    log::info("Reconnect of session {} abandoned", session->info.id);
    co_return result;
  }
  {
    std::lock_guard lock(mu_);
    session->info.retry_count += attempts;
    if (result) {
      session->info.state = SessionState::Connected;
      session->info.keepalive_failures = 0;
      session->info.last_activity = now();
      session->info.selected_folder.clear();
    } else {
      session->info.state = SessionState::Error;
      session->retries_exhausted = true;
    }
  }

  if (!result) {
    if (result.error() == Error::AuthenticationFailed) {
      limiter_.record_failure(principal, now());
    }
    log::error("Session {} gave up reconnecting after {} attempt(s): {}",
               session->info.id, attempts, result.error().message());
  } else {
    log::info("Session {} reconnected after {} attempt(s)", session->info.id,
              attempts);
  }
  if (is_tracked(session)) {
    co_await mirror_save(session);
  }
  co_return result;
}

auto SessionManager::close_session(const SessionPtr &session,
                                   std::string_view reason) -> task<void> {
  {
    auto guard = co_await session->io_lock.lock();
    if (auto r = co_await session->transport->logout(); !r) {
      log::debug("Logout of session {} failed ({}); dropped locally",
                 session->info.id, r.error().message());
    }
  }
  set_state(session, SessionState::Disconnected);
  co_await mirror_delete(session->info.id);
  log::info("Session {} closed: {}", session->info.id, reason);
}

// === Liveness ===

auto SessionManager::keepalive(const SessionId &id) -> task<Result<void>> {
  auto session = get(id);
  if (!session) {
    co_return fail(Error::NotFound);
  }
  if (is_exhausted(session)) {
    co_return fail(Error::ConnectionFailed);
  }

  Result<void> probe = ok();
  {
    auto guard = co_await session->io_lock.lock();
    probe = co_await session->transport->noop();
  }

  int failures = 0;
  {
    std::lock_guard lock(mu_);
    if (probe) {
      session->info.keepalive_failures = 0;
      session->info.last_activity = now();
      session->info.state = SessionState::Connected;
    } else {
      failures = ++session->info.keepalive_failures;
    }
  }
  if (probe) {
    co_return ok();
  }

  log::warn("Keepalive for session {} failed ({}/{}): {}", id, failures,
            cfg_.keepalive_failure_threshold, probe.error().message());
  if (failures < cfg_.keepalive_failure_threshold) {
    co_return fail(probe.error());
  }

  set_state(session, SessionState::Error);
  co_await mirror_save(session);
  co_return co_await reconnect(session);
}

auto SessionManager::is_alive(const SessionId &id) -> task<bool> {
  auto session = get(id);
  if (!session) {
    co_return false;
  }

  Result<void> probe = ok();
  {
    auto guard = co_await session->io_lock.lock();
    probe = co_await session->transport->noop();
  }
  if (probe) {
    std::lock_guard lock(mu_);
    session->info.keepalive_failures = 0;
    session->info.last_activity = now();
    co_return true;
  }
  set_state(session, SessionState::Error);
  log::debug("Session {} failed liveness probe: {}", id,
             probe.error().message());
  co_return false;
}

auto SessionManager::disconnect(const SessionId &id) -> task<void> {
  auto session = detach(id);
  if (!session) {
    co_return;
  }
  co_await close_session(session, "disconnected");
}

auto SessionManager::sweep_once(util::TimePoint now_tp) -> task<std::size_t> {
  const auto stale_after = std::chrono::seconds(cfg_.stale_after_sec);
  const auto keepalive_after = std::chrono::seconds(cfg_.keepalive_interval_sec);

  std::vector<SessionPtr> stale;
  std::vector<SessionId> idle;
  {
    std::lock_guard lock(mu_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      const auto &info = it->second->info;
      if (info.is_stale(now_tp, stale_after)) {
        stale.push_back(std::move(it->second));
        it = sessions_.erase(it);
        continue;
      }
      if (info.state == SessionState::Connected &&
          now_tp - info.last_activity >= keepalive_after) {
        idle.push_back(it->first);
      }
      ++it;
    }
  }

  for (const auto &session : stale) {
    co_await close_session(session, "stale");
  }
  for (const auto &id : idle) {
    if (auto r = co_await keepalive(id); !r) {
      log::debug("Sweep keepalive for session {} failed: {}", id,
                 r.error().message());
    }
  }
  if (!stale.empty()) {
    log::info("Sweep removed {} stale session(s)", stale.size());
  }
  co_return stale.size();
}

// === Routed operations ===

template <typename T, typename Op>
auto SessionManager::routed(const SessionId &id, Op op) -> task<Result<T>> {
  auto session = get(id);
  if (!session) {
    co_return fail(Error::NotFound);
  }
  // The reconnect schedule already ran out; only a new authenticate helps.
  if (is_exhausted(session)) {
    co_return fail(Error::ConnectionFailed);
  }

  bool reconnected = false;
  for (int attempt = 0;; ++attempt) {
    if (auto q = co_await quota_.acquire_or_wait(QuotaScope::Mailbox, sleep_);
        !q) {
      co_return fail(q.error());
    }

    Result<T> result = fail(Error::ConnectionFailed);
    {
      auto guard = co_await session->io_lock.lock();
      bool usable = false;
      {
        std::lock_guard lock(mu_);
        usable = session->info.state == SessionState::Connected;
      }
      if (usable) {
        result = co_await op(*session->transport);
      }
    }

    if (result) {
      touch(session);
      co_return result;
    }

    const auto ec = result.error();
    if (ec == Error::RateLimited && attempt < quota_.max_retries()) {
      const auto delay = quota_.throttle_delay(attempt);
      log::warn("Server throttled session {}, retrying in {}ms", id,
                delay.count());
      if (!co_await pause(delay)) {
        co_return fail(Error::Cancelled);
      }
      continue;
    }
    if (is_transient(ec) && !reconnected) {
      reconnected = true;
      set_state(session, SessionState::Error);
      if (auto rc = co_await reconnect(session); !rc) {
        co_return fail(rc.error());
      }
      continue;
    }
    co_return fail(ec);
  }
}

auto SessionManager::list_folders(const SessionId &id)
    -> task<Result<std::vector<Folder>>> {
  co_return co_await routed<std::vector<Folder>>(
      id, [](MailboxTransport &t) { return t.list_folders(); });
}

auto SessionManager::select_folder(const SessionId &id, std::string_view folder)
    -> task<Result<FolderStatus>> {
  auto status = co_await routed<FolderStatus>(
      id, [&](MailboxTransport &t) { return t.select_folder(folder); });
  if (status) {
    if (auto session = get(id)) {
      std::lock_guard lock(mu_);
      session->info.selected_folder = std::string(folder);
    }
  }
  co_return status;
}

auto SessionManager::fetch_page(const SessionId &id, std::string_view folder,
                                std::string_view cursor, int size)
    -> task<Result<MailPage>> {
  co_return co_await routed<MailPage>(id, [&](MailboxTransport &t) {
    return t.fetch_page(folder, cursor, size);
  });
}

auto SessionManager::mutate_label(const SessionId &id, std::string_view folder,
                                  std::string_view item_id,
                                  std::string_view label, MutationOp op)
    -> task<Result<void>> {
  co_return co_await routed<void>(id, [&](MailboxTransport &t) {
    return t.mutate_label(folder, item_id, label, op);
  });
}

auto SessionManager::has_label(const SessionId &id, std::string_view folder,
                               std::string_view item_id, std::string_view label)
    -> task<Result<bool>> {
  co_return co_await routed<bool>(id, [&](MailboxTransport &t) {
    return t.has_label(folder, item_id, label);
  });
}

// === Background loop ===

auto SessionManager::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  loop_done_.store(false, std::memory_order_release);
  sweep_timer_ = std::make_shared<boost::asio::steady_timer>(executor_);

  boost::asio::co_spawn(executor_, sweep_loop(),
                        [this](std::exception_ptr ep) {
                          loop_done_.store(true, std::memory_order_release);
                          if (!ep) {
                            return;
                          }
                          try {
                            std::rethrow_exception(ep);
                          } catch (const std::exception &e) {
                            log::error("Session sweep loop crashed: {}",
                                       e.what());
                          }
                        });
}

auto SessionManager::stop() noexcept -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  if (sweep_timer_) {
    sweep_timer_->cancel();
  }
}

auto SessionManager::sweep_loop() -> task<void> {
  auto timer = sweep_timer_;
  log::debug("Session sweep every {}s, stale after {}s", cfg_.sweep_interval_sec,
             cfg_.stale_after_sec);

  while (running_.load(std::memory_order_acquire)) {
    timer->expires_after(std::chrono::seconds(cfg_.sweep_interval_sec));
    auto [ec] = co_await timer->async_wait(use_nothrow);
    if (ec || !running_.load(std::memory_order_acquire)) {
      break;
    }
    try {
      (void)co_await sweep_once(now());
    } catch (const std::exception &e) {
      log::error("Session sweep failed: {}", e.what());
    }
  }
}

auto SessionManager::shutdown(std::chrono::milliseconds grace) -> task<void> {
  using namespace awaitable_ops;
  const auto join_by = std::chrono::steady_clock::now() + grace;
  stopping_.store(true, std::memory_order_release);
  stop_signal_.cancel();
  stop();

  std::vector<SessionPtr> all;
  {
    std::lock_guard lock(mu_);
    for (auto &[id, session] : sessions_) {
      all.push_back(std::move(session));
    }
    sessions_.clear();
  }

  boost::asio::steady_timer deadline(executor_);
  deadline.expires_after(grace);

  auto logout_all = [&]() -> task<void> {
    for (const auto &session : all) {
      auto guard = co_await session->io_lock.lock();
      if (auto r = co_await session->transport->logout(); !r) {
        log::debug("Logout of session {} failed: {}", session->info.id,
                   r.error().message());
      }
    }
  };

  if (!all.empty()) {
    auto finished =
        co_await (logout_all() || deadline.async_wait(use_nothrow));
    if (finished.index() == 1) {
      log::warn("Shutdown grace of {}ms elapsed; remaining sessions dropped",
                grace.count());
    }
  }

  for (const auto &session : all) {
    co_await mirror_delete(session->info.id);
  }

  // Give the sweep loop its chance to observe the cancelled timer.
  while (!loop_done_.load(std::memory_order_acquire) &&
         std::chrono::steady_clock::now() < join_by) {
    boost::asio::steady_timer tick(executor_);
    tick.expires_after(std::chrono::milliseconds(1));
    co_await tick.async_wait(use_nothrow);
  }
  if (!loop_done_.load(std::memory_order_acquire)) {
    log::warn("Session sweep loop still busy after {}ms grace", grace.count());
  }
  log::info("Session manager stopped ({} session(s) closed)", all.size());
}

} // namespace mailsync
