#include "mailsync/quota/quota_guard.hpp"

#include "mailsync/util/log.hpp"

#include <algorithm>
#include <cmath>

namespace mailsync {

namespace {

[[nodiscard]] auto throttle_backoff_config(const QuotaConfig &cfg)
    -> util::RetryBackoff::Config {
  return {.base = std::chrono::milliseconds{250},
          .cap = std::chrono::milliseconds{15000},
          .jitter = 0.25,
          .max_attempts = cfg.throttle_max_retries};
}

} // namespace

QuotaGuard::QuotaGuard(const QuotaConfig &cfg)
    : max_retries_(cfg.throttle_max_retries),
      backoff_(throttle_backoff_config(cfg)) {
  const auto now = Clock::now();
  auto init = [now](double rate, int burst) {
    const auto cap = static_cast<double>(std::max(burst, 1));
    return Bucket{.rate = rate, .burst = cap, .tokens = cap, .last_refill = now};
  };
  buckets_.at(std::to_underlying(QuotaScope::Mailbox)) =
      init(cfg.mailbox_rate, cfg.mailbox_burst);
  buckets_.at(std::to_underlying(QuotaScope::Classify)) =
      init(cfg.classify_rate, cfg.classify_burst);
}

auto QuotaGuard::refill(Bucket &b, Clock::time_point now) -> void {
  if (now <= b.last_refill) {
    return;
  }
  const std::chrono::duration<double> elapsed = now - b.last_refill;
  b.tokens = std::min(b.burst, b.tokens + elapsed.count() * b.rate);
  b.last_refill = now;
}

auto QuotaGuard::acquire(QuotaScope scope, Clock::time_point now)
    -> Result<void> {
  std::scoped_lock lock(mu_);
  auto &b = bucket(scope);
  refill(b, now);
  if (b.tokens < 1.0) {
    return fail(Error::RateLimited);
  }
  b.tokens -= 1.0;
  return ok();
}

auto QuotaGuard::retry_after(QuotaScope scope, Clock::time_point now)
    -> std::chrono::milliseconds {
  std::scoped_lock lock(mu_);
  auto &b = bucket(scope);
  refill(b, now);
  if (b.tokens >= 1.0) {
    return std::chrono::milliseconds{0};
  }
  const double wait_sec = (1.0 - b.tokens) / b.rate;
  return std::chrono::milliseconds{
      static_cast<std::int64_t>(std::ceil(wait_sec * 1000.0))};
}

auto QuotaGuard::available(QuotaScope scope, Clock::time_point now)
    -> double {
  std::scoped_lock lock(mu_);
  auto &b = bucket(scope);
  refill(b, now);
  return b.tokens;
}

auto QuotaGuard::acquire_or_wait(QuotaScope scope, const SleepFn &sleep)
    -> task<Result<void>> {
  for (int attempt = 0;; ++attempt) {
    if (auto r = acquire(scope); r) {
      co_return ok();
    }
    if (attempt >= max_retries_) {
      log::warn("Quota '{}' still exhausted after {} retries",
                to_string_view(scope), attempt);
      co_return fail(Error::RateLimited);
    }
    const auto delay = std::max(retry_after(scope), backoff_.delay_for(attempt));
    log::debug("Quota '{}' exhausted, waiting {}ms", to_string_view(scope),
               delay.count());
    co_await sleep(delay);
  }
}

} // namespace mailsync
