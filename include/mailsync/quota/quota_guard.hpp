#pragma once

#include "mailsync/config/system_config.hpp"
#include "mailsync/core/coroutine.hpp"
#include "mailsync/core/error.hpp"
#include "mailsync/util/backoff.hpp"

#include <boost/describe/enum.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace mailsync {

enum class QuotaScope : std::uint8_t { Mailbox, Classify };
BOOST_DESCRIBE_ENUM(QuotaScope, Mailbox, Classify)
MAILSYNC_DEFINE_ENUM_SERDE(QuotaScope, QuotaScope::Mailbox)

// Token buckets, one per scope. Scopes are independent: draining the
// classify bucket never delays mailbox traffic.
class QuotaGuard {
public:
  using Clock = std::chrono::steady_clock;

  explicit QuotaGuard(const QuotaConfig &cfg);

  // Takes one token or fails with RateLimited without waiting.
  [[nodiscard]] auto acquire(QuotaScope scope, Clock::time_point now = Clock::now())
      -> Result<void>;

  // Time until the next token is available; zero when one is available now.
  [[nodiscard]] auto retry_after(QuotaScope scope,
                                 Clock::time_point now = Clock::now())
      -> std::chrono::milliseconds;

  [[nodiscard]] auto available(QuotaScope scope,
                               Clock::time_point now = Clock::now()) -> double;

  // acquire() with waiting: retries after max(retry_after, backoff) until a
  // token is granted or throttle_max_retries is exhausted.
  [[nodiscard]] auto acquire_or_wait(QuotaScope scope, const SleepFn &sleep)
      -> task<Result<void>>;

  [[nodiscard]] auto max_retries() const noexcept -> int {
    return max_retries_;
  }

  // Backoff applied to provider-side throttling as well as local quota.
  [[nodiscard]] auto throttle_delay(int attempt) -> std::chrono::milliseconds {
    return backoff_.delay_for(attempt);
  }

private:
  struct Bucket {
    double rate{1.0};
    double burst{1.0};
    double tokens{1.0};
    Clock::time_point last_refill{};
  };

  auto refill(Bucket &bucket, Clock::time_point now) -> void;
  [[nodiscard]] auto bucket(QuotaScope scope) -> Bucket & {
    return buckets_.at(std::to_underlying(scope));
  }

  std::mutex mu_;
  std::array<Bucket, 2> buckets_{};
  int max_retries_;
  util::RetryBackoff backoff_;
};

} // namespace mailsync
