#include "mailsync/quota/auth_attempt_limiter.hpp"

#include "mailsync/util/log.hpp"
#include "mailsync/util/redact.hpp"

#include <algorithm>

namespace mailsync {

namespace {
constexpr int kMaxLockoutExponent = 6;
}

auto AuthAttemptLimiter::prune(Entry &entry, util::TimePoint now) const
    -> void {
  const auto cutoff = now - std::chrono::seconds{cfg_.window_sec};
  while (!entry.failures.empty() && entry.failures.front() <= cutoff) {
    entry.failures.pop_front();
  }
}

auto AuthAttemptLimiter::lockout_duration(int failures) const
    -> std::chrono::seconds {
  if (failures < cfg_.max_failures) {
    return std::chrono::seconds{0};
  }
  const int exponent =
      std::min(failures - cfg_.max_failures + 1, kMaxLockoutExponent);
  const auto minutes = std::chrono::minutes{1LL << exponent};
  return std::min<std::chrono::seconds>(
      minutes, std::chrono::seconds{cfg_.max_lockout_sec});
}

auto AuthAttemptLimiter::check(const Principal &principal,
                               util::TimePoint now) -> Result<void> {
  std::scoped_lock lock(mu_);
  auto it = entries_.find(principal);
  if (it == entries_.end()) {
    return ok();
  }
  if (now < it->second.locked_until) {
    return fail(Error::LockedOut);
  }
  prune(it->second, now);
  if (it->second.failures.empty()) {
    entries_.erase(it);
  }
  return ok();
}

auto AuthAttemptLimiter::record_failure(const Principal &principal,
                                        util::TimePoint now) -> void {
  std::scoped_lock lock(mu_);
  auto &entry = entries_[principal];
  prune(entry, now);
  entry.failures.push_back(now);

  const auto count = static_cast<int>(entry.failures.size());
  if (count >= cfg_.max_failures) {
    const auto duration = lockout_duration(count);
    entry.locked_until = now + duration;
    log::warn("Auth attempts exceeded for user {}: {} failures, locked out "
              "for {} minutes",
              util::hash_principal(principal.value()), count,
              std::chrono::duration_cast<std::chrono::minutes>(duration)
                  .count());
  }
}

auto AuthAttemptLimiter::record_success(const Principal &principal) -> void {
  std::scoped_lock lock(mu_);
  entries_.erase(principal);
}

auto AuthAttemptLimiter::lockout_remaining(const Principal &principal,
                                           util::TimePoint now) const
    -> std::chrono::seconds {
  std::scoped_lock lock(mu_);
  auto it = entries_.find(principal);
  if (it == entries_.end() || now >= it->second.locked_until) {
    return std::chrono::seconds{0};
  }
  // Round up so "0 seconds" is never reported while still locked.
  return std::chrono::ceil<std::chrono::seconds>(it->second.locked_until -
                                                 now);
}

auto AuthAttemptLimiter::failure_count(const Principal &principal,
                                       util::TimePoint now) const -> int {
  std::scoped_lock lock(mu_);
  auto it = entries_.find(principal);
  if (it == entries_.end()) {
    return 0;
  }
  const auto cutoff = now - std::chrono::seconds{cfg_.window_sec};
  return static_cast<int>(std::ranges::count_if(
      it->second.failures, [cutoff](auto t) { return t > cutoff; }));
}

} // namespace mailsync
