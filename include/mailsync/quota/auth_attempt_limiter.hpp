#pragma once

#include "mailsync/config/system_config.hpp"
#include "mailsync/core/error.hpp"
#include "mailsync/util/id.hpp"
#include "mailsync/util/time.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <deque>
#include <mutex>

namespace mailsync {

// Failed-authentication tracking per principal. Failures older than the
// window are forgotten; reaching max_failures inside the window locks the
// principal out for 2^(failures - max_failures + 1) minutes, capped.
class AuthAttemptLimiter {
public:
  explicit AuthAttemptLimiter(const AuthLimiterConfig &cfg) : cfg_(cfg) {}

  // Fails with LockedOut while a lockout is in effect.
  [[nodiscard]] auto check(const Principal &principal, util::TimePoint now)
      -> Result<void>;

  auto record_failure(const Principal &principal, util::TimePoint now) -> void;

  // Clears the failure history and any lockout.
  auto record_success(const Principal &principal) -> void;

  [[nodiscard]] auto lockout_remaining(const Principal &principal,
                                       util::TimePoint now) const
      -> std::chrono::seconds;

  [[nodiscard]] auto failure_count(const Principal &principal,
                                   util::TimePoint now) const -> int;

  [[nodiscard]] auto lockout_duration(int failures) const
      -> std::chrono::seconds;

private:
  struct Entry {
    std::deque<util::TimePoint> failures;
    util::TimePoint locked_until{};
  };

  auto prune(Entry &entry, util::TimePoint now) const -> void;

  AuthLimiterConfig cfg_;
  mutable std::mutex mu_;
  ankerl::unordered_dense::map<Principal, Entry> entries_;
};

} // namespace mailsync
