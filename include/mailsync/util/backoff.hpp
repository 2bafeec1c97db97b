#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <random>

namespace mailsync::util {

// Exponential backoff with symmetric jitter for reconnect and retry loops.
//   delay(n) = min(base * 2^n, cap) * (1 + U(-jitter, +jitter)), then <= cap
class RetryBackoff {
public:
  struct Config {
    std::chrono::milliseconds base{2000};
    std::chrono::milliseconds cap{15000};
    double jitter{0.25};
    int max_attempts{5};
  };

  RetryBackoff() : RetryBackoff(Config{}) {}
  explicit RetryBackoff(Config cfg, std::uint64_t seed = std::random_device{}())
      : cfg_(cfg), rng_(seed) {}

  [[nodiscard]] auto delay_for(int attempt) -> std::chrono::milliseconds {
    const auto exp = std::clamp(attempt, 0, 30);
    const double raw = static_cast<double>(cfg_.base.count()) *
                       std::pow(2.0, static_cast<double>(exp));
    const double capped = std::min(raw, static_cast<double>(cfg_.cap.count()));

    double factor = 1.0;
    if (cfg_.jitter > 0.0) {
      std::scoped_lock lock(mu_);
      std::uniform_real_distribution<double> dist(-cfg_.jitter, cfg_.jitter);
      factor += dist(rng_);
    }
    const double jittered =
        std::clamp(capped * factor, 0.0, static_cast<double>(cfg_.cap.count()));
    return std::chrono::milliseconds{static_cast<std::int64_t>(jittered)};
  }

  // True while another attempt is allowed after `attempts` failures.
  [[nodiscard]] auto should_retry(int attempts) const noexcept -> bool {
    return attempts < cfg_.max_attempts;
  }

  [[nodiscard]] auto config() const noexcept -> const Config & { return cfg_; }

private:
  Config cfg_;
  std::mutex mu_;
  std::mt19937_64 rng_;
};

} // namespace mailsync::util
