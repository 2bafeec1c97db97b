#pragma once

#include "mailsync/util/enum.hpp"
#include <boost/describe/enum.hpp>
#include <cstdint>
#include <string>

namespace mailsync {

struct DatabaseConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"mailsync"};
  std::string password{"mailsync"};
  std::string database{"mailsync"};
  uint16_t pool_size{4};
  uint16_t connect_timeout{5}; // seconds

  auto operator==(const DatabaseConfig &) const -> bool = default;
};

enum class AuthMode : std::uint8_t { Password, OAuth };
BOOST_DESCRIBE_ENUM(AuthMode, Password, OAuth)
MAILSYNC_DEFINE_ENUM_SERDE(AuthMode, AuthMode::Password)

struct MailboxConfig {
  std::string host{"imap.gmail.com"};
  uint16_t port{993};
  std::string principal;
  AuthMode auth_mode{AuthMode::Password};
  std::string folder{"INBOX"};
  std::string search{"ALL"};
  int connect_timeout_sec{30};
  int command_timeout_sec{30};
  bool verify_tls{true};
  std::string credentials_file{"~/.mailsync/credentials.json"};

  auto operator==(const MailboxConfig &) const -> bool = default;
};

struct SessionConfig {
  int max_per_principal{5};
  int stale_after_sec{1500};
  int sweep_interval_sec{300};
  int keepalive_interval_sec{60};
  int keepalive_failure_threshold{3};
  int max_retries{5};
  int backoff_base_ms{2000};
  int backoff_cap_ms{15000};
  double backoff_jitter{0.25};
  int shutdown_grace_ms{2000};

  auto operator==(const SessionConfig &) const -> bool = default;
};

struct QuotaConfig {
  double mailbox_rate{10.0}; // tokens per second
  int mailbox_burst{20};
  double classify_rate{2.0};
  int classify_burst{4};
  int throttle_max_retries{4};

  auto operator==(const QuotaConfig &) const -> bool = default;
};

struct AuthLimiterConfig {
  int window_sec{900};
  int max_failures{5};
  int max_lockout_sec{3840};

  auto operator==(const AuthLimiterConfig &) const -> bool = default;
};

struct BatchConfig {
  int page_size{100};
  int classify_batch_size{10};
  double min_confidence{0.5};
  double auto_approve_confidence{0.8};

  auto operator==(const BatchConfig &) const -> bool = default;
};

struct CacheConfig {
  int folder_ttl_sec{600};

  auto operator==(const CacheConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LogConfig &) const -> bool = default;
};

struct SystemConfig {
  DatabaseConfig database;
  MailboxConfig mailbox;
  SessionConfig session;
  QuotaConfig quota;
  AuthLimiterConfig auth_limiter;
  BatchConfig batch;
  CacheConfig cache;
  LogConfig log;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace mailsync
