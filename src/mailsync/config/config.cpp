#include "mailsync/config/config.hpp"
#include "mailsync/config/toml_util.hpp"

#include "mailsync/core/error.hpp"
#include "mailsync/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <string>
#include <string_view>
#include <type_traits>

namespace mailsync {
namespace detail {

struct DatabaseToml {
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"mailsync"};
  std::string password{"mailsync"};
  std::string database{"mailsync"};
  uint16_t pool_size{4};
  uint16_t connect_timeout{5};
};

struct MailboxToml {
  std::string host{"imap.gmail.com"};
  uint16_t port{993};
  std::string principal;
  std::string auth_mode{"password"};
  std::string folder{"INBOX"};
  std::string search{"ALL"};
  int connect_timeout_sec{30};
  int command_timeout_sec{30};
  bool verify_tls{true};
  std::string credentials_file{"~/.mailsync/credentials.json"};
};

struct SessionToml {
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
};

struct QuotaToml {
  double mailbox_rate{10.0};
  int mailbox_burst{20};
  double classify_rate{2.0};
  int classify_burst{4};
  int throttle_max_retries{4};
};

struct AuthLimiterToml {
  int window_sec{900};
  int max_failures{5};
  int max_lockout_sec{3840};
};

struct BatchToml {
  int page_size{100};
  int classify_batch_size{10};
  double min_confidence{0.5};
  double auto_approve_confidence{0.8};
};

struct CacheToml {
  int folder_ttl_sec{600};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct SystemToml {
  DatabaseToml database{};
  MailboxToml mailbox{};
  SessionToml session{};
  QuotaToml quota{};
  AuthLimiterToml auth_limiter{};
  BatchToml batch{};
  CacheToml cache{};
  LogToml log{};
};

} // namespace detail
} // namespace mailsync

namespace glz {
template <> struct meta<mailsync::detail::DatabaseToml> {
  using T = mailsync::detail::DatabaseToml;
  static constexpr auto value =
      object("host", &T::host, "port", &T::port, "username", &T::username,
             "password", &T::password, "database", &T::database, "pool_size",
             &T::pool_size, "connect_timeout", &T::connect_timeout);
};

template <> struct meta<mailsync::detail::MailboxToml> {
  using T = mailsync::detail::MailboxToml;
  static constexpr auto value = object(
      "host", &T::host, "port", &T::port, "principal", &T::principal,
      "auth_mode", &T::auth_mode, "folder", &T::folder, "search", &T::search,
      "connect_timeout_sec", &T::connect_timeout_sec, "command_timeout_sec",
      &T::command_timeout_sec, "verify_tls", &T::verify_tls,
      "credentials_file", &T::credentials_file);
};

template <> struct meta<mailsync::detail::SessionToml> {
  using T = mailsync::detail::SessionToml;
  static constexpr auto value =
      object("max_per_principal", &T::max_per_principal, "stale_after_sec",
             &T::stale_after_sec, "sweep_interval_sec", &T::sweep_interval_sec,
             "keepalive_interval_sec", &T::keepalive_interval_sec,
             "keepalive_failure_threshold", &T::keepalive_failure_threshold,
             "max_retries", &T::max_retries, "backoff_base_ms",
             &T::backoff_base_ms, "backoff_cap_ms", &T::backoff_cap_ms,
             "backoff_jitter", &T::backoff_jitter, "shutdown_grace_ms",
             &T::shutdown_grace_ms);
};

template <> struct meta<mailsync::detail::QuotaToml> {
  using T = mailsync::detail::QuotaToml;
  static constexpr auto value =
      object("mailbox_rate", &T::mailbox_rate, "mailbox_burst",
             &T::mailbox_burst, "classify_rate", &T::classify_rate,
             "classify_burst", &T::classify_burst, "throttle_max_retries",
             &T::throttle_max_retries);
};

template <> struct meta<mailsync::detail::AuthLimiterToml> {
  using T = mailsync::detail::AuthLimiterToml;
  static constexpr auto value =
      object("window_sec", &T::window_sec, "max_failures", &T::max_failures,
             "max_lockout_sec", &T::max_lockout_sec);
};

template <> struct meta<mailsync::detail::BatchToml> {
  using T = mailsync::detail::BatchToml;
  static constexpr auto value =
      object("page_size", &T::page_size, "classify_batch_size",
             &T::classify_batch_size, "min_confidence", &T::min_confidence,
             "auto_approve_confidence", &T::auto_approve_confidence);
};

template <> struct meta<mailsync::detail::CacheToml> {
  using T = mailsync::detail::CacheToml;
  static constexpr auto value = object("folder_ttl_sec", &T::folder_ttl_sec);
};

template <> struct meta<mailsync::detail::LogToml> {
  using T = mailsync::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<mailsync::detail::SystemToml> {
  using T = mailsync::detail::SystemToml;
  static constexpr auto value =
      object("database", &T::database, "mailbox", &T::mailbox, "session",
             &T::session, "quota", &T::quota, "auth_limiter",
             &T::auth_limiter, "batch", &T::batch, "cache", &T::cache, "log",
             &T::log);
};
} // namespace glz

namespace mailsync {
namespace {

template <typename T>
auto env_override(const char *name, T &field) -> void {
  if (const char *v = std::getenv(name); v != nullptr) {
    if constexpr (std::is_same_v<T, std::string>) {
      field = v;
    } else if constexpr (std::is_same_v<T, bool>) {
      field = (std::string_view(v) == "1" || std::string_view(v) == "true");
    } else {
      field = boost::lexical_cast<T>(v);
    }
  }
}

auto apply_env_overrides(SystemConfig &cfg) -> void {
  env_override("MAILSYNC_DB_HOST", cfg.database.host);
  env_override("MAILSYNC_DB_PORT", cfg.database.port);
  env_override("MAILSYNC_DB_USERNAME", cfg.database.username);
  env_override("MAILSYNC_DB_PASSWORD", cfg.database.password);
  env_override("MAILSYNC_DB_DATABASE", cfg.database.database);
  env_override("MAILSYNC_DB_POOL_SIZE", cfg.database.pool_size);

  env_override("MAILSYNC_IMAP_HOST", cfg.mailbox.host);
  env_override("MAILSYNC_IMAP_PORT", cfg.mailbox.port);
  env_override("MAILSYNC_PRINCIPAL", cfg.mailbox.principal);
  if (const char *v = std::getenv("MAILSYNC_AUTH_MODE"); v != nullptr) {
    cfg.mailbox.auth_mode = parse<AuthMode>(v);
  }
  env_override("MAILSYNC_FOLDER", cfg.mailbox.folder);
  env_override("MAILSYNC_VERIFY_TLS", cfg.mailbox.verify_tls);
  env_override("MAILSYNC_CREDENTIALS_FILE", cfg.mailbox.credentials_file);

  env_override("MAILSYNC_SESSION_MAX_PER_PRINCIPAL",
               cfg.session.max_per_principal);
  env_override("MAILSYNC_SESSION_STALE_AFTER_SEC", cfg.session.stale_after_sec);
  env_override("MAILSYNC_SESSION_SWEEP_INTERVAL_SEC",
               cfg.session.sweep_interval_sec);

  env_override("MAILSYNC_BATCH_PAGE_SIZE", cfg.batch.page_size);
  env_override("MAILSYNC_BATCH_MIN_CONFIDENCE", cfg.batch.min_confidence);

  env_override("MAILSYNC_LOG_LEVEL", cfg.log.level);
  env_override("MAILSYNC_LOG_FILE", cfg.log.file);
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  SystemConfig cfg{};
  cfg.database.host = std::move(raw.database.host);
  cfg.database.port = raw.database.port;
  cfg.database.username = std::move(raw.database.username);
  cfg.database.password = std::move(raw.database.password);
  cfg.database.database = std::move(raw.database.database);
  cfg.database.pool_size = raw.database.pool_size;
  cfg.database.connect_timeout = raw.database.connect_timeout;

  auto mode = util::try_parse_enum<AuthMode>(raw.mailbox.auth_mode);
  if (!mode) {
    log::error("Unknown mailbox.auth_mode '{}'", raw.mailbox.auth_mode);
    return fail(Error::ParseError);
  }
  cfg.mailbox.host = std::move(raw.mailbox.host);
  cfg.mailbox.port = raw.mailbox.port;
  cfg.mailbox.principal = std::move(raw.mailbox.principal);
  cfg.mailbox.auth_mode = *mode;
  cfg.mailbox.folder = std::move(raw.mailbox.folder);
  cfg.mailbox.search = std::move(raw.mailbox.search);
  cfg.mailbox.connect_timeout_sec = raw.mailbox.connect_timeout_sec;
  cfg.mailbox.command_timeout_sec = raw.mailbox.command_timeout_sec;
  cfg.mailbox.verify_tls = raw.mailbox.verify_tls;
  cfg.mailbox.credentials_file = std::move(raw.mailbox.credentials_file);

  cfg.session.max_per_principal = raw.session.max_per_principal;
  cfg.session.stale_after_sec = raw.session.stale_after_sec;
  cfg.session.sweep_interval_sec = raw.session.sweep_interval_sec;
  cfg.session.keepalive_interval_sec = raw.session.keepalive_interval_sec;
  cfg.session.keepalive_failure_threshold =
      raw.session.keepalive_failure_threshold;
  cfg.session.max_retries = raw.session.max_retries;
  cfg.session.backoff_base_ms = raw.session.backoff_base_ms;
  cfg.session.backoff_cap_ms = raw.session.backoff_cap_ms;
  cfg.session.backoff_jitter = raw.session.backoff_jitter;
  cfg.session.shutdown_grace_ms = raw.session.shutdown_grace_ms;

  cfg.quota.mailbox_rate = raw.quota.mailbox_rate;
  cfg.quota.mailbox_burst = raw.quota.mailbox_burst;
  cfg.quota.classify_rate = raw.quota.classify_rate;
  cfg.quota.classify_burst = raw.quota.classify_burst;
  cfg.quota.throttle_max_retries = raw.quota.throttle_max_retries;

  cfg.auth_limiter.window_sec = raw.auth_limiter.window_sec;
  cfg.auth_limiter.max_failures = raw.auth_limiter.max_failures;
  cfg.auth_limiter.max_lockout_sec = raw.auth_limiter.max_lockout_sec;

  cfg.batch.page_size = raw.batch.page_size;
  cfg.batch.classify_batch_size = raw.batch.classify_batch_size;
  cfg.batch.min_confidence = raw.batch.min_confidence;
  cfg.batch.auto_approve_confidence = raw.batch.auto_approve_confidence;

  cfg.cache.folder_ttl_sec = raw.cache.folder_ttl_sec;

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  apply_env_overrides(cfg);

  if (auto valid = ConfigLoader::validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

[[nodiscard]] auto in_unit_range(double v) noexcept -> bool {
  return v >= 0.0 && v <= 1.0;
}

} // namespace

auto ConfigLoader::validate(const SystemConfig &cfg) -> Result<void> {
  const auto &s = cfg.session;
  const auto &q = cfg.quota;
  const auto &b = cfg.batch;
  const bool session_ok =
      s.max_per_principal > 0 && s.stale_after_sec > 0 &&
      s.sweep_interval_sec > 0 && s.keepalive_interval_sec > 0 &&
      s.keepalive_failure_threshold > 0 && s.max_retries >= 0 &&
      s.backoff_base_ms > 0 && s.backoff_cap_ms >= s.backoff_base_ms &&
      s.backoff_jitter >= 0.0 && s.backoff_jitter < 1.0 &&
      s.shutdown_grace_ms >= 0;
  const bool quota_ok = q.mailbox_rate > 0.0 && q.mailbox_burst > 0 &&
                        q.classify_rate > 0.0 && q.classify_burst > 0 &&
                        q.throttle_max_retries >= 0;
  const bool limiter_ok = cfg.auth_limiter.window_sec > 0 &&
                          cfg.auth_limiter.max_failures > 0 &&
                          cfg.auth_limiter.max_lockout_sec > 0;
  const bool batch_ok = b.page_size > 0 && b.page_size <= 1000 &&
                        b.classify_batch_size > 0 &&
                        in_unit_range(b.min_confidence) &&
                        in_unit_range(b.auto_approve_confidence);
  const bool mailbox_ok = !cfg.mailbox.host.empty() &&
                          cfg.mailbox.connect_timeout_sec > 0 &&
                          cfg.mailbox.command_timeout_sec > 0;

  if (!session_ok || !quota_ok || !limiter_ok || !batch_ok || !mailbox_ok ||
      cfg.cache.folder_ttl_sec <= 0 || !log::parse_level(cfg.log.level)) {
    log::error("Configuration rejected: a size, interval, rate or "
               "confidence is out of range");
    return fail(Error::ParseError);
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML system configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_defaults() -> Result<SystemConfig> {
  try {
    SystemConfig cfg{};
    apply_env_overrides(cfg);
    if (auto valid = validate(cfg); !valid) {
      return fail(valid.error());
    }
    return ok(std::move(cfg));
  } catch (const std::exception &e) {
    log::error("Invalid MAILSYNC_* environment override: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto expand_home(std::string_view path) -> std::string {
  if (path.starts_with("~/")) {
    if (const char *home = std::getenv("HOME"); home != nullptr) {
      return std::string(home) + std::string(path.substr(1));
    }
  }
  return std::string(path);
}

} // namespace mailsync
