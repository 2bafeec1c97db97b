#include "mailsync/cli/command_support.hpp"

#include "mailsync/app/application.hpp"
#include "mailsync/cli/formatting.hpp"
#include "mailsync/config/config.hpp"
#include "mailsync/mailbox/credentials.hpp"
#include "mailsync/sync/reconciler.hpp"
#include "mailsync/util/log.hpp"

#include <termios.h>
#include <unistd.h>

#include <iostream>
#include <print>

namespace mailsync::cli {

auto print_error(std::error_code ec, std::string_view context) -> void {
  std::println(stderr, "{}: {}: {}",
               fmt::ansi::red(std::format("error[{}]", error_kind(ec))),
               context, ec.message());
}

auto load_config(std::string_view path,
                 const std::optional<std::string> &log_level)
    -> std::optional<SystemConfig> {
  log::set_output_stderr();
  auto cfg = path.empty() ? ConfigLoader::load_defaults()
                          : ConfigLoader::load_from_file(path);
  if (!cfg) {
    print_error(cfg.error(), path.empty()
                                 ? std::string{"invalid configuration"}
                                 : std::format("cannot load {}", path));
    return std::nullopt;
  }

  const auto level = log_level.value_or(cfg->log.level);
  if (!log::parse_level(level)) {
    print_error(make_error_code(Error::ValidationFailed),
                std::format("unknown log level '{}'", level));
    return std::nullopt;
  }
  log::set_level(level);
  if (!cfg->log.file.empty() && !log::set_output_file(cfg->log.file)) {
    std::println(stderr, "warning: cannot open log file {}, logging to stderr",
                 cfg->log.file);
  }
  return cfg;
}

auto configured_principal(const SystemConfig &cfg,
                          const std::optional<std::string> &override_principal)
    -> std::optional<Principal> {
  const std::string value = override_principal.value_or(cfg.mailbox.principal);
  if (value.empty()) {
    print_error(make_error_code(Error::ValidationFailed),
                "no principal configured; set [mailbox] principal or "
                "MAILSYNC_PRINCIPAL");
    return std::nullopt;
  }
  if (auto problem = principal_problem(value)) {
    print_error(make_error_code(Error::ValidationFailed),
                std::format("principal '{}': {}", value, *problem));
    return std::nullopt;
  }
  return Principal{value};
}

auto prompt_secret(std::string_view prompt) -> std::optional<std::string> {
  std::print(stderr, "{}", prompt);
  std::fflush(stderr);

  termios saved{};
  const bool restore = ::tcgetattr(STDIN_FILENO, &saved) == 0;
  if (restore) {
    termios silent = saved;
    silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) != 0) {
      log::warn("Cannot disable terminal echo");
    }
  }

  std::string line;
  const bool got = static_cast<bool>(std::getline(std::cin, line));

  if (restore && ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved) != 0) {
    log::warn("Cannot restore terminal settings");
  }
  std::println(stderr, "");

  if (!got || line.empty()) {
    return std::nullopt;
  }
  return line;
}

auto open_session(Application &app, const Principal &principal)
    -> std::optional<SessionId> {
  const auto &cfg = app.config();

  auto stored = app.stored_secret(principal);
  if (!stored) {
    print_error(stored.error(), "cannot read the credential store");
    return std::nullopt;
  }

  std::string secret;
  if (*stored) {
    secret = std::move(**stored);
  } else if (::isatty(STDIN_FILENO) != 0) {
    auto typed = prompt_secret(
        std::format("{} for {}: ",
                    cfg.mailbox.auth_mode == AuthMode::OAuth ? "Access token"
                                                             : "Password",
                    principal));
    if (!typed) {
      print_error(make_error_code(Error::ValidationFailed),
                  "no secret entered");
      return std::nullopt;
    }
    secret = std::move(*typed);
  } else {
    print_error(make_error_code(Error::ValidationFailed),
                std::format("no secret for {}; set MAILSYNC_SECRET or run "
                            "'mailsync credentials set'",
                            principal));
    return std::nullopt;
  }

  auto reason = secret_problem(cfg.mailbox.auth_mode, secret);
  auto id = app.run(app.connect(principal, std::move(secret)));
  if (id) {
    return *id;
  }

  const auto ec = id.error();
  if (ec == Error::LockedOut) {
    print_error(ec, std::format("too many failed logins for {}; try again in {}",
                                principal,
                                util::format_duration(
                                    app.lockout_remaining(principal))));
  } else if (ec == Error::AuthenticationFailed) {
    print_error(ec, std::format("login rejected for {}; check the secret "
                                "(Gmail requires an app password or an OAuth "
                                "access token)",
                                principal));
  } else if (ec == Error::ValidationFailed) {
    print_error(ec, std::format("secret rejected before login: {}",
                                reason.value_or("malformed value")));
  } else if (ec == Error::Unsupported) {
    print_error(ec, std::format("{} does not offer {} login",
                                cfg.mailbox.host,
                                to_string_view(cfg.mailbox.auth_mode)));
  } else if (is_transient(ec)) {
    print_error(ec, std::format("cannot reach {}:{}; check the network and "
                                "[mailbox] host/port",
                                cfg.mailbox.host, cfg.mailbox.port));
  } else {
    print_error(ec, "cannot open a mailbox session");
  }
  return std::nullopt;
}

auto print_apply_report(const ApplyReport &report) -> void {
  if (report.approved > 0) {
    std::println("Auto-approved: {}", report.approved);
  }
  std::println("Applied:       {}", fmt::ansi::green(std::to_string(report.applied)));
  std::println("Failed:        {}",
               report.failed > 0 ? fmt::ansi::red(std::to_string(report.failed))
                                 : std::string{"0"});
  std::println("Inconsistent:  {}",
               report.inconsistent > 0
                   ? fmt::ansi::yellow(std::to_string(report.inconsistent))
                   : std::string{"0"});
  std::println("Skipped:       {}", report.skipped);
  if (report.inconsistent > 0) {
    std::println("Some labels were applied remotely but not recorded locally; "
                 "run 'mailsync reconcile' to repair.");
  }
}

} // namespace mailsync::cli
