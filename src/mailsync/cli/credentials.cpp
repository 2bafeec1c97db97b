#include "mailsync/cli/command_support.hpp"
#include "mailsync/cli/commands.hpp"
#include "mailsync/config/config.hpp"
#include "mailsync/mailbox/credentials.hpp"

#include <unistd.h>

#include <cstdlib>
#include <print>

namespace mailsync::cli {

namespace {

[[nodiscard]] auto read_new_secret(AuthMode mode, const Principal &principal)
    -> std::optional<std::string> {
  if (const char *env = std::getenv("MAILSYNC_SECRET"); env && *env) {
    return std::string{env};
  }
  if (::isatty(STDIN_FILENO) == 0) {
    print_error(make_error_code(Error::ValidationFailed),
                "no terminal to prompt on; pass the secret in MAILSYNC_SECRET");
    return std::nullopt;
  }

  const auto what = mode == AuthMode::OAuth ? "Access token" : "Password";
  auto first = prompt_secret(std::format("{} for {}: ", what, principal));
  if (!first) {
    print_error(make_error_code(Error::ValidationFailed), "no secret entered");
    return std::nullopt;
  }
  auto again = prompt_secret(std::format("Repeat {}: ", what));
  if (!again || *again != *first) {
    print_error(make_error_code(Error::ValidationFailed),
                "the two entries differ");
    return std::nullopt;
  }
  return first;
}

} // namespace

auto cmd_credentials_set(const CredentialsOptions &opts) -> int {
  auto cfg = load_config(opts.config_file, opts.log_level);
  if (!cfg) {
    return 1;
  }
  auto principal = configured_principal(*cfg, opts.principal);
  if (!principal) {
    return 1;
  }

  const auto mode = cfg->mailbox.auth_mode;
  auto secret = read_new_secret(mode, *principal);
  if (!secret) {
    return 1;
  }
  if (auto problem = secret_problem(mode, *secret)) {
    print_error(make_error_code(Error::ValidationFailed), *problem);
    return 1;
  }

  FileCredentialStore store(expand_home(cfg->mailbox.credentials_file));
  if (auto r = store.put(*principal, normalize_secret(mode, *secret)); !r) {
    print_error(r.error(),
                std::format("cannot write {}", store.path().string()));
    return 1;
  }
  std::println("Stored {} secret for {} in {}", to_string_view(mode),
               *principal, store.path().string());
  return 0;
}

auto cmd_credentials_remove(const CredentialsOptions &opts) -> int {
  auto cfg = load_config(opts.config_file, opts.log_level);
  if (!cfg) {
    return 1;
  }
  auto principal = configured_principal(*cfg, opts.principal);
  if (!principal) {
    return 1;
  }

  FileCredentialStore store(expand_home(cfg->mailbox.credentials_file));
  auto removed = store.remove(*principal);
  if (!removed) {
    print_error(removed.error(),
                std::format("cannot update {}", store.path().string()));
    return 1;
  }
  if (*removed) {
    std::println("Removed stored secret for {}", *principal);
  } else {
    std::println("No stored secret for {}", *principal);
  }
  return 0;
}

} // namespace mailsync::cli
