#pragma once

#include "mailsync/config/system_config.hpp"
#include "mailsync/util/id.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace mailsync {
class Application;
struct ApplyReport;
} // namespace mailsync

namespace mailsync::cli {

// Prints "error[<kind>]: <context>: <message>" to stderr.
auto print_error(std::error_code ec, std::string_view context) -> void;

// Loads the file (defaults plus environment when `path` is empty) and points
// logging at stderr or the configured file. Reports failures itself.
[[nodiscard]] auto load_config(std::string_view path,
                               const std::optional<std::string> &log_level)
    -> std::optional<SystemConfig>;

// `override_principal` or [mailbox] principal, validated.
[[nodiscard]] auto
configured_principal(const SystemConfig &cfg,
                     const std::optional<std::string> &override_principal = {})
    -> std::optional<Principal>;

// Reads one line from the terminal with echo disabled.
[[nodiscard]] auto prompt_secret(std::string_view prompt)
    -> std::optional<std::string>;

// Finds the secret (environment, credential store, prompt) and
// authenticates. Prints an actionable message on failure.
[[nodiscard]] auto open_session(Application &app, const Principal &principal)
    -> std::optional<SessionId>;

auto print_apply_report(const ApplyReport &report) -> void;

} // namespace mailsync::cli
