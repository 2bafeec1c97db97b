#include "mailsync/app/application.hpp"
#include "mailsync/cli/command_support.hpp"
#include "mailsync/cli/commands.hpp"
#include "mailsync/cli/formatting.hpp"
#include "mailsync/storage/state_store.hpp"

#include <glaze/json.hpp>

#include <cerrno>
#include <csignal>
#include <map>
#include <print>

namespace mailsync::cli {

struct SessionRow {
  std::string session_id;
  std::string principal;
  std::string state;
  std::string auth_mode;
  std::int64_t owner_pid{0};
  bool owner_alive{false};
  bool stale{false};
  std::string created_at;
  std::string last_activity;
};

struct SessionsReport {
  std::vector<SessionRow> sessions;
  std::map<std::string, std::int64_t> runs;
};

} // namespace mailsync::cli

namespace glz {

template <> struct meta<mailsync::cli::SessionRow> {
  using T = mailsync::cli::SessionRow;
  static constexpr auto value =
      object("session_id", &T::session_id, "principal", &T::principal,
             "state", &T::state, "auth_mode", &T::auth_mode, "owner_pid",
             &T::owner_pid, "owner_alive", &T::owner_alive, "stale", &T::stale,
             "created_at", &T::created_at, "last_activity", &T::last_activity);
};

template <> struct meta<mailsync::cli::SessionsReport> {
  using T = mailsync::cli::SessionsReport;
  static constexpr auto value = object("sessions", &T::sessions, "runs", &T::runs);
};

} // namespace glz

namespace mailsync::cli {

namespace {

[[nodiscard]] auto process_alive(std::int64_t pid) -> bool {
  if (pid <= 0) {
    return false;
  }
  return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

} // namespace

auto cmd_sessions(const SessionsOptions &opts) -> int {
  auto cfg = load_config(opts.config_file, opts.log_level);
  if (!cfg) {
    return 1;
  }

  Application app(*cfg);
  if (auto r = app.open(); !r) {
    print_error(r.error(), "cannot open the state store");
    return 1;
  }

  auto records = app.run(app.store().list_session_records());
  if (!records) {
    print_error(records.error(), "cannot read session records");
    return 1;
  }
  auto stats = app.run(app.store().run_stats());
  if (!stats) {
    print_error(stats.error(), "cannot read run statistics");
    return 1;
  }

  const auto now = util::Clock::now();
  const auto stale_after = std::chrono::seconds(cfg->session.stale_after_sec);

  SessionsReport report;
  for (const auto &info : *records) {
    report.sessions.push_back({
        .session_id = info.id.str(),
        .principal = info.principal.str(),
        .state = std::string(to_string_view(info.state)),
        .auth_mode = std::string(to_string_view(info.auth_mode)),
        .owner_pid = info.owner_pid,
        .owner_alive = process_alive(info.owner_pid),
        .stale = info.is_stale(now, stale_after),
        .created_at = util::format_iso8601(info.created_at),
        .last_activity = util::format_iso8601(info.last_activity),
    });
  }
  for (const auto &[status, count] : *stats) {
    report.runs[std::string(to_string_view(status))] = count;
  }

  if (opts.json) {
    auto json = glz::write_json(report);
    if (!json) {
      print_error(make_error_code(Error::ParseError), "cannot encode JSON");
      return 1;
    }
    std::println("{}", *json);
    return 0;
  }

  if (report.sessions.empty()) {
    std::println("No live sessions.");
  } else {
    fmt::Table table({{.header = "SESSION", .width = 36},
                      {.header = "PRINCIPAL", .width = 28},
                      {.header = "STATE", .width = 12},
                      {.header = "MODE", .width = 8},
                      {.header = "PID", .width = 8, .right_align = true},
                      {.header = "LAST ACTIVE", .width = 16}});
    table.print_header();
    for (std::size_t i = 0; i < report.sessions.size(); ++i) {
      const auto &row = report.sessions[i];
      const auto &info = (*records)[i];
      std::string state = fmt::colorize_session_state(row.state);
      if (!row.owner_alive) {
        state = fmt::ansi::dim("orphaned");
      } else if (row.stale) {
        state = fmt::ansi::yellow("stale");
      }
      table.print_row({row.session_id, fmt::truncate(row.principal, 28), state,
                       row.auth_mode, std::to_string(row.owner_pid),
                       fmt::format_timestamp(info.last_activity)});
    }
  }

  std::println("");
  std::println("Runs:");
  if (report.runs.empty()) {
    std::println("  none");
  }
  for (const auto &[status, count] : report.runs) {
    std::println("  {}{} {:>6}", fmt::colorize_run_status(status),
                 std::string(status.size() < 12 ? 12 - status.size() : 0, ' '),
                 count);
  }
  return 0;
}

} // namespace mailsync::cli
