#include "mailsync/app/application.hpp"
#include "mailsync/cli/command_support.hpp"
#include "mailsync/cli/commands.hpp"
#include "mailsync/cli/formatting.hpp"
#include "mailsync/storage/state_store.hpp"
#include "mailsync/sync/reconciler.hpp"

#include <print>

namespace mailsync::cli {

auto cmd_reconcile(const ReconcileOptions &opts) -> int {
  auto cfg = load_config(opts.config_file, opts.log_level);
  if (!cfg) {
    return 1;
  }

  Application app(*cfg);
  if (auto r = app.open(); !r) {
    print_error(r.error(), "cannot open the state store");
    return 1;
  }

  std::optional<RunId> run_id;
  std::optional<Principal> principal;
  if (opts.run_id) {
    auto run = app.run(app.store().get_run(RunId{*opts.run_id}));
    if (!run) {
      print_error(run.error(), std::format("cannot load run {}", *opts.run_id));
      return 1;
    }
    run_id = run->id;
    principal = run->principal;
  } else {
    principal = configured_principal(*cfg);
    if (!principal) {
      return 1;
    }
  }

  // Nothing to read remotely when every entry is already settled.
  auto pending = app.run(app.store().list_unsynced_audit(
      {.run_id = run_id, .principal = principal}));
  if (!pending) {
    print_error(pending.error(), "cannot read the audit log");
    return 1;
  }
  if (pending->empty()) {
    std::println("Nothing to reconcile.");
    return 0;
  }

  auto session = open_session(app, *principal);
  if (!session) {
    return 1;
  }

  auto report = app.run(app.reconciler().reconcile(run_id, *session));
  if (!report) {
    print_error(report.error(), "reconciliation failed");
    return 1;
  }

  std::println("Examined:          {}", report->examined);
  std::println("Repaired:          {}",
               fmt::ansi::green(std::to_string(report->repaired)));
  std::println("Confirmed absent:  {}", report->confirmed_absent);
  std::println("Errors:            {}",
               report->errors > 0 ? fmt::ansi::red(std::to_string(report->errors))
                                  : std::string{"0"});
  if (report->confirmed_absent > 0) {
    std::println("Labels confirmed absent stay approved; run 'mailsync apply' "
                 "to retry them.");
  }
  return report->errors == 0 ? 0 : 1;
}

} // namespace mailsync::cli
