#include "mailsync/app/application.hpp"
#include "mailsync/cli/command_support.hpp"
#include "mailsync/cli/commands.hpp"
#include "mailsync/cli/formatting.hpp"
#include "mailsync/storage/state_store.hpp"
#include "mailsync/sync/reconciler.hpp"

#include <print>

namespace mailsync::cli {

auto cmd_apply(const ApplyRunOptions &opts) -> int {
  auto cfg = load_config(opts.config_file, opts.log_level);
  if (!cfg) {
    return 1;
  }

  Application app(*cfg);
  if (auto r = app.open(); !r) {
    print_error(r.error(), "cannot open the state store");
    return 1;
  }

  auto run = app.run(app.store().get_run(RunId{opts.run_id}));
  if (!run) {
    print_error(run.error(), std::format("cannot load run {}", opts.run_id));
    return 1;
  }

  auto session = open_session(app, run->principal);
  if (!session) {
    return 1;
  }

  ApplyOptions apply_opts{
      .auto_approve = opts.auto_approve,
      .auto_approve_confidence = cfg->batch.auto_approve_confidence,
      .min_confidence = opts.min_confidence.value_or(cfg->batch.min_confidence),
  };
  auto report = app.run(app.reconciler().apply_run(run->id, *session, apply_opts));
  if (!report) {
    print_error(report.error(), std::format("applying run {} failed", run->id));
    return 1;
  }

  std::println("Run {}", fmt::ansi::bold(run->id.value()));
  print_apply_report(*report);
  return report->failed == 0 && report->inconsistent == 0 ? 0 : 1;
}

} // namespace mailsync::cli
