#include "mailsync/app/application.hpp"
#include "mailsync/cli/command_support.hpp"
#include "mailsync/cli/commands.hpp"
#include "mailsync/cli/formatting.hpp"
#include "mailsync/storage/state_store.hpp"
#include "mailsync/sync/batch_coordinator.hpp"
#include "mailsync/sync/reconciler.hpp"

#include <map>
#include <print>

namespace mailsync::cli {

namespace {

auto print_category_summary(Application &app, const RunId &run_id) -> void {
  auto suggestions = app.run(app.store().get_suggestions(run_id, std::nullopt));
  if (!suggestions) {
    print_error(suggestions.error(), "cannot read suggestions");
    return;
  }
  std::map<ConfidenceCategory, int> by_category;
  for (const auto &s : *suggestions) {
    ++by_category[s.category];
  }
  std::println("  high: {}  medium: {}  low: {}  no match: {}",
               by_category[ConfidenceCategory::High],
               by_category[ConfidenceCategory::Medium],
               by_category[ConfidenceCategory::Low],
               by_category[ConfidenceCategory::NoMatch]);
}

} // namespace

auto cmd_classify(const ClassifyOptions &opts) -> int {
  auto cfg = load_config(opts.config_file, opts.log_level);
  if (!cfg) {
    return 1;
  }
  auto principal = configured_principal(*cfg);
  if (!principal) {
    return 1;
  }

  Application app(*cfg);
  if (auto r = app.open(); !r) {
    print_error(r.error(), "cannot open the state store");
    return 1;
  }

  RunId run_id;
  bool apply = opts.apply;
  if (opts.resume) {
    auto run = app.run(app.store().get_run(RunId{*opts.resume}));
    if (!run) {
      print_error(run.error(), std::format("cannot load run {}", *opts.resume));
      return 1;
    }
    if (run->principal != *principal) {
      print_error(make_error_code(Error::ValidationFailed),
                  std::format("run {} belongs to another principal",
                              *opts.resume));
      return 1;
    }
    if (run->is_finished()) {
      print_error(make_error_code(Error::InvalidState),
                  std::format("run {} is already {}", run->id,
                              to_string_view(run->status)));
      return 1;
    }
    run_id = run->id;
    apply = apply || run->apply;
  }

  auto session = open_session(app, *principal);
  if (!session) {
    return 1;
  }

  if (!opts.resume) {
    auto created = app.run(app.batch().create_run(
        *principal, opts.folder.value_or(cfg->mailbox.folder), opts.limit,
        apply));
    if (!created) {
      print_error(created.error(), "cannot create a run");
      return 1;
    }
    run_id = created->id;
    std::println("Run {} started", fmt::ansi::bold(run_id.value()));
  } else {
    std::println("Resuming run {}", fmt::ansi::bold(run_id.value()));
  }

  app.batch().set_progress([](const ProcessingRun &run, const PageReport &page) {
    std::println("  page {:>3}: {:>4} fetched, {:>4} new {} {}/{}", page.page,
                 page.fetched, page.inserted,
                 fmt::ascii_bar(run.progress_percentage() / 100.0, 20),
                 run.processed, run.total);
  });

  auto result = app.run(app.batch().execute(run_id, *session));
  if (!result) {
    print_error(result.error(), std::format("run {} stopped", run_id));
    if (auto run = app.run(app.store().get_run(run_id));
        run && run->status == RunStatus::Paused) {
      std::println(stderr, "Resume with: mailsync classify --resume {}",
                   run_id);
    }
    return 1;
  }

  std::println("Run {}: {}", run_id,
               fmt::colorize_run_status(to_string_view(result->status)));
  std::println("  processed: {}  suggestions: {}", result->processed,
               result->generated);
  print_category_summary(app, run_id);

  if (result->status == RunStatus::Paused) {
    if (app.interrupted()) {
      std::println(stderr, "Interrupted; the last committed page is kept.");
    }
    std::println("Resume with: mailsync classify --resume {}", run_id);
    return 1;
  }

  if (!apply) {
    std::println("Review with: mailsync review {}", run_id);
    return 0;
  }

  ApplyOptions apply_opts{
      .auto_approve = true,
      .auto_approve_confidence = cfg->batch.auto_approve_confidence,
      .min_confidence = cfg->batch.min_confidence,
  };
  auto report =
      app.run(app.reconciler().apply_run(run_id, *session, apply_opts));
  if (!report) {
    print_error(report.error(), std::format("applying run {} failed", run_id));
    return 1;
  }
  print_apply_report(*report);
  return report->failed == 0 && report->inconsistent == 0 ? 0 : 1;
}

} // namespace mailsync::cli
