#include "mailsync/app/application.hpp"
#include "mailsync/cli/command_support.hpp"
#include "mailsync/cli/commands.hpp"
#include "mailsync/cli/formatting.hpp"
#include "mailsync/storage/state_store.hpp"

#include <algorithm>
#include <print>

namespace mailsync::cli {

namespace {

// Accepts a full suggestion id or the bare remote item id.
[[nodiscard]] auto resolve_suggestion_id(const RunId &run_id,
                                         std::string_view text)
    -> SuggestionId {
  if (text.find(':') != std::string_view::npos) {
    return SuggestionId{text};
  }
  return make_suggestion_id(run_id, text);
}

auto print_run_header(const ProcessingRun &run) -> void {
  std::println("Run {}  {}", fmt::ansi::bold(run.id.value()),
               fmt::colorize_run_status(to_string_view(run.status)));
  std::println("  folder: {}  created: {}", run.folder,
               fmt::format_timestamp(run.created_at));
  std::println("  progress: {} {}/{}  suggestions: {}  applied: {} ({:.0f}%)",
               fmt::ascii_bar(run.progress_percentage() / 100.0, 20),
               run.processed, run.total, run.generated, run.applied,
               run.success_rate() * 100.0);
  const std::size_t shown = std::min<std::size_t>(run.error_log.size(), 3);
  for (std::size_t i = run.error_log.size() - shown; i < run.error_log.size();
       ++i) {
    std::println("  {}", fmt::ansi::red(run.error_log[i]));
  }
}

} // namespace

auto cmd_review(const ReviewOptions &opts) -> int {
  auto cfg = load_config(opts.config_file, opts.log_level);
  if (!cfg) {
    return 1;
  }

  std::optional<SuggestionStatus> status_filter;
  if (opts.status) {
    status_filter = util::try_parse_enum<SuggestionStatus>(*opts.status);
    if (!status_filter) {
      print_error(make_error_code(Error::ValidationFailed),
                  std::format("unknown status '{}'", *opts.status));
      return 1;
    }
  }

  Application app(*cfg);
  if (auto r = app.open(); !r) {
    print_error(r.error(), "cannot open the state store");
    return 1;
  }

  const RunId run_id{opts.run_id};
  if (auto run = app.run(app.store().get_run(run_id)); !run) {
    print_error(run.error(), std::format("cannot load run {}", opts.run_id));
    return 1;
  }

  int failures = 0;
  auto move_to = [&](std::string_view text, SuggestionStatus to) {
    const auto id = resolve_suggestion_id(run_id, text);
    if (auto r = app.run(app.store().update_suggestion_status(id, to)); !r) {
      print_error(r.error(),
                  std::format("cannot mark {} {}", text, to_string_view(to)));
      ++failures;
      return;
    }
    std::println("{} -> {}", text,
                 fmt::colorize_suggestion_status(to_string_view(to)));
  };

  for (const auto &id : opts.approve) {
    move_to(id, SuggestionStatus::Approved);
  }
  for (const auto &id : opts.reject) {
    move_to(id, SuggestionStatus::Rejected);
  }

  if (opts.approve_above) {
    auto pending =
        app.run(app.store().get_suggestions(run_id, SuggestionStatus::Pending));
    if (!pending) {
      print_error(pending.error(), "cannot read pending suggestions");
      return 1;
    }
    int approved = 0;
    for (const auto &s : *pending) {
      if (s.best_label() == nullptr || s.best_confidence() < *opts.approve_above) {
        continue;
      }
      auto r = app.run(
          app.store().update_suggestion_status(s.id, SuggestionStatus::Approved));
      if (!r) {
        print_error(r.error(), std::format("cannot approve {}", s.remote_item_id));
        ++failures;
        continue;
      }
      ++approved;
    }
    std::println("Approved {} suggestion(s) at or above {}", approved,
                 fmt::format_confidence(*opts.approve_above));
  }

  auto run = app.run(app.store().get_run(run_id));
  if (!run) {
    print_error(run.error(), std::format("cannot load run {}", opts.run_id));
    return 1;
  }
  auto suggestions = app.run(app.store().get_suggestions(run_id, status_filter));
  if (!suggestions) {
    print_error(suggestions.error(), "cannot read suggestions");
    return 1;
  }

  print_run_header(*run);
  std::println("");
  if (suggestions->empty()) {
    std::println("No suggestions.");
    return failures == 0 ? 0 : 1;
  }

  fmt::Table table({{.header = "ITEM", .width = 10},
                    {.header = "STATUS", .width = 9},
                    {.header = "CONF", .width = 5, .right_align = true},
                    {.header = "LABEL", .width = 20},
                    {.header = "SUBJECT", .width = 40}});
  table.print_header();
  for (const auto &s : *suggestions) {
    const auto *best = s.best_label();
    table.print_row({
        s.remote_item_id,
        fmt::colorize_suggestion_status(to_string_view(s.status)),
        best ? fmt::format_confidence(best->confidence) : std::string{"-"},
        best ? fmt::truncate(best->label_name, 20) : std::string{"-"},
        fmt::truncate(s.subject, 40),
    });
  }
  return failures == 0 ? 0 : 1;
}

} // namespace mailsync::cli
