#include "mailsync/app/application.hpp"
#include "mailsync/cli/command_support.hpp"
#include "mailsync/cli/commands.hpp"
#include "mailsync/storage/state_store.hpp"

#include <print>

namespace mailsync::cli {

auto cmd_cleanup(const CleanupOptions &opts) -> int {
  auto cfg = load_config(opts.config_file, opts.log_level);
  if (!cfg) {
    return 1;
  }
  if (opts.days <= 0) {
    print_error(make_error_code(Error::ValidationFailed),
                "--days must be positive");
    return 1;
  }

  Application app(*cfg);
  if (auto r = app.open(); !r) {
    print_error(r.error(), "cannot open the state store");
    return 1;
  }

  const auto cutoff = util::Clock::now() - std::chrono::days(opts.days);
  auto report = app.run(app.store().cleanup(cutoff));
  if (!report) {
    print_error(report.error(), "cleanup failed");
    return 1;
  }

  std::println("Removed data older than {} day(s):", opts.days);
  std::println("  runs:            {}", report->runs);
  std::println("  audit entries:   {}", report->audit_entries);
  std::println("  session records: {}", report->session_records);
  std::println("  cache entries:   {}", report->cache_entries);
  return 0;
}

} // namespace mailsync::cli
