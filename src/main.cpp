#include "mailsync/cli/commands.hpp"
#include "mailsync/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <optional>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("MAILSYNC_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_common(CLI::App *cmd, std::string &config_file,
                std::optional<std::string> &log_level,
                const std::string &env_config) -> void {
  config_file = env_config;
  cmd->add_option("-c,--config", config_file, "System config file")
      ->check(CLI::ExistingFile);
  cmd->add_option("--log-level", log_level,
                  "Log level override: trace|debug|info|warn|error");
}
} // namespace

int main(int argc, char *argv[]) {
  // Diagnostics go to stderr so command output stays clean.
  mailsync::log::set_output_stderr();
  mailsync::log::set_level(mailsync::log::Level::Warn);
  mailsync::log::ScopedLogger logger;

  CLI::App app{"mailsync", "Mailbox label classification and sync"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  mailsync credentials set -c mailsync.toml\n"
             "  mailsync classify -c mailsync.toml --limit 500\n"
             "  mailsync review -c mailsync.toml <run-id> --approve-above 0.8\n"
             "  mailsync apply -c mailsync.toml <run-id>\n"
             "\nTip: Set MAILSYNC_CONFIG=mailsync.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();
  int exit_code = 0;

  mailsync::cli::ClassifyOptions classify_opts;
  auto *classify =
      app.add_subcommand("classify", "Fetch mail and generate label suggestions");
  add_common(classify, classify_opts.config_file, classify_opts.log_level,
             env_config);
  classify->add_option("-n,--limit", classify_opts.limit,
                       "Maximum items to process (0 = whole folder)")
      ->check(CLI::NonNegativeNumber);
  classify->add_option("-f,--folder", classify_opts.folder,
                       "Folder to read (default: [mailbox] folder)");
  classify->add_flag("--apply", classify_opts.apply,
                     "Approve confident suggestions and apply them");
  classify->add_option("--resume", classify_opts.resume,
                       "Continue a paused run by id");
  classify->callback(
      [&] { exit_code = mailsync::cli::cmd_classify(classify_opts); });

  mailsync::cli::ReviewOptions review_opts;
  auto *review = app.add_subcommand("review", "Inspect and approve suggestions");
  add_common(review, review_opts.config_file, review_opts.log_level,
             env_config);
  review->add_option("run_id", review_opts.run_id, "Run ID")->required();
  review->add_option("-s,--status", review_opts.status,
                     "Filter: pending|approved|rejected|applied|no_match");
  review->add_option("--approve", review_opts.approve,
                     "Suggestion or item ids to approve")
      ->delimiter(',');
  review->add_option("--reject", review_opts.reject,
                     "Suggestion or item ids to reject")
      ->delimiter(',');
  review->add_option("--approve-above", review_opts.approve_above,
                     "Approve pending suggestions at or above a confidence")
      ->check(CLI::Range(0.0, 1.0));
  review->callback([&] { exit_code = mailsync::cli::cmd_review(review_opts); });

  mailsync::cli::ApplyRunOptions apply_opts;
  auto *apply =
      app.add_subcommand("apply", "Apply approved labels to the mailbox");
  add_common(apply, apply_opts.config_file, apply_opts.log_level, env_config);
  apply->add_option("run_id", apply_opts.run_id, "Run ID")->required();
  apply->add_flag("--auto-approve", apply_opts.auto_approve,
                  "Approve pending suggestions above the configured threshold");
  apply->add_option("--min-confidence", apply_opts.min_confidence,
                    "Skip suggestions below this confidence")
      ->check(CLI::Range(0.0, 1.0));
  apply->callback([&] { exit_code = mailsync::cli::cmd_apply(apply_opts); });

  mailsync::cli::ReconcileOptions reconcile_opts;
  auto *reconcile = app.add_subcommand(
      "reconcile", "Settle label changes left unconfirmed by a failure");
  add_common(reconcile, reconcile_opts.config_file, reconcile_opts.log_level,
             env_config);
  reconcile->add_option("run_id", reconcile_opts.run_id,
                        "Limit to one run (default: all)");
  reconcile->callback(
      [&] { exit_code = mailsync::cli::cmd_reconcile(reconcile_opts); });

  mailsync::cli::SessionsOptions sessions_opts;
  auto *sessions =
      app.add_subcommand("sessions", "Show session records and run totals");
  add_common(sessions, sessions_opts.config_file, sessions_opts.log_level,
             env_config);
  sessions->add_flag("--json", sessions_opts.json, "Output JSON");
  sessions->callback(
      [&] { exit_code = mailsync::cli::cmd_sessions(sessions_opts); });

  mailsync::cli::CleanupOptions cleanup_opts;
  auto *cleanup =
      app.add_subcommand("cleanup", "Delete old runs, audit entries and caches");
  add_common(cleanup, cleanup_opts.config_file, cleanup_opts.log_level,
             env_config);
  cleanup->add_option("-d,--days", cleanup_opts.days,
                      "Keep data newer than this many days")
      ->check(CLI::PositiveNumber);
  cleanup->callback(
      [&] { exit_code = mailsync::cli::cmd_cleanup(cleanup_opts); });

  auto *credentials =
      app.add_subcommand("credentials", "Manage stored mailbox secrets");
  credentials->require_subcommand(1);

  mailsync::cli::CredentialsOptions cred_set_opts;
  auto *cred_set =
      credentials->add_subcommand("set", "Store a password or access token");
  add_common(cred_set, cred_set_opts.config_file, cred_set_opts.log_level,
             env_config);
  cred_set->add_option("-p,--principal", cred_set_opts.principal,
                       "Mailbox address (default: [mailbox] principal)");
  cred_set->callback(
      [&] { exit_code = mailsync::cli::cmd_credentials_set(cred_set_opts); });

  mailsync::cli::CredentialsOptions cred_remove_opts;
  auto *cred_remove =
      credentials->add_subcommand("remove", "Forget a stored secret");
  add_common(cred_remove, cred_remove_opts.config_file,
             cred_remove_opts.log_level, env_config);
  cred_remove->add_option("-p,--principal", cred_remove_opts.principal,
                          "Mailbox address (default: [mailbox] principal)");
  cred_remove->callback([&] {
    exit_code = mailsync::cli::cmd_credentials_remove(cred_remove_opts);
  });

  CLI11_PARSE(app, argc, argv);
  return exit_code;
}
