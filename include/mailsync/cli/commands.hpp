#pragma once

#include <optional>
#include <string>
#include <vector>

namespace mailsync::cli {

struct ClassifyOptions {
  std::string config_file;
  std::optional<std::string> log_level;
  int limit{0}; // 0 = until the folder is exhausted
  bool apply{false};
  std::optional<std::string> resume; // run id
  std::optional<std::string> folder;
};

struct ReviewOptions {
  std::string config_file;
  std::optional<std::string> log_level;
  std::string run_id;
  std::optional<std::string> status;
  std::vector<std::string> approve; // suggestion ids or remote item ids
  std::vector<std::string> reject;
  std::optional<double> approve_above;
};

struct ApplyRunOptions {
  std::string config_file;
  std::optional<std::string> log_level;
  std::string run_id;
  bool auto_approve{false};
  std::optional<double> min_confidence;
};

struct ReconcileOptions {
  std::string config_file;
  std::optional<std::string> log_level;
  std::optional<std::string> run_id;
};

struct SessionsOptions {
  std::string config_file;
  std::optional<std::string> log_level;
  bool json{false};
};

struct CleanupOptions {
  std::string config_file;
  std::optional<std::string> log_level;
  int days{30};
};

struct CredentialsOptions {
  std::string config_file;
  std::optional<std::string> log_level;
  std::optional<std::string> principal; // defaults to [mailbox] principal
};

[[nodiscard]] auto cmd_classify(const ClassifyOptions &opts) -> int;
[[nodiscard]] auto cmd_review(const ReviewOptions &opts) -> int;
[[nodiscard]] auto cmd_apply(const ApplyRunOptions &opts) -> int;
[[nodiscard]] auto cmd_reconcile(const ReconcileOptions &opts) -> int;
[[nodiscard]] auto cmd_sessions(const SessionsOptions &opts) -> int;
[[nodiscard]] auto cmd_cleanup(const CleanupOptions &opts) -> int;
[[nodiscard]] auto cmd_credentials_set(const CredentialsOptions &opts) -> int;
[[nodiscard]] auto cmd_credentials_remove(const CredentialsOptions &opts)
    -> int;

} // namespace mailsync::cli
