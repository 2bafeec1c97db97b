#pragma once

#include "mailsync/config/system_config.hpp"
#include "mailsync/storage/state_store.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/pool_params.hpp>

#include <atomic>

namespace mailsync::storage {

class MySQLStateStore final : public StateStore {
public:
  explicit MySQLStateStore(boost::asio::any_io_executor executor,
                           const DatabaseConfig &config);
  ~MySQLStateStore() override;

  MySQLStateStore(const MySQLStateStore &) = delete;
  MySQLStateStore &operator=(const MySQLStateStore &) = delete;

  auto open() -> task<Result<void>> override;
  auto close() -> task<void> override;
  [[nodiscard]] auto is_open() const noexcept -> bool override;

  auto save_run(const ProcessingRun &run) -> task<Result<void>> override;
  auto update_run(const ProcessingRun &run) -> task<Result<void>> override;
  auto get_run(const RunId &id) -> task<Result<ProcessingRun>> override;
  auto list_runs(const RunQuery &query)
      -> task<Result<std::vector<ProcessingRun>>> override;
  auto run_stats() -> task<Result<RunStats>> override;
  auto delete_runs_before(TimePoint cutoff)
      -> task<Result<std::size_t>> override;

  auto save_suggestion(const Suggestion &s) -> task<Result<bool>> override;
  auto get_suggestion(const SuggestionId &id)
      -> task<Result<Suggestion>> override;
  auto get_suggestions(const RunId &run_id,
                       std::optional<SuggestionStatus> status)
      -> task<Result<std::vector<Suggestion>>> override;
  auto update_suggestion_status(const SuggestionId &id, SuggestionStatus to)
      -> task<Result<void>> override;

  auto commit_page(const RunId &run_id, std::span<const Suggestion> suggestions,
                   std::string_view next_cursor) -> task<Result<int>> override;

  auto append_audit_entry(const AuditLogEntry &entry)
      -> task<Result<std::int64_t>> override;
  auto list_unsynced_audit(const AuditQuery &query)
      -> task<Result<std::vector<AuditLogEntry>>> override;
  auto record_audit_error(std::int64_t audit_id, std::string_view message)
      -> task<Result<void>> override;
  auto complete_mutation(std::int64_t audit_id) -> task<Result<void>> override;
  auto resolve_audit_entry(std::int64_t audit_id, bool remote_present)
      -> task<Result<RemoteOutcome>> override;

  auto put_folder_cache(const Principal &principal,
                        std::span<const Folder> folders, TimePoint expires_at)
      -> task<Result<void>> override;
  auto get_folder_cache(const Principal &principal, TimePoint now)
      -> task<Result<std::optional<std::vector<Folder>>>> override;

  auto save_session_record(const SessionInfo &info)
      -> task<Result<void>> override;
  auto delete_session_record(const SessionId &id)
      -> task<Result<void>> override;
  auto list_session_records()
      -> task<Result<std::vector<SessionInfo>>> override;

  auto cleanup(TimePoint cutoff) -> task<Result<CleanupReport>> override;

  [[nodiscard]] auto schema_version() const noexcept -> int {
    return schema_version_.load(std::memory_order_acquire);
  }

private:
  auto ensure_database_exists() -> task<Result<void>>;
  auto get_connection() -> task<Result<boost::mysql::pooled_connection>>;
  auto apply_migrations(boost::mysql::any_connection &conn)
      -> task<Result<void>>;

  DatabaseConfig cfg_;
  boost::mysql::connection_pool pool_;
  std::atomic<bool> open_{false};
  std::atomic<int> schema_version_{0};
};

} // namespace mailsync::storage
