#pragma once

#include "mailsync/core/coroutine.hpp"
#include "mailsync/core/error.hpp"
#include "mailsync/model/audit.hpp"
#include "mailsync/model/mailbox.hpp"
#include "mailsync/model/run.hpp"
#include "mailsync/model/session.hpp"
#include "mailsync/model/suggestion.hpp"
#include "mailsync/util/id.hpp"
#include "mailsync/util/time.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mailsync {

struct RunQuery {
  std::optional<Principal> principal;
  std::optional<RunStatus> status;
  std::size_t limit{50};
};

// Unset fields match every unsynced entry. `principal` is the owner of the
// entry's run.
struct AuditQuery {
  std::optional<RunId> run_id;
  std::optional<Principal> principal;
};

struct CleanupReport {
  std::size_t runs{0};
  std::size_t audit_entries{0};
  std::size_t session_records{0};
  std::size_t cache_entries{0};
};

using RunStats = std::map<RunStatus, std::int64_t>;

// Durable local state. Every write runs in exactly one transaction; a failed
// write leaves nothing behind.
class StateStore {
public:
  using TimePoint = util::TimePoint;

  virtual ~StateStore() = default;

  // Lifecycle. open() applies pending schema migrations.
  virtual auto open() -> task<Result<void>> = 0;
  virtual auto close() -> task<void> = 0;
  [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;

  // === Runs ===
  virtual auto save_run(const ProcessingRun &run) -> task<Result<void>> = 0;
  virtual auto update_run(const ProcessingRun &run) -> task<Result<void>> = 0;
  virtual auto get_run(const RunId &id) -> task<Result<ProcessingRun>> = 0;
  virtual auto list_runs(const RunQuery &query)
      -> task<Result<std::vector<ProcessingRun>>> = 0;
  virtual auto run_stats() -> task<Result<RunStats>> = 0;
  // Deletes terminal runs finished before `cutoff`, with their suggestions
  // and audit entries.
  virtual auto delete_runs_before(TimePoint cutoff)
      -> task<Result<std::size_t>> = 0;

  // === Suggestions ===
  // Returns false when the run already holds a suggestion for the item.
  virtual auto save_suggestion(const Suggestion &s) -> task<Result<bool>> = 0;
  virtual auto get_suggestion(const SuggestionId &id)
      -> task<Result<Suggestion>> = 0;
  virtual auto get_suggestions(const RunId &run_id,
                               std::optional<SuggestionStatus> status)
      -> task<Result<std::vector<Suggestion>>> = 0;
  // InvalidState when the state machine forbids the move.
  virtual auto update_suggestion_status(const SuggestionId &id,
                                        SuggestionStatus to)
      -> task<Result<void>> = 0;

  // === Batch ===
  // Inserts the page (duplicates by remote item id ignored), stores the new
  // cursor and bumps processed/generated by what was actually inserted.
  // Returns the number of new suggestions.
  virtual auto commit_page(const RunId &run_id,
                           std::span<const Suggestion> suggestions,
                           std::string_view next_cursor) -> task<Result<int>> = 0;

  // === Audit ===
  virtual auto append_audit_entry(const AuditLogEntry &entry)
      -> task<Result<std::int64_t>> = 0;
  virtual auto list_unsynced_audit(const AuditQuery &query)
      -> task<Result<std::vector<AuditLogEntry>>> = 0;
  virtual auto record_audit_error(std::int64_t audit_id,
                                  std::string_view message)
      -> task<Result<void>> = 0;
  // Suggestion -> applied, run.applied + 1, entry synced; one transaction.
  virtual auto complete_mutation(std::int64_t audit_id)
      -> task<Result<void>> = 0;
  // Aligns local state with what the server reports for the entry's item
  // and marks the entry synced. Returns the recorded outcome.
  virtual auto resolve_audit_entry(std::int64_t audit_id, bool remote_present)
      -> task<Result<RemoteOutcome>> = 0;

  // === Folder cache ===
  virtual auto put_folder_cache(const Principal &principal,
                                std::span<const Folder> folders,
                                TimePoint expires_at) -> task<Result<void>> = 0;
  // nullopt when missing or expired at `now`.
  virtual auto get_folder_cache(const Principal &principal, TimePoint now)
      -> task<Result<std::optional<std::vector<Folder>>>> = 0;

  // === Sessions ===
  virtual auto save_session_record(const SessionInfo &info)
      -> task<Result<void>> = 0;
  virtual auto delete_session_record(const SessionId &id)
      -> task<Result<void>> = 0;
  virtual auto list_session_records()
      -> task<Result<std::vector<SessionInfo>>> = 0;

  // === Maintenance ===
  virtual auto cleanup(TimePoint cutoff) -> task<Result<CleanupReport>> = 0;
};

} // namespace mailsync
