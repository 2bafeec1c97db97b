#include "mailsync/sync/reconciler.hpp"

#include "mailsync/session/session_manager.hpp"
#include "mailsync/storage/state_store.hpp"
#include "mailsync/util/log.hpp"
#include "mailsync/util/redact.hpp"

#include <algorithm>
#include <unordered_set>

namespace mailsync {

Reconciler::Reconciler(StateStore &store, SessionManager &sessions)
    : store_(store), sessions_(sessions),
      clock_([] { return util::Clock::now(); }) {}

auto Reconciler::apply_run(const RunId &run_id, const SessionId &session,
                           const ApplyOptions &options)
    -> task<Result<ApplyReport>> {
  auto run = co_await store_.get_run(run_id);
  if (!run) {
    co_return fail(run.error());
  }
  auto owner = sessions_.find(session);
  if (!owner) {
    co_return fail(Error::NotFound);
  }
  // Item ids are only meaningful inside the mailbox the run was read from.
  if (owner->principal != run->principal) {
    log::warn("Run {} belongs to another user than session {}", run_id,
              session);
    co_return fail(Error::InvalidArgument);
  }

  ApplyReport report;

  if (options.auto_approve) {
    const double threshold =
        std::max(options.auto_approve_confidence, options.min_confidence);
    auto pending =
        co_await store_.get_suggestions(run_id, SuggestionStatus::Pending);
    if (!pending) {
      co_return fail(pending.error());
    }
    for (const auto &s : *pending) {
      if (s.best_label() == nullptr || s.best_confidence() < threshold) {
        continue;
      }
      auto approved =
          co_await store_.update_suggestion_status(s.id, SuggestionStatus::Approved);
      if (!approved) {
        log::warn("Auto-approve of {} failed: {}", s.id,
                  approved.error().message());
        continue;
      }
      ++report.approved;
    }
    log::info("Run {}: auto-approved {} suggestion(s) at >= {:.2f}", run_id,
              report.approved, threshold);
  }

  auto approved =
      co_await store_.get_suggestions(run_id, SuggestionStatus::Approved);
  if (!approved) {
    co_return fail(approved.error());
  }

  // A suggestion with an unsynced entry has a mutation of unknown outcome;
  // only reconcile may settle it.
  auto in_flight = co_await store_.list_unsynced_audit({.run_id = run_id});
  if (!in_flight) {
    co_return fail(in_flight.error());
  }
  std::unordered_set<SuggestionId> unsettled;
  for (const auto &entry : *in_flight) {
    unsettled.insert(entry.suggestion_id);
  }

  for (const auto &s : *approved) {
    const auto *label = s.best_label();
    if (label == nullptr || s.best_confidence() < options.min_confidence ||
        unsettled.contains(s.id)) {
      ++report.skipped;
      continue;
    }

    AuditLogEntry entry;
    entry.run_id = run_id;
    entry.suggestion_id = s.id;
    entry.op = MutationOp::AddLabel;
    entry.item_id = s.remote_item_id;
    entry.folder = s.folder;
    entry.label = label->label_id;
    entry.attempted_at = now();

    auto audit_id = co_await store_.append_audit_entry(entry);
    if (!audit_id) {
      log::error("Audit entry for {} not written, mutation skipped: {}", s.id,
                 audit_id.error().message());
      ++report.failed;
      continue;
    }

    auto remote = co_await sessions_.mutate_label(
        session, s.folder, s.remote_item_id, label->label_id,
        MutationOp::AddLabel);
    if (!remote) {
      const auto reason = util::sanitize_error(remote.error().message());
      if (auto recorded = co_await store_.record_audit_error(*audit_id, reason);
          !recorded) {
        log::warn("Audit entry {} error not recorded: {}", *audit_id,
                  recorded.error().message());
      }
      log::warn("Labelling item {} as {} failed: {}", s.remote_item_id,
                label->label_name, reason);
      ++report.failed;
      continue;
    }

    if (auto done = co_await store_.complete_mutation(*audit_id); !done) {
      log::error("[{}] item {} labelled remotely but local commit failed "
                 "({}); audit entry {} left for reconcile",
                 error_kind(make_error_code(Error::DataIntegrity)),
                 s.remote_item_id, done.error().message(), *audit_id);
      ++report.inconsistent;
      continue;
    }
    ++report.applied;
  }

  log::info("Run {} apply: {} applied, {} failed, {} inconsistent, {} skipped",
            run_id, report.applied, report.failed, report.inconsistent,
            report.skipped);
  co_return ok(report);
}

auto Reconciler::reconcile(const std::optional<RunId> &run_id,
                           const SessionId &session)
    -> task<Result<ReconcileReport>> {
  auto owner = sessions_.find(session);
  if (!owner) {
    co_return fail(Error::NotFound);
  }
  // Entries of other users' runs are left for a session on their mailbox.
  auto entries = co_await store_.list_unsynced_audit(
      {.run_id = run_id, .principal = owner->principal});
  if (!entries) {
    co_return fail(entries.error());
  }

  ReconcileReport report;
  if (!entries->empty()) {
    log::warn("[{}] {} unsynced audit entr{} to reconcile",
              error_kind(make_error_code(Error::DataIntegrity)),
              entries->size(), entries->size() == 1 ? "y" : "ies");
  }

  for (const auto &entry : *entries) {
    ++report.examined;

    auto present = co_await sessions_.has_label(session, entry.folder,
                                                entry.item_id, entry.label);
    if (!present) {
      ++report.errors;
      const auto reason = util::sanitize_error(present.error().message());
      if (auto recorded = co_await store_.record_audit_error(entry.id, reason);
          !recorded) {
        log::warn("Audit entry {} error not recorded: {}", entry.id,
                  recorded.error().message());
      }
      log::warn("Audit entry {}: remote state unreadable: {}", entry.id,
                reason);
      continue;
    }

    auto outcome = co_await store_.resolve_audit_entry(entry.id, *present);
    if (!outcome) {
      ++report.errors;
      log::error("Audit entry {} could not be resolved: {}", entry.id,
                 outcome.error().message());
      continue;
    }
    if (*outcome == RemoteOutcome::Applied) {
      ++report.repaired;
    } else {
      ++report.confirmed_absent;
    }
    log::debug("Audit entry {} for item {}: {}", entry.id, entry.item_id,
               to_string_view(*outcome));
  }

  log::info("Reconcile: {} examined, {} repaired, {} confirmed absent, {} "
            "error(s)",
            report.examined, report.repaired, report.confirmed_absent,
            report.errors);
  co_return ok(report);
}

} // namespace mailsync
