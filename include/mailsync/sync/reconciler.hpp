#pragma once

#include "mailsync/core/coroutine.hpp"
#include "mailsync/core/error.hpp"
#include "mailsync/util/id.hpp"
#include "mailsync/util/time.hpp"

#include <functional>
#include <optional>

namespace mailsync {

class StateStore;
class SessionManager;

struct ApplyOptions {
  // Approve pending suggestions scoring at least auto_approve_confidence.
  bool auto_approve{false};
  double auto_approve_confidence{0.8};
  // Approved suggestions below this are skipped.
  double min_confidence{0.5};
};

struct ApplyReport {
  int approved{0}; // auto-approved in this call
  int applied{0};
  int failed{0};
  int inconsistent{0};
  int skipped{0};
};

struct ReconcileReport {
  int examined{0};
  int repaired{0};
  int confirmed_absent{0};
  int errors{0};
};

// Pushes approved suggestions to the mailbox under the audit protocol and
// repairs entries left unsynced by a crash or a failed local commit.
//
// Every mutation is preceded by an audit entry. The entry is marked synced
// only in the transaction that moves the suggestion to applied, so an
// unsynced entry always means "remote state unknown".
class Reconciler {
public:
  using ClockFn = std::function<util::TimePoint()>;

  Reconciler(StateStore &store, SessionManager &sessions);

  auto set_clock(ClockFn clock) -> void { clock_ = std::move(clock); }

  [[nodiscard]] auto apply_run(const RunId &run_id, const SessionId &session,
                               const ApplyOptions &options)
      -> task<Result<ApplyReport>>;

  // Reads the label state of every unsynced entry (all runs of the session's
  // user when `run_id` is empty) and records it locally. Never mutates the
  // mailbox.
  [[nodiscard]] auto reconcile(const std::optional<RunId> &run_id,
                               const SessionId &session)
      -> task<Result<ReconcileReport>>;

private:
  [[nodiscard]] auto now() const -> util::TimePoint { return clock_(); }

  StateStore &store_;
  SessionManager &sessions_;
  ClockFn clock_;
};

} // namespace mailsync
