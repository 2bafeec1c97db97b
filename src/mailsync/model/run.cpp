#include "mailsync/model/run.hpp"

#include "mailsync/util/log.hpp"

#include <format>

namespace mailsync {

namespace {

[[nodiscard]] auto transition(ProcessingRun &run, RunStatus expected,
                              RunStatus to, util::TimePoint now)
    -> Result<void> {
  if (run.status != expected) {
    log::debug("Run {} cannot move from {} to {}", run.id,
               to_string_view(run.status), to_string_view(to));
    return mailsync::fail(Error::InvalidState);
  }
  run.status = to;
  run.updated_at = now;
  return ok();
}

} // namespace

auto ProcessingRun::create(Principal principal, std::string folder,
                           int item_limit, bool apply, util::TimePoint now)
    -> ProcessingRun {
  ProcessingRun run;
  run.id = generate_run_id();
  run.principal = std::move(principal);
  run.folder = std::move(folder);
  run.item_limit = item_limit;
  run.apply = apply;
  run.total = item_limit;
  run.created_at = now;
  run.updated_at = now;
  return run;
}

auto ProcessingRun::start(util::TimePoint now) -> Result<void> {
  return transition(*this, RunStatus::Pending, RunStatus::InProgress, now);
}

auto ProcessingRun::pause(util::TimePoint now) -> Result<void> {
  return transition(*this, RunStatus::InProgress, RunStatus::Paused, now);
}

auto ProcessingRun::resume(util::TimePoint now) -> Result<void> {
  return transition(*this, RunStatus::Paused, RunStatus::InProgress, now);
}

auto ProcessingRun::complete(util::TimePoint now) -> Result<void> {
  if (auto r = transition(*this, RunStatus::InProgress, RunStatus::Completed,
                          now);
      !r) {
    return r;
  }
  finished_at = now;
  return ok();
}

auto ProcessingRun::fail(std::string_view reason, util::TimePoint now)
    -> Result<void> {
  if (is_terminal(status)) {
    return mailsync::fail(Error::InvalidState);
  }
  if (!reason.empty()) {
    add_error(reason, now);
  }
  status = RunStatus::Failed;
  updated_at = now;
  finished_at = now;
  return ok();
}

auto ProcessingRun::add_error(std::string_view message, util::TimePoint now)
    -> void {
  error_log.push_back(
      std::format("[{}] {}", util::format_iso8601(now), message));
  updated_at = now;
}

auto ProcessingRun::progress_percentage() const noexcept -> double {
  if (total <= 0) {
    return 0.0;
  }
  return static_cast<double>(processed) * 100.0 / static_cast<double>(total);
}

auto ProcessingRun::success_rate() const noexcept -> double {
  if (generated <= 0) {
    return 0.0;
  }
  return static_cast<double>(applied) / static_cast<double>(generated);
}

} // namespace mailsync
