#pragma once

#include "mailsync/classify/classifier.hpp"
#include "mailsync/config/system_config.hpp"
#include "mailsync/core/coroutine.hpp"
#include "mailsync/core/error.hpp"
#include "mailsync/model/run.hpp"
#include "mailsync/model/suggestion.hpp"
#include "mailsync/quota/quota_guard.hpp"
#include "mailsync/util/id.hpp"
#include "mailsync/util/time.hpp"

#include <atomic>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace mailsync {

class StateStore;
class SessionManager;

struct PageReport {
  int page{0};     // 1-based within this invocation
  int fetched{0};  // items returned by the server
  int inserted{0}; // suggestions newly persisted
};

// Drives one run page by page: fetch, classify in sub-batches, commit. Only
// one page is held in memory at a time.
class BatchCoordinator {
public:
  using ProgressFn =
      std::function<void(const ProcessingRun &run, const PageReport &page)>;
  using ClockFn = std::function<util::TimePoint()>;

  BatchCoordinator(StateStore &store, SessionManager &sessions,
                   Classifier &classifier, QuotaGuard &quota,
                   const BatchConfig &batch, const CacheConfig &cache);

  auto set_progress(ProgressFn fn) -> void { progress_ = std::move(fn); }
  auto set_sleep(SleepFn sleep) -> void { sleep_ = std::move(sleep); }
  auto set_clock(ClockFn clock) -> void { clock_ = std::move(clock); }

  // Creates and persists a pending run.
  [[nodiscard]] auto create_run(const Principal &principal,
                                std::string folder, int item_limit, bool apply)
      -> task<Result<ProcessingRun>>;

  // Runs (or resumes) `run_id` until the limit is reached, the folder is
  // exhausted, a page fails or cancel() is observed at a page boundary.
  // A failed page pauses the run and returns the page's error; a cancelled
  // run is paused and returned normally.
  [[nodiscard]] auto execute(const RunId &run_id, const SessionId &session)
      -> task<Result<ProcessingRun>>;

  // User labels of the principal, served from the folder cache while fresh.
  [[nodiscard]] auto user_labels(const SessionId &session,
                                 const Principal &principal)
      -> task<Result<std::vector<Folder>>>;

  // Ranks the scores of one item and applies the confidence threshold.
  [[nodiscard]] static auto
  make_suggestion(const ProcessingRun &run, const MailItem &item,
                  std::span<const LabelScore> scores, double min_confidence,
                  util::TimePoint now) -> Suggestion;

  auto cancel() noexcept -> void {
    cancelled_.store(true, std::memory_order_release);
  }
  [[nodiscard]] auto cancel_requested() const noexcept -> bool {
    return cancelled_.load(std::memory_order_acquire);
  }

private:
  [[nodiscard]] auto now() const -> util::TimePoint { return clock_(); }

  [[nodiscard]] auto classify_page(const ProcessingRun &run,
                                   std::span<const MailItem> items,
                                   std::span<const Folder> labels)
      -> task<Result<std::vector<Suggestion>>>;

  // Records the failure on the run, pauses it and persists it.
  auto pause_on_failure(ProcessingRun &run, int page, std::string_view stage,
                        std::error_code ec) -> task<void>;

  auto persist(const ProcessingRun &run) -> task<Result<void>>;

  StateStore &store_;
  SessionManager &sessions_;
  Classifier &classifier_;
  QuotaGuard &quota_;
  BatchConfig batch_;
  CacheConfig cache_;
  ProgressFn progress_;
  SleepFn sleep_;
  ClockFn clock_;
  std::atomic<bool> cancelled_{false};
};

} // namespace mailsync
