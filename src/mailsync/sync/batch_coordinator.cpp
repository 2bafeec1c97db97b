#include "mailsync/sync/batch_coordinator.hpp"

#include "mailsync/session/session_manager.hpp"
#include "mailsync/storage/state_store.hpp"
#include "mailsync/util/log.hpp"
#include "mailsync/util/redact.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <unordered_set>

namespace mailsync {

BatchCoordinator::BatchCoordinator(StateStore &store, SessionManager &sessions,
                                   Classifier &classifier, QuotaGuard &quota,
                                   const BatchConfig &batch,
                                   const CacheConfig &cache)
    : store_(store), sessions_(sessions), classifier_(classifier),
      quota_(quota), batch_(batch), cache_(cache), sleep_(default_sleep()),
      clock_([] { return util::Clock::now(); }) {}

auto BatchCoordinator::create_run(const Principal &principal,
                                  std::string folder, int item_limit,
                                  bool apply) -> task<Result<ProcessingRun>> {
  auto run = ProcessingRun::create(principal, std::move(folder),
                                   std::max(0, item_limit), apply, now());
  if (auto saved = co_await store_.save_run(run); !saved) {
    log::error("Failed to create run: {}", saved.error().message());
    co_return fail(saved.error());
  }
  log::info("Created run {} for user {} (folder {}, limit {})", run.id,
            util::hash_principal(principal.value()), run.folder,
            run.item_limit);
  co_return ok(std::move(run));
}

auto BatchCoordinator::persist(const ProcessingRun &run) -> task<Result<void>> {
  co_return co_await store_.update_run(run);
}

auto BatchCoordinator::pause_on_failure(ProcessingRun &run, int page,
                                        std::string_view stage,
                                        std::error_code ec) -> task<void> {
  const auto t = now();
  run.add_error(std::format("page {} {} failed: {}", page, stage,
                            util::sanitize_error(ec.message())),
                t);
  if (run.status == RunStatus::InProgress) {
    if (auto paused = run.pause(t); !paused) {
      log::warn("Run {} could not be paused: {}", run.id,
                paused.error().message());
    }
  }
  if (auto saved = co_await persist(run); !saved) {
    log::error("Run {} failure could not be recorded: {}", run.id,
               saved.error().message());
  }
  log::warn("Run {} paused at page {} after {} failure: {}", run.id, page,
            stage, ec.message());
}

// === Labels ===

auto BatchCoordinator::user_labels(const SessionId &session,
                                   const Principal &principal)
    -> task<Result<std::vector<Folder>>> {
  const auto t = now();
  std::vector<Folder> folders;

  auto cached = co_await store_.get_folder_cache(principal, t);
  if (cached && cached->has_value()) {
    folders = std::move(**cached);
    log::debug("Folder list for user {} served from cache",
               util::hash_principal(principal.value()));
  } else {
    if (!cached) {
      log::warn("Folder cache read failed: {}", cached.error().message());
    }
    auto listed = co_await sessions_.list_folders(session);
    if (!listed) {
      co_return fail(listed.error());
    }
    folders = std::move(*listed);
    const auto expires = t + std::chrono::seconds(cache_.folder_ttl_sec);
    if (auto put = co_await store_.put_folder_cache(principal, folders, expires);
        !put) {
      log::warn("Folder cache write failed: {}", put.error().message());
    }
  }

  std::erase_if(folders, [](const Folder &f) { return !f.is_user_label(); });
  co_return ok(std::move(folders));
}

// === Classification ===

auto BatchCoordinator::make_suggestion(const ProcessingRun &run,
                                       const MailItem &item,
                                       std::span<const LabelScore> scores,
                                       double min_confidence,
                                       util::TimePoint now) -> Suggestion {
  std::vector<const LabelScore *> mine;
  for (const auto &score : scores) {
    if (score.item_id == item.id && std::isfinite(score.confidence)) {
      mine.push_back(&score);
    }
  }
  std::ranges::stable_sort(mine, [](const LabelScore *a, const LabelScore *b) {
    return a->confidence > b->confidence;
  });

  Suggestion s;
  s.id = make_suggestion_id(run.id, item.id);
  s.run_id = run.id;
  s.remote_item_id = item.id;
  s.folder = run.folder;
  s.subject = item.subject;
  s.created_at = now;
  s.updated_at = now;

  std::unordered_set<std::string_view> seen;
  for (const auto *score : mine) {
    if (!seen.insert(score->label_id).second) {
      continue;
    }
    s.labels.push_back({.label_id = score->label_id,
                        .label_name = score->label_name,
                        .confidence = std::clamp(score->confidence, 0.0, 1.0),
                        .rank = static_cast<int>(s.labels.size()) + 1});
  }

  const double best = s.best_confidence();
  if (s.labels.empty()) {
    s.status = SuggestionStatus::NoMatch;
    s.category = ConfidenceCategory::NoMatch;
    s.reasoning = "no label matched";
  } else if (best < min_confidence) {
    s.status = SuggestionStatus::NoMatch;
    s.category = ConfidenceCategory::NoMatch;
    s.reasoning = std::format("best score {:.2f} is below {:.2f}", best,
                              min_confidence);
  } else {
    s.status = SuggestionStatus::Pending;
    s.category = categorize(best);
    s.reasoning = mine.front()->reasoning;
  }
  return s;
}

auto BatchCoordinator::classify_page(const ProcessingRun &run,
                                     std::span<const MailItem> items,
                                     std::span<const Folder> labels)
    -> task<Result<std::vector<Suggestion>>> {
  const auto chunk = static_cast<std::size_t>(std::max(1, batch_.classify_batch_size));
  std::vector<Suggestion> out;
  out.reserve(items.size());

  for (std::size_t start = 0; start < items.size(); start += chunk) {
    const auto batch = items.subspan(start, std::min(chunk, items.size() - start));
    if (auto q = co_await quota_.acquire_or_wait(QuotaScope::Classify, sleep_);
        !q) {
      co_return fail(q.error());
    }
    auto scores = co_await classifier_.classify(batch, labels);
    if (!scores) {
      co_return fail(scores.error());
    }
    const auto t = now();
    for (const auto &item : batch) {
      out.push_back(
          make_suggestion(run, item, *scores, batch_.min_confidence, t));
    }
  }
  co_return ok(std::move(out));
}

// === Run loop ===

auto BatchCoordinator::execute(const RunId &run_id, const SessionId &session)
    -> task<Result<ProcessingRun>> {
  cancelled_.store(false, std::memory_order_release);

  auto loaded = co_await store_.get_run(run_id);
  if (!loaded) {
    co_return fail(loaded.error());
  }
  auto run = std::move(*loaded);
  if (run.is_finished()) {
    log::warn("Run {} is already {}", run.id, to_string_view(run.status));
    co_return fail(Error::InvalidState);
  }

  // in_progress means the previous process died mid-run; continue as is.
  if (run.status == RunStatus::Paused) {
    if (auto r = run.resume(now()); !r) {
      co_return fail(r.error());
    }
  } else if (run.status == RunStatus::Pending) {
    if (auto r = run.start(now()); !r) {
      co_return fail(r.error());
    }
  }

  auto labels = co_await user_labels(session, run.principal);
  if (!labels) {
    co_await pause_on_failure(run, 0, "label listing", labels.error());
    co_return fail(labels.error());
  }
  if (labels->empty()) {
    if (auto r = run.fail("no user labels available to classify into", now());
        !r) {
      co_return fail(r.error());
    }
    if (auto saved = co_await persist(run); !saved) {
      log::error("Run {} failure could not be recorded: {}", run.id,
                 saved.error().message());
    }
    log::error("Run {} failed: the mailbox has no user labels", run.id);
    co_return fail(Error::ValidationFailed);
  }

  auto status = co_await sessions_.select_folder(session, run.folder);
  if (!status) {
    if (status.error() == Error::NotFound) {
      if (auto r = run.fail(std::format("folder {} not found", run.folder),
                            now());
          !r) {
        co_return fail(r.error());
      }
      if (auto saved = co_await persist(run); !saved) {
        log::error("Run {} failure could not be recorded: {}", run.id,
                   saved.error().message());
      }
      co_return fail(Error::NotFound);
    }
    co_await pause_on_failure(run, 0, "select", status.error());
    co_return fail(status.error());
  }
  if (run.processed == 0) {
    const auto exists = static_cast<int>(status->exists);
    run.total = run.item_limit > 0 ? std::min(run.item_limit, exists) : exists;
  }

  if (auto saved = co_await persist(run); !saved) {
    co_return fail(saved.error());
  }
  log::info("Run {} {} at cursor '{}' ({} of {} processed, {} label(s))",
            run.id, run.processed == 0 ? "starting" : "resuming", run.cursor,
            run.processed, run.total, labels->size());

  const int page_size = std::max(1, batch_.page_size);
  int page_no = 0;
  while (run.item_limit == 0 || run.processed < run.item_limit) {
    if (cancel_requested()) {
      if (auto r = run.pause(now()); !r) {
        co_return fail(r.error());
      }
      if (auto saved = co_await persist(run); !saved) {
        co_return fail(saved.error());
      }
      log::info("Run {} paused on request after {} item(s)", run.id,
                run.processed);
      co_return ok(std::move(run));
    }

    const int size = run.item_limit > 0
                         ? std::min(page_size, run.item_limit - run.processed)
                         : page_size;
    ++page_no;

    PageReport report{.page = page_no};
    bool exhausted = false;
    {
      auto page = co_await sessions_.fetch_page(session, run.folder,
                                                run.cursor, size);
      if (!page) {
        co_await pause_on_failure(run, page_no, "fetch", page.error());
        co_return fail(page.error());
      }
      report.fetched = static_cast<int>(page->items.size());
      exhausted = page->exhausted || page->items.empty();

      if (!page->items.empty()) {
        auto suggestions = co_await classify_page(run, page->items, *labels);
        if (!suggestions) {
          co_await pause_on_failure(run, page_no, "classify",
                                    suggestions.error());
          co_return fail(suggestions.error());
        }

        const auto cursor =
            page->next_cursor.empty() ? run.cursor : page->next_cursor;
        auto inserted = co_await store_.commit_page(run.id, *suggestions, cursor);
        if (!inserted) {
          co_await pause_on_failure(run, page_no, "commit", inserted.error());
          co_return fail(inserted.error());
        }
        report.inserted = *inserted;

        // The store owns the counters; the committed page is durable even if
        // this read fails, and the next invocation resumes after it.
        auto fresh = co_await store_.get_run(run.id);
        if (!fresh) {
          log::error("Run {} reload after page {} failed: {}", run.id,
                     page_no, fresh.error().message());
          co_return fail(fresh.error());
        }
        run = std::move(*fresh);
      }
    }

    log::debug("Run {} page {}: {} fetched, {} new", run.id, page_no,
               report.fetched, report.inserted);
    if (progress_) {
      progress_(run, report);
    }
    if (exhausted) {
      break;
    }
  }

  if (auto r = run.complete(now()); !r) {
    co_return fail(r.error());
  }
  if (auto saved = co_await persist(run); !saved) {
    co_return fail(saved.error());
  }
  log::info("Run {} completed: {} processed, {} suggestion(s)", run.id,
            run.processed, run.generated);
  co_return ok(std::move(run));
}

} // namespace mailsync
