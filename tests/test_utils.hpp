#pragma once

#include "mailsync/classify/classifier.hpp"
#include "mailsync/config/system_config.hpp"
#include "mailsync/core/coroutine.hpp"
#include "mailsync/mailbox/transport.hpp"
#include "mailsync/storage/state_store.hpp"
#include "mailsync/util/id.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <exception>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace mailsync::test {

// Run a coroutine to completion on `io` and return its result.
// Throws if the coroutine does not complete within `timeout`.
template <typename T>
[[nodiscard]] inline auto
run_coro(boost::asio::io_context &io, task<T> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  std::exception_ptr eptr;
  std::optional<T> result;
  bool done = false;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        result.emplace(co_await std::move(coro));
        co_return;
      },
      [&](std::exception_ptr e) {
        eptr = e;
        done = true;
      });
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  io.restart();
  while (!done && std::chrono::steady_clock::now() < deadline) {
    if (io.run_one_for(std::chrono::milliseconds(50)) == 0) {
      io.restart();
    }
  }
  if (!done)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
  return std::move(*result);
}

inline auto
run_coro(boost::asio::io_context &io, task<void> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> void {
  std::exception_ptr eptr;
  bool done = false;
  boost::asio::co_spawn(io, std::move(coro), [&](std::exception_ptr e) {
    eptr = e;
    done = true;
  });
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  io.restart();
  while (!done && std::chrono::steady_clock::now() < deadline) {
    if (io.run_one_for(std::chrono::milliseconds(50)) == 0) {
      io.restart();
    }
  }
  if (!done)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
}

template <typename Predicate>
[[nodiscard]] inline auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(std::forward<Predicate>(predicate))) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return std::invoke(std::forward<Predicate>(predicate));
}

[[nodiscard]] inline auto
make_temp_dir(std::string_view prefix = "mailsync_test_") -> std::string {
  std::string templ = std::string("/tmp/") + std::string(prefix) + "XXXXXX";
  char *path = ::mkdtemp(templ.data());
  return path ? std::string(path) : "";
}

[[nodiscard]] inline auto principal(std::string_view s) -> Principal {
  return Principal{std::string{s}};
}

inline constexpr std::string_view kAppPassword = "abcd efgh ijkl mnop";

// Records every requested delay and returns immediately.
class RecordingSleep {
public:
  [[nodiscard]] auto fn() -> SleepFn {
    return [this](std::chrono::milliseconds d) -> task<void> {
      delays_.push_back(d);
      co_return;
    };
  }

  [[nodiscard]] auto delays() const -> const std::vector<std::chrono::milliseconds> & {
    return delays_;
  }
  auto clear() -> void { delays_.clear(); }

private:
  std::vector<std::chrono::milliseconds> delays_;
};

// Manually advanced wall clock.
class ManualClock {
public:
  ManualClock() : now_(util::Clock::now()) {}

  [[nodiscard]] auto now() const -> util::TimePoint { return now_; }
  auto advance(std::chrono::seconds d) -> void { now_ += d; }
  [[nodiscard]] auto fn() {
    return [this] { return now_; };
  }

private:
  util::TimePoint now_;
};

[[nodiscard]] inline auto fast_session_config() -> SessionConfig {
  SessionConfig cfg;
  cfg.backoff_jitter = 0.0;
  return cfg;
}

[[nodiscard]] inline auto generous_quota() -> QuotaConfig {
  QuotaConfig cfg;
  cfg.mailbox_rate = 1000.0;
  cfg.mailbox_burst = 10000;
  cfg.classify_rate = 1000.0;
  cfg.classify_burst = 10000;
  return cfg;
}

// Server-side state shared by every FakeTransport a factory hands out.
// Failure queues are consumed front to back, one entry per call.
struct FakeMailbox {
  std::vector<Folder> folders;
  std::map<std::string, std::vector<MailItem>> items; // folder -> items
  std::map<std::string, std::set<std::string>> labels; // item id -> labels

  std::deque<Error> connect_failures;
  std::deque<Error> auth_failures;
  std::deque<Error> noop_failures;
  std::deque<Error> fetch_failures;
  std::deque<Error> mutate_failures;
  std::deque<Error> has_label_failures;

  AuthMode mode{AuthMode::Password};
  // A real timer wait before LOGOUT completes, for servers that hang.
  std::chrono::milliseconds logout_delay{0};

  int connects{0};
  int auths{0};
  int logouts{0};
  int noops{0};
  int lists{0};
  int selects{0};
  int fetches{0};
  int mutations{0};
  int label_reads{0};
  int transports_made{0};

  [[nodiscard]] auto remote_calls() const -> int {
    return connects + auths + noops + lists + selects + fetches + mutations +
           label_reads;
  }

  auto add_label_folder(std::string name) -> void {
    folders.push_back({.name = name, .display_name = name});
  }

  // Items "1".."count" in `folder` with subjects "<subject_prefix> N".
  auto fill(std::string_view folder, int count,
            std::string_view subject_prefix = "message") -> void {
    auto &list = items[std::string(folder)];
    for (int i = 1; i <= count; ++i) {
      list.push_back({.id = std::to_string(i),
                      .subject = std::format("{} {}", subject_prefix, i),
                      .from = "sender@example.com",
                      .labels = {}});
    }
  }

  static auto take(std::deque<Error> &queue) -> std::optional<Error> {
    if (queue.empty()) {
      return std::nullopt;
    }
    auto e = queue.front();
    queue.pop_front();
    return e;
  }
};

class FakeTransport final : public MailboxTransport {
public:
  explicit FakeTransport(std::shared_ptr<FakeMailbox> box)
      : box_(std::move(box)) {}

  auto connect() -> task<Result<void>> override {
    ++box_->connects;
    if (auto e = FakeMailbox::take(box_->connect_failures)) {
      co_return fail(*e);
    }
    co_return ok();
  }

  auto authenticate(const Principal &, std::string_view)
      -> task<Result<void>> override {
    ++box_->auths;
    if (auto e = FakeMailbox::take(box_->auth_failures)) {
      co_return fail(*e);
    }
    co_return ok();
  }

  auto logout() -> task<Result<void>> override {
    ++box_->logouts;
    if (box_->logout_delay.count() > 0) {
      co_await async_sleep(box_->logout_delay);
    }
    co_return ok();
  }

  auto noop() -> task<Result<void>> override {
    ++box_->noops;
    if (auto e = FakeMailbox::take(box_->noop_failures)) {
      co_return fail(*e);
    }
    co_return ok();
  }

  auto list_folders() -> task<Result<std::vector<Folder>>> override {
    ++box_->lists;
    co_return ok(box_->folders);
  }

  auto select_folder(std::string_view folder)
      -> task<Result<FolderStatus>> override {
    ++box_->selects;
    auto it = box_->items.find(std::string(folder));
    if (it == box_->items.end()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(FolderStatus{.exists = static_cast<std::int64_t>(it->second.size()),
                              .uid_validity = 1});
  }

  auto fetch_page(std::string_view folder, std::string_view cursor, int limit)
      -> task<Result<MailPage>> override {
    ++box_->fetches;
    if (auto e = FakeMailbox::take(box_->fetch_failures)) {
      co_return fail(*e);
    }
    auto it = box_->items.find(std::string(folder));
    if (it == box_->items.end()) {
      co_return fail(Error::NotFound);
    }
    const long after = cursor.empty() ? 0 : std::stol(std::string(cursor));
    MailPage page;
    std::size_t idx = 0;
    const auto &all = it->second;
    while (idx < all.size() && std::stol(all[idx].id) <= after) {
      ++idx;
    }
    while (idx < all.size() && static_cast<int>(page.items.size()) < limit) {
      page.items.push_back(all[idx++]);
    }
    page.exhausted = idx >= all.size();
    page.next_cursor = page.items.empty() ? std::string(cursor)
                                          : page.items.back().id;
    co_return ok(std::move(page));
  }

  auto mutate_label(std::string_view, std::string_view item_id,
                    std::string_view label, MutationOp op)
      -> task<Result<void>> override {
    ++box_->mutations;
    if (auto e = FakeMailbox::take(box_->mutate_failures)) {
      co_return fail(*e);
    }
    auto &set = box_->labels[std::string(item_id)];
    if (op == MutationOp::AddLabel) {
      set.insert(std::string(label));
    } else {
      set.erase(std::string(label));
    }
    co_return ok();
  }

  auto has_label(std::string_view, std::string_view item_id,
                 std::string_view label) -> task<Result<bool>> override {
    ++box_->label_reads;
    if (auto e = FakeMailbox::take(box_->has_label_failures)) {
      co_return fail(*e);
    }
    auto it = box_->labels.find(std::string(item_id));
    co_return ok(it != box_->labels.end() &&
                 it->second.contains(std::string(label)));
  }

  [[nodiscard]] auto auth_mode() const noexcept -> AuthMode override {
    return box_->mode;
  }

private:
  std::shared_ptr<FakeMailbox> box_;
};

[[nodiscard]] inline auto fake_factory(std::shared_ptr<FakeMailbox> box)
    -> TransportFactory {
  return [box]() -> std::unique_ptr<MailboxTransport> {
    ++box->transports_made;
    return std::make_unique<FakeTransport>(box);
  };
}

// Gives every item one score for the first label, or fails on request.
class FixedClassifier final : public Classifier {
public:
  explicit FixedClassifier(double confidence) : confidence_(confidence) {}

  auto classify(std::span<const MailItem> batch, std::span<const Folder> labels)
      -> task<Result<std::vector<LabelScore>>> override {
    ++calls;
    if (fail_next) {
      fail_next = false;
      co_return fail(Error::ProtocolError);
    }
    std::vector<LabelScore> out;
    if (labels.empty()) {
      co_return ok(std::move(out));
    }
    for (const auto &item : batch) {
      out.push_back({.item_id = item.id,
                     .label_id = labels.front().name,
                     .label_name = labels.front().display_name,
                     .confidence = confidence_,
                     .reasoning = "fixed"});
    }
    co_return ok(std::move(out));
  }

  [[nodiscard]] auto name() const noexcept -> std::string_view override {
    return "fixed";
  }

  int calls{0};
  bool fail_next{false};

private:
  double confidence_;
};

// StateStore kept in memory with the same transactional semantics as the
// MySQL store. fail_next_* flags make the next call of that operation fail
// without changing anything.
class InMemoryStateStore final : public StateStore {
public:
  bool fail_next_commit_page{false};
  bool fail_next_complete{false};
  bool fail_next_append{false};

  auto open() -> task<Result<void>> override {
    open_ = true;
    co_return ok();
  }
  auto close() -> task<void> override {
    open_ = false;
    co_return;
  }
  [[nodiscard]] auto is_open() const noexcept -> bool override { return open_; }

  // === Runs ===
  auto save_run(const ProcessingRun &run) -> task<Result<void>> override {
    std::lock_guard lock(mu_);
    if (runs_.contains(run.id.str())) {
      co_return fail(Error::AlreadyExists);
    }
    runs_.emplace(run.id.str(), run);
    co_return ok();
  }

  auto update_run(const ProcessingRun &run) -> task<Result<void>> override {
    std::lock_guard lock(mu_);
    auto it = runs_.find(run.id.str());
    if (it == runs_.end()) {
      co_return fail(Error::NotFound);
    }
    it->second = run;
    co_return ok();
  }

  auto get_run(const RunId &id) -> task<Result<ProcessingRun>> override {
    std::lock_guard lock(mu_);
    auto it = runs_.find(id.str());
    if (it == runs_.end()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(it->second);
  }

  auto list_runs(const RunQuery &query)
      -> task<Result<std::vector<ProcessingRun>>> override {
    std::lock_guard lock(mu_);
    std::vector<ProcessingRun> out;
    for (const auto &[id, run] : runs_) {
      if (query.principal && run.principal != *query.principal)
        continue;
      if (query.status && run.status != *query.status)
        continue;
      out.push_back(run);
    }
    std::ranges::sort(out, [](const auto &a, const auto &b) {
      return a.created_at > b.created_at;
    });
    if (out.size() > query.limit)
      out.resize(query.limit);
    co_return ok(std::move(out));
  }

  auto run_stats() -> task<Result<RunStats>> override {
    std::lock_guard lock(mu_);
    RunStats stats;
    for (const auto &[id, run] : runs_) {
      ++stats[run.status];
    }
    co_return ok(std::move(stats));
  }

  auto delete_runs_before(TimePoint cutoff)
      -> task<Result<std::size_t>> override {
    std::lock_guard lock(mu_);
    co_return ok(erase_runs_before(cutoff));
  }

  // === Suggestions ===
  auto save_suggestion(const Suggestion &s) -> task<Result<bool>> override {
    std::lock_guard lock(mu_);
    co_return ok(insert_suggestion(s));
  }

  auto get_suggestion(const SuggestionId &id)
      -> task<Result<Suggestion>> override {
    std::lock_guard lock(mu_);
    auto *s = find_suggestion(id);
    if (s == nullptr) {
      co_return fail(Error::NotFound);
    }
    co_return ok(*s);
  }

  auto get_suggestions(const RunId &run_id,
                       std::optional<SuggestionStatus> status)
      -> task<Result<std::vector<Suggestion>>> override {
    std::lock_guard lock(mu_);
    std::vector<Suggestion> out;
    for (const auto &s : suggestions_) {
      if (s.run_id == run_id && (!status || s.status == *status)) {
        out.push_back(s);
      }
    }
    co_return ok(std::move(out));
  }

  auto update_suggestion_status(const SuggestionId &id, SuggestionStatus to)
      -> task<Result<void>> override {
    std::lock_guard lock(mu_);
    auto *s = find_suggestion(id);
    if (s == nullptr) {
      co_return fail(Error::NotFound);
    }
    co_return s->transition(to, util::Clock::now());
  }

  // === Batch ===
  auto commit_page(const RunId &run_id, std::span<const Suggestion> page,
                   std::string_view next_cursor) -> task<Result<int>> override {
    std::lock_guard lock(mu_);
    ++commit_calls;
    if (std::exchange(fail_next_commit_page, false)) {
      co_return fail(Error::DatabaseQueryFailed);
    }
    auto it = runs_.find(run_id.str());
    if (it == runs_.end()) {
      co_return fail(Error::NotFound);
    }
    int inserted = 0;
    int generated = 0;
    for (const auto &s : page) {
      if (insert_suggestion(s)) {
        ++inserted;
        if (s.status != SuggestionStatus::NoMatch) {
          ++generated;
        }
      }
    }
    it->second.cursor = std::string(next_cursor);
    it->second.processed += inserted;
    it->second.generated += generated;
    it->second.updated_at = util::Clock::now();
    co_return ok(inserted);
  }

  // === Audit ===
  auto append_audit_entry(const AuditLogEntry &entry)
      -> task<Result<std::int64_t>> override {
    std::lock_guard lock(mu_);
    if (std::exchange(fail_next_append, false)) {
      co_return fail(Error::DatabaseQueryFailed);
    }
    auto copy = entry;
    copy.id = ++audit_seq_;
    copy.synced = false;
    audit_.push_back(copy);
    co_return ok(copy.id);
  }

  auto list_unsynced_audit(const AuditQuery &query)
      -> task<Result<std::vector<AuditLogEntry>>> override {
    std::lock_guard lock(mu_);
    std::vector<AuditLogEntry> out;
    for (const auto &e : audit_) {
      if (e.synced || (query.run_id && e.run_id != *query.run_id)) {
        continue;
      }
      if (query.principal) {
        auto run = runs_.find(e.run_id.str());
        if (run == runs_.end() || run->second.principal != *query.principal) {
          continue;
        }
      }
      out.push_back(e);
    }
    co_return ok(std::move(out));
  }

  auto record_audit_error(std::int64_t audit_id, std::string_view message)
      -> task<Result<void>> override {
    std::lock_guard lock(mu_);
    auto *e = find_audit(audit_id);
    if (e == nullptr) {
      co_return fail(Error::NotFound);
    }
    e->last_error = std::string(message);
    co_return ok();
  }

  auto complete_mutation(std::int64_t audit_id) -> task<Result<void>> override {
    std::lock_guard lock(mu_);
    if (std::exchange(fail_next_complete, false)) {
      co_return fail(Error::DatabaseQueryFailed);
    }
    auto *e = find_audit(audit_id);
    if (e == nullptr) {
      co_return fail(Error::NotFound);
    }
    if (e->synced) {
      co_return ok();
    }
    auto *s = find_suggestion(e->suggestion_id);
    if (s == nullptr) {
      co_return fail(Error::NotFound);
    }
    if (s->status != SuggestionStatus::Applied &&
        !can_transition(s->status, SuggestionStatus::Applied)) {
      co_return fail(Error::InvalidState);
    }
    mark_applied(*s);
    e->synced = true;
    e->synced_at = util::Clock::now();
    e->outcome = RemoteOutcome::Applied;
    e->last_error.clear();
    co_return ok();
  }

  auto resolve_audit_entry(std::int64_t audit_id, bool remote_present)
      -> task<Result<RemoteOutcome>> override {
    std::lock_guard lock(mu_);
    auto *e = find_audit(audit_id);
    if (e == nullptr) {
      co_return fail(Error::NotFound);
    }
    if (e->synced) {
      co_return ok(e->outcome);
    }
    const bool took_effect =
        e->op == MutationOp::AddLabel ? remote_present : !remote_present;
    const auto outcome =
        took_effect ? RemoteOutcome::Applied : RemoteOutcome::Absent;
    if (took_effect) {
      if (auto *s = find_suggestion(e->suggestion_id);
          s != nullptr && s->status == SuggestionStatus::Approved) {
        mark_applied(*s);
      }
    }
    e->synced = true;
    e->synced_at = util::Clock::now();
    e->outcome = outcome;
    co_return ok(outcome);
  }

  // === Folder cache ===
  auto put_folder_cache(const Principal &principal,
                        std::span<const Folder> folders, TimePoint expires_at)
      -> task<Result<void>> override {
    std::lock_guard lock(mu_);
    cache_[principal.str()] = {
        std::vector<Folder>(folders.begin(), folders.end()), expires_at};
    co_return ok();
  }

  auto get_folder_cache(const Principal &principal, TimePoint now)
      -> task<Result<std::optional<std::vector<Folder>>>> override {
    std::lock_guard lock(mu_);
    auto it = cache_.find(principal.str());
    if (it == cache_.end() || it->second.second <= now) {
      co_return ok(std::optional<std::vector<Folder>>{});
    }
    co_return ok(std::optional<std::vector<Folder>>{it->second.first});
  }

  // === Sessions ===
  auto save_session_record(const SessionInfo &info)
      -> task<Result<void>> override {
    std::lock_guard lock(mu_);
    session_records_[info.id.str()] = info;
    co_return ok();
  }

  auto delete_session_record(const SessionId &id)
      -> task<Result<void>> override {
    std::lock_guard lock(mu_);
    session_records_.erase(id.str());
    co_return ok();
  }

  auto list_session_records()
      -> task<Result<std::vector<SessionInfo>>> override {
    std::lock_guard lock(mu_);
    std::vector<SessionInfo> out;
    for (const auto &[id, info] : session_records_) {
      out.push_back(info);
    }
    co_return ok(std::move(out));
  }

  // === Maintenance ===
  auto cleanup(TimePoint cutoff) -> task<Result<CleanupReport>> override {
    std::lock_guard lock(mu_);
    CleanupReport report;
    const auto audit_before = audit_.size();
    report.runs = erase_runs_before(cutoff);
    report.audit_entries = audit_before - audit_.size();
    report.audit_entries += std::erase_if(audit_, [&](const AuditLogEntry &e) {
      return e.synced && e.synced_at < cutoff;
    });
    report.session_records = std::erase_if(session_records_, [&](const auto &kv) {
      return kv.second.last_activity < cutoff;
    });
    report.cache_entries = std::erase_if(cache_, [&](const auto &kv) {
      return kv.second.second < cutoff;
    });
    co_return ok(report);
  }

  // Test inspection.
  [[nodiscard]] auto audit_entries() const -> std::vector<AuditLogEntry> {
    std::lock_guard lock(mu_);
    return audit_;
  }
  [[nodiscard]] auto suggestion_count(const RunId &run_id) const -> int {
    std::lock_guard lock(mu_);
    return static_cast<int>(std::ranges::count_if(
        suggestions_, [&](const Suggestion &s) { return s.run_id == run_id; }));
  }
  [[nodiscard]] auto session_record_count() const -> std::size_t {
    std::lock_guard lock(mu_);
    return session_records_.size();
  }

  int commit_calls{0};

private:
  auto find_suggestion(const SuggestionId &id) -> Suggestion * {
    auto it = std::ranges::find_if(
        suggestions_, [&](const Suggestion &s) { return s.id == id; });
    return it == suggestions_.end() ? nullptr : &*it;
  }

  auto find_audit(std::int64_t id) -> AuditLogEntry * {
    auto it = std::ranges::find_if(
        audit_, [&](const AuditLogEntry &e) { return e.id == id; });
    return it == audit_.end() ? nullptr : &*it;
  }

  auto insert_suggestion(const Suggestion &s) -> bool {
    const bool dup = std::ranges::any_of(suggestions_, [&](const Suggestion &x) {
      return x.run_id == s.run_id && x.remote_item_id == s.remote_item_id;
    });
    if (dup) {
      return false;
    }
    suggestions_.push_back(s);
    return true;
  }

  auto mark_applied(Suggestion &s) -> void {
    if (s.status == SuggestionStatus::Applied) {
      return;
    }
    s.status = SuggestionStatus::Applied;
    s.updated_at = util::Clock::now();
    if (auto it = runs_.find(s.run_id.str()); it != runs_.end()) {
      ++it->second.applied;
    }
  }

  auto erase_runs_before(TimePoint cutoff) -> std::size_t {
    std::set<std::string> doomed;
    for (const auto &[id, run] : runs_) {
      if (run.is_finished() && run.finished_at < cutoff) {
        doomed.insert(id);
      }
    }
    std::erase_if(suggestions_, [&](const Suggestion &s) {
      return doomed.contains(s.run_id.str());
    });
    std::erase_if(audit_, [&](const AuditLogEntry &e) {
      return doomed.contains(e.run_id.str());
    });
    for (const auto &id : doomed) {
      runs_.erase(id);
    }
    return doomed.size();
  }

  mutable std::mutex mu_;
  bool open_{false};
  std::map<std::string, ProcessingRun> runs_;
  std::vector<Suggestion> suggestions_;
  std::vector<AuditLogEntry> audit_;
  std::int64_t audit_seq_{0};
  std::map<std::string, std::pair<std::vector<Folder>, TimePoint>> cache_;
  std::map<std::string, SessionInfo> session_records_;
};

} // namespace mailsync::test
