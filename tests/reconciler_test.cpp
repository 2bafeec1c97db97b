#include "mailsync/quota/auth_attempt_limiter.hpp"
#include "mailsync/quota/quota_guard.hpp"
#include "mailsync/session/session_manager.hpp"
#include "mailsync/sync/reconciler.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace mailsync;
using namespace mailsync::test;
using namespace std::chrono_literals;

class ReconcilerTest : public ::testing::Test {
protected:
  void SetUp() override {
    box_ = std::make_shared<FakeMailbox>();
    box_->add_label_folder("Work");
    box_->fill("INBOX", 10);

    sessions_ = std::make_unique<SessionManager>(
        io_.get_executor(), fast_session_config(), fake_factory(box_), quota_,
        limiter_);
    sessions_->set_sleep(sleep_.fn());
    reconciler_ = std::make_unique<Reconciler>(store_, *sessions_);

    auto info = run_coro(io_, sessions_->authenticate(user_, kAppPassword));
    ASSERT_TRUE(info.has_value());
    session_ = info->id;

    run_ = ProcessingRun::create(user_, "INBOX", 0, false, util::Clock::now());
    ASSERT_TRUE(run_coro(io_, store_.save_run(run_)).has_value());
  }

  void TearDown() override {
    if (sessions_) {
      run_coro(io_, sessions_->shutdown(200ms));
    }
  }

  // Persists a pending suggestion for item `item_id`, optionally approved.
  auto add_suggestion(std::string item_id, double confidence,
                      bool approve = true) -> SuggestionId {
    return add_suggestion_to(run_.id, std::move(item_id), confidence, approve);
  }

  auto add_suggestion_to(const RunId &run_id, std::string item_id,
                         double confidence, bool approve) -> SuggestionId {
    Suggestion s;
    s.id = make_suggestion_id(run_id, item_id);
    s.run_id = run_id;
    s.remote_item_id = std::move(item_id);
    s.folder = "INBOX";
    s.subject = "subject";
    s.labels.push_back({.label_id = "Work", .label_name = "Work",
                        .confidence = confidence, .rank = 1});
    s.category = categorize(confidence);
    s.status = SuggestionStatus::Pending;
    EXPECT_TRUE(run_coro(io_, store_.save_suggestion(s)).value_or(false));
    if (approve) {
      EXPECT_TRUE(run_coro(io_, store_.update_suggestion_status(
                                    s.id, SuggestionStatus::Approved))
                      .has_value());
    }
    return s.id;
  }

  auto status_of(const SuggestionId &id) -> SuggestionStatus {
    auto s = run_coro(io_, store_.get_suggestion(id));
    EXPECT_TRUE(s.has_value());
    return s ? s->status : SuggestionStatus::Pending;
  }

  auto apply(ApplyOptions options = {}) -> Result<ApplyReport> {
    return run_coro(io_, reconciler_->apply_run(run_.id, session_, options));
  }

  auto reconcile() -> Result<ReconcileReport> {
    return run_coro(io_, reconciler_->reconcile(run_.id, session_));
  }

  auto labelled(const std::string &item_id) const -> bool {
    auto it = box_->labels.find(item_id);
    return it != box_->labels.end() && it->second.contains("Work");
  }

  boost::asio::io_context io_;
  QuotaGuard quota_{generous_quota()};
  AuthAttemptLimiter limiter_{AuthLimiterConfig{}};
  std::shared_ptr<FakeMailbox> box_;
  RecordingSleep sleep_;
  InMemoryStateStore store_;
  std::unique_ptr<SessionManager> sessions_;
  std::unique_ptr<Reconciler> reconciler_;
  Principal user_ = principal("alice@example.com");
  SessionId session_;
  ProcessingRun run_;
};

TEST_F(ReconcilerTest, AppliesApprovedSuggestions) {
  const auto a = add_suggestion("1", 0.9);
  const auto b = add_suggestion("2", 0.7);
  const auto pending = add_suggestion("3", 0.9, false);

  auto report = apply();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->applied, 2);
  EXPECT_EQ(report->failed, 0);
  EXPECT_EQ(report->inconsistent, 0);

  EXPECT_EQ(status_of(a), SuggestionStatus::Applied);
  EXPECT_EQ(status_of(b), SuggestionStatus::Applied);
  EXPECT_EQ(status_of(pending), SuggestionStatus::Pending);
  EXPECT_TRUE(labelled("1"));
  EXPECT_TRUE(labelled("2"));
  EXPECT_FALSE(labelled("3"));

  auto entries = store_.audit_entries();
  ASSERT_EQ(entries.size(), 2u);
  for (const auto &e : entries) {
    EXPECT_TRUE(e.synced);
    EXPECT_EQ(e.outcome, RemoteOutcome::Applied);
  }
  auto run = run_coro(io_, store_.get_run(run_.id));
  ASSERT_TRUE(run.has_value());
  EXPECT_EQ(run->applied, 2);
}

TEST_F(ReconcilerTest, SkipsApprovedBelowMinimumConfidence) {
  const auto low = add_suggestion("1", 0.3);
  auto report = apply({.min_confidence = 0.5});
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->skipped, 1);
  EXPECT_EQ(report->applied, 0);
  EXPECT_EQ(status_of(low), SuggestionStatus::Approved);
  EXPECT_EQ(box_->mutations, 0);
}

TEST_F(ReconcilerTest, AutoApprovesAboveThreshold) {
  const auto high = add_suggestion("1", 0.95, false);
  const auto medium = add_suggestion("2", 0.6, false);

  auto report = apply({.auto_approve = true, .auto_approve_confidence = 0.8});
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->approved, 1);
  EXPECT_EQ(report->applied, 1);
  EXPECT_EQ(status_of(high), SuggestionStatus::Applied);
  EXPECT_EQ(status_of(medium), SuggestionStatus::Pending);
}

TEST_F(ReconcilerTest, RemoteFailureLeavesEntryUnsynced) {
  const auto id = add_suggestion("1", 0.9);
  box_->mutate_failures.push_back(Error::ProtocolError);

  auto report = apply();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->failed, 1);
  EXPECT_EQ(report->applied, 0);
  EXPECT_EQ(status_of(id), SuggestionStatus::Approved);

  auto entries = store_.audit_entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_FALSE(entries.front().synced);
  EXPECT_FALSE(entries.front().last_error.empty());
}

TEST_F(ReconcilerTest, InFlightEntryBlocksReapplyUntilReconciled) {
  const auto id = add_suggestion("1", 0.9);
  box_->mutate_failures.push_back(Error::ProtocolError);
  ASSERT_TRUE(apply().has_value());
  const int mutations = box_->mutations;

  auto second = apply();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->skipped, 1);
  EXPECT_EQ(box_->mutations, mutations);

  auto rec = reconcile();
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->examined, 1);
  EXPECT_EQ(rec->confirmed_absent, 1);
  EXPECT_EQ(status_of(id), SuggestionStatus::Approved);

  auto third = apply();
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(third->applied, 1);
  EXPECT_EQ(status_of(id), SuggestionStatus::Applied);
}

TEST_F(ReconcilerTest, LocalCommitFailureIsRepairedWithoutRemutation) {
  const auto id = add_suggestion("1", 0.9);
  store_.fail_next_complete = true;

  auto report = apply();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->inconsistent, 1);
  EXPECT_EQ(report->applied, 0);
  EXPECT_TRUE(labelled("1"));
  EXPECT_EQ(status_of(id), SuggestionStatus::Approved);
  const int mutations = box_->mutations;

  auto rec = reconcile();
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->examined, 1);
  EXPECT_EQ(rec->repaired, 1);
  EXPECT_EQ(rec->errors, 0);
  EXPECT_EQ(box_->mutations, mutations);
  EXPECT_EQ(status_of(id), SuggestionStatus::Applied);

  auto entries = store_.audit_entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_TRUE(entries.front().synced);
  EXPECT_EQ(entries.front().outcome, RemoteOutcome::Applied);
}

TEST_F(ReconcilerTest, SecondReconcileTouchesNothing) {
  add_suggestion("1", 0.9);
  store_.fail_next_complete = true;
  ASSERT_TRUE(apply().has_value());
  ASSERT_TRUE(reconcile().has_value());

  const int calls = box_->remote_calls();
  auto again = reconcile();
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->examined, 0);
  EXPECT_EQ(box_->remote_calls(), calls);
}

TEST_F(ReconcilerTest, UnreadableRemoteStateStaysUnsynced) {
  add_suggestion("1", 0.9);
  store_.fail_next_complete = true;
  ASSERT_TRUE(apply().has_value());
  box_->has_label_failures.push_back(Error::ProtocolError);

  auto rec = reconcile();
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->errors, 1);
  EXPECT_EQ(rec->repaired, 0);
  auto unsynced = run_coro(io_, store_.list_unsynced_audit({.run_id = run_.id}));
  ASSERT_TRUE(unsynced.has_value());
  EXPECT_EQ(unsynced->size(), 1u);
}

TEST_F(ReconcilerTest, AuditWriteFailureSkipsMutation) {
  add_suggestion("1", 0.9);
  store_.fail_next_append = true;

  auto report = apply();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->failed, 1);
  EXPECT_EQ(box_->mutations, 0);
  EXPECT_TRUE(store_.audit_entries().empty());
}

TEST_F(ReconcilerTest, UnknownRunIsNotFound) {
  auto report =
      run_coro(io_, reconciler_->apply_run(RunId{"missing"}, session_, {}));
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), Error::NotFound);
}

TEST_F(ReconcilerTest, ReconcileStaysInsideTheSessionsMailbox) {
  const auto mine = add_suggestion("1", 0.9);
  store_.fail_next_complete = true;
  ASSERT_TRUE(apply().has_value());

  // Another user's run left an entry for the same item id in their mailbox.
  auto theirs = ProcessingRun::create(principal("bob@example.com"), "INBOX", 0,
                                      false, util::Clock::now());
  ASSERT_TRUE(run_coro(io_, store_.save_run(theirs)).has_value());
  const auto other = add_suggestion_to(theirs.id, "1", 0.9, true);
  AuditLogEntry entry;
  entry.run_id = theirs.id;
  entry.suggestion_id = other;
  entry.op = MutationOp::AddLabel;
  entry.item_id = "1";
  entry.folder = "INBOX";
  entry.label = "Work";
  entry.attempted_at = util::Clock::now();
  ASSERT_TRUE(run_coro(io_, store_.append_audit_entry(entry)).has_value());

  auto rec = run_coro(io_, reconciler_->reconcile(std::nullopt, session_));
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->examined, 1);
  EXPECT_EQ(rec->repaired, 1);
  EXPECT_EQ(status_of(mine), SuggestionStatus::Applied);
  EXPECT_EQ(status_of(other), SuggestionStatus::Approved);

  auto left = run_coro(io_, store_.list_unsynced_audit(
                                {.principal = principal("bob@example.com")}));
  ASSERT_TRUE(left.has_value());
  ASSERT_EQ(left->size(), 1u);
  EXPECT_EQ(left->front().suggestion_id, other);
}

TEST_F(ReconcilerTest, ApplyRejectsAnotherUsersRun) {
  auto theirs = ProcessingRun::create(principal("bob@example.com"), "INBOX", 0,
                                      false, util::Clock::now());
  ASSERT_TRUE(run_coro(io_, store_.save_run(theirs)).has_value());
  add_suggestion_to(theirs.id, "1", 0.9, true);

  auto report =
      run_coro(io_, reconciler_->apply_run(theirs.id, session_, {}));
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), Error::InvalidArgument);
  EXPECT_EQ(box_->mutations, 0);
  EXPECT_TRUE(store_.audit_entries().empty());
}
