#include "mailsync/model/mailbox.hpp"
#include "mailsync/model/run.hpp"
#include "mailsync/model/suggestion.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace mailsync;
using namespace mailsync::test;

TEST(SuggestionStateTest, OnlyFourMovesAreLegal) {
  constexpr std::array all{SuggestionStatus::Pending, SuggestionStatus::Approved,
                           SuggestionStatus::Rejected, SuggestionStatus::NoMatch,
                           SuggestionStatus::Applied};
  int legal = 0;
  for (auto from : all) {
    for (auto to : all) {
      if (can_transition(from, to)) {
        ++legal;
      }
    }
  }
  EXPECT_EQ(legal, 4);
  EXPECT_TRUE(can_transition(SuggestionStatus::Pending, SuggestionStatus::Approved));
  EXPECT_TRUE(can_transition(SuggestionStatus::Pending, SuggestionStatus::Rejected));
  EXPECT_TRUE(can_transition(SuggestionStatus::Pending, SuggestionStatus::NoMatch));
  EXPECT_TRUE(can_transition(SuggestionStatus::Approved, SuggestionStatus::Applied));
}

TEST(SuggestionStateTest, IllegalTransitionLeavesSuggestionUntouched) {
  Suggestion s;
  s.status = SuggestionStatus::Rejected;
  const auto before = s.updated_at;
  auto r = s.transition(SuggestionStatus::Applied, util::Clock::now());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidState);
  EXPECT_EQ(s.status, SuggestionStatus::Rejected);
  EXPECT_EQ(s.updated_at, before);
}

TEST(SuggestionStateTest, CategoryBoundaries) {
  EXPECT_EQ(categorize(1.0), ConfidenceCategory::High);
  EXPECT_EQ(categorize(0.8), ConfidenceCategory::High);
  EXPECT_EQ(categorize(0.79), ConfidenceCategory::Medium);
  EXPECT_EQ(categorize(0.5), ConfidenceCategory::Medium);
  EXPECT_EQ(categorize(0.49), ConfidenceCategory::Low);
  EXPECT_EQ(categorize(0.0), ConfidenceCategory::NoMatch);
}

TEST(ProcessingRunTest, LifecycleHappyPath) {
  const auto now = util::Clock::now();
  auto run = ProcessingRun::create(principal("a@example.com"), "INBOX", 250,
                                   false, now);
  EXPECT_EQ(run.status, RunStatus::Pending);
  EXPECT_EQ(run.total, 250);
  EXPECT_FALSE(run.id.empty());

  ASSERT_TRUE(run.start(now).has_value());
  ASSERT_TRUE(run.pause(now).has_value());
  ASSERT_TRUE(run.resume(now).has_value());
  ASSERT_TRUE(run.complete(now).has_value());
  EXPECT_TRUE(run.is_finished());
  EXPECT_EQ(run.finished_at, now);
}

TEST(ProcessingRunTest, RejectsOutOfOrderMoves) {
  const auto now = util::Clock::now();
  auto run = ProcessingRun::create(principal("a@example.com"), "INBOX", 0,
                                   false, now);
  EXPECT_FALSE(run.pause(now).has_value());
  EXPECT_FALSE(run.complete(now).has_value());
  ASSERT_TRUE(run.start(now).has_value());
  EXPECT_FALSE(run.start(now).has_value());
  ASSERT_TRUE(run.fail("boom", now).has_value());
  EXPECT_FALSE(run.fail("again", now).has_value());
  EXPECT_FALSE(run.resume(now).has_value());
  ASSERT_EQ(run.error_log.size(), 1u);
  EXPECT_TRUE(run.error_log.front().ends_with("boom"));
}

TEST(ProcessingRunTest, ProgressAndSuccessRate) {
  ProcessingRun run;
  EXPECT_DOUBLE_EQ(run.progress_percentage(), 0.0);
  EXPECT_DOUBLE_EQ(run.success_rate(), 0.0);
  run.total = 200;
  run.processed = 50;
  run.generated = 40;
  run.applied = 10;
  EXPECT_DOUBLE_EQ(run.progress_percentage(), 25.0);
  EXPECT_DOUBLE_EQ(run.success_rate(), 0.25);
}

TEST(FolderTest, SpecialUseAndGmailPrefix) {
  auto inbox = make_folder({"\\HasNoChildren"}, "/", "INBOX");
  EXPECT_EQ(inbox.type, FolderType::Inbox);
  EXPECT_FALSE(inbox.is_user_label());

  auto sent = make_folder({"\\Sent"}, "/", "[Gmail]/Sent Mail");
  EXPECT_EQ(sent.type, FolderType::Sent);
  EXPECT_EQ(sent.display_name, "Sent Mail");

  auto all = make_folder({"\\All"}, "/", "[Gmail]/All Mail");
  EXPECT_EQ(all.type, FolderType::System);

  auto root = make_folder({"\\Noselect"}, "/", "[Gmail]");
  EXPECT_FALSE(root.selectable);

  auto label = make_folder({}, "/", "Work/Projects");
  EXPECT_TRUE(label.is_user_label());
  EXPECT_EQ(label.display_name, "Work/Projects");
}
