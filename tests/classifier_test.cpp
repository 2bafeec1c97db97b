#include "mailsync/classify/classifier.hpp"
#include "mailsync/sync/batch_coordinator.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace mailsync;
using namespace mailsync::test;

namespace {

auto label(std::string name) -> Folder {
  return {.name = name, .display_name = name};
}

auto item(std::string id, std::string subject, std::string from = "")
    -> MailItem {
  return {.id = std::move(id), .subject = std::move(subject),
          .from = std::move(from), .labels = {}};
}

} // namespace

TEST(TokenizeTest, LowercasesAndDropsShortWords) {
  EXPECT_EQ(tokenize("Re: Q3 Planning-review, a x"),
            (std::vector<std::string>{"re", "q3", "planning", "review"}));
  EXPECT_TRUE(tokenize("").empty());
}

TEST(KeywordClassifierTest, FullPhraseInSubjectScoresOne) {
  auto classifier = create_keyword_classifier();
  std::vector<Folder> labels{label("Travel Plans"), label("Receipts")};
  std::vector<MailItem> items{item("1", "Your travel plans for June")};

  boost::asio::io_context io;
  auto scores = run_coro(io, classifier->classify(items, labels));
  ASSERT_TRUE(scores.has_value());
  ASSERT_EQ(scores->size(), 1u);
  EXPECT_EQ(scores->front().label_id, "Travel Plans");
  EXPECT_DOUBLE_EQ(scores->front().confidence, 1.0);
}

TEST(KeywordClassifierTest, PartialMatchScoresFraction) {
  auto classifier = create_keyword_classifier();
  std::vector<Folder> labels{label("Travel Plans")};
  std::vector<MailItem> items{item("1", "Plans changed")};

  boost::asio::io_context io;
  auto scores = run_coro(io, classifier->classify(items, labels));
  ASSERT_TRUE(scores.has_value());
  ASSERT_EQ(scores->size(), 1u);
  EXPECT_DOUBLE_EQ(scores->front().confidence, 0.5);
}

TEST(KeywordClassifierTest, HierarchicalLabelsUseLeafAndSenderCounts) {
  auto classifier = create_keyword_classifier();
  std::vector<Folder> labels{
      {.name = "Vendors/Acme", .display_name = "Vendors/Acme"}};
  std::vector<MailItem> items{item("7", "Invoice", "billing@acme.com")};

  boost::asio::io_context io;
  auto scores = run_coro(io, classifier->classify(items, labels));
  ASSERT_TRUE(scores.has_value());
  ASSERT_EQ(scores->size(), 1u);
  EXPECT_EQ(scores->front().label_id, "Vendors/Acme");
  EXPECT_DOUBLE_EQ(scores->front().confidence, 1.0);
}

TEST(KeywordClassifierTest, KeepsTopLabelsPerItem) {
  auto classifier = create_keyword_classifier(2);
  std::vector<Folder> labels{label("alpha"), label("beta"), label("gamma")};
  std::vector<MailItem> items{item("1", "alpha beta gamma"), item("2", "none")};

  boost::asio::io_context io;
  auto scores = run_coro(io, classifier->classify(items, labels));
  ASSERT_TRUE(scores.has_value());
  EXPECT_EQ(scores->size(), 2u);
  for (const auto &s : *scores) {
    EXPECT_EQ(s.item_id, "1");
  }
}

class MakeSuggestionTest : public ::testing::Test {
protected:
  ProcessingRun run_ = ProcessingRun::create(principal("a@example.com"),
                                             "INBOX", 0, false,
                                             util::Clock::now());
  MailItem item_ = item("42", "hello");
};

TEST_F(MakeSuggestionTest, RanksAndDedupesLabels) {
  std::vector<LabelScore> scores{
      {.item_id = "42", .label_id = "B", .label_name = "B", .confidence = 0.6},
      {.item_id = "42", .label_id = "A", .label_name = "A", .confidence = 0.9},
      {.item_id = "42", .label_id = "B", .label_name = "B", .confidence = 0.3},
      {.item_id = "other", .label_id = "C", .label_name = "C", .confidence = 1.0},
  };
  auto s = BatchCoordinator::make_suggestion(run_, item_, scores, 0.5,
                                             util::Clock::now());
  ASSERT_EQ(s.labels.size(), 2u);
  EXPECT_EQ(s.labels[0].label_id, "A");
  EXPECT_EQ(s.labels[0].rank, 1);
  EXPECT_EQ(s.labels[1].label_id, "B");
  EXPECT_DOUBLE_EQ(s.labels[1].confidence, 0.6);
  EXPECT_EQ(s.status, SuggestionStatus::Pending);
  EXPECT_EQ(s.category, ConfidenceCategory::High);
  EXPECT_EQ(s.id, make_suggestion_id(run_.id, "42"));
}

TEST_F(MakeSuggestionTest, BelowThresholdIsNoMatch) {
  std::vector<LabelScore> scores{
      {.item_id = "42", .label_id = "A", .label_name = "A", .confidence = 0.4}};
  auto s = BatchCoordinator::make_suggestion(run_, item_, scores, 0.5,
                                             util::Clock::now());
  EXPECT_EQ(s.status, SuggestionStatus::NoMatch);
  EXPECT_EQ(s.category, ConfidenceCategory::NoMatch);
  EXPECT_EQ(s.labels.size(), 1u);
}

TEST_F(MakeSuggestionTest, NoScoresIsNoMatch) {
  auto s = BatchCoordinator::make_suggestion(run_, item_, {}, 0.5,
                                             util::Clock::now());
  EXPECT_EQ(s.status, SuggestionStatus::NoMatch);
  EXPECT_TRUE(s.labels.empty());
}

TEST_F(MakeSuggestionTest, ClampsAndDropsNonFiniteScores) {
  std::vector<LabelScore> scores{
      {.item_id = "42", .label_id = "A", .label_name = "A",
       .confidence = std::numeric_limits<double>::quiet_NaN()},
      {.item_id = "42", .label_id = "B", .label_name = "B", .confidence = 1.7}};
  auto s = BatchCoordinator::make_suggestion(run_, item_, scores, 0.5,
                                             util::Clock::now());
  ASSERT_EQ(s.labels.size(), 1u);
  EXPECT_EQ(s.labels[0].label_id, "B");
  EXPECT_DOUBLE_EQ(s.labels[0].confidence, 1.0);
}
