#pragma once

#include "mailsync/core/error.hpp"
#include "mailsync/util/enum.hpp"
#include "mailsync/util/id.hpp"
#include "mailsync/util/time.hpp"

#include <boost/describe/enum.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mailsync {

enum class SuggestionStatus : std::uint8_t {
  Pending,
  Approved,
  Rejected,
  NoMatch,
  Applied,
};
BOOST_DESCRIBE_ENUM(SuggestionStatus, Pending, Approved, Rejected, NoMatch,
                    Applied)
MAILSYNC_DEFINE_ENUM_SERDE(SuggestionStatus, SuggestionStatus::Pending)

enum class ConfidenceCategory : std::uint8_t { High, Medium, Low, NoMatch };
BOOST_DESCRIBE_ENUM(ConfidenceCategory, High, Medium, Low, NoMatch)
MAILSYNC_DEFINE_ENUM_SERDE(ConfidenceCategory, ConfidenceCategory::NoMatch)

inline constexpr double kHighConfidence = 0.8;
inline constexpr double kMediumConfidence = 0.5;

// Legal moves: pending -> {approved, rejected, no_match}, approved -> applied.
[[nodiscard]] constexpr auto can_transition(SuggestionStatus from,
                                            SuggestionStatus to) noexcept
    -> bool {
  switch (from) {
  case SuggestionStatus::Pending:
    return to == SuggestionStatus::Approved ||
           to == SuggestionStatus::Rejected || to == SuggestionStatus::NoMatch;
  case SuggestionStatus::Approved:
    return to == SuggestionStatus::Applied;
  default:
    return false;
  }
}

[[nodiscard]] constexpr auto categorize(double confidence) noexcept
    -> ConfidenceCategory {
  if (confidence >= kHighConfidence) {
    return ConfidenceCategory::High;
  }
  if (confidence >= kMediumConfidence) {
    return ConfidenceCategory::Medium;
  }
  if (confidence > 0.0) {
    return ConfidenceCategory::Low;
  }
  return ConfidenceCategory::NoMatch;
}

struct SuggestedLabel {
  std::string label_id;
  std::string label_name;
  double confidence{0.0};
  int rank{1};

  auto operator==(const SuggestedLabel &) const -> bool = default;
};

struct Suggestion {
  SuggestionId id;
  RunId run_id;
  std::string remote_item_id;
  std::string folder;
  std::string subject;
  std::vector<SuggestedLabel> labels; // ordered by rank
  ConfidenceCategory category{ConfidenceCategory::NoMatch};
  std::string reasoning;
  SuggestionStatus status{SuggestionStatus::Pending};
  util::TimePoint created_at{};
  util::TimePoint updated_at{};

  [[nodiscard]] auto best_label() const noexcept -> const SuggestedLabel * {
    return labels.empty() ? nullptr : &labels.front();
  }

  [[nodiscard]] auto best_confidence() const noexcept -> double {
    return labels.empty() ? 0.0 : labels.front().confidence;
  }

  // Applies a status change if the state machine allows it; otherwise
  // returns InvalidState and leaves the suggestion untouched.
  [[nodiscard]] auto transition(SuggestionStatus to, util::TimePoint now)
      -> Result<void> {
    if (!can_transition(status, to)) {
      return fail(Error::InvalidState);
    }
    status = to;
    updated_at = now;
    return ok();
  }
};

} // namespace mailsync
