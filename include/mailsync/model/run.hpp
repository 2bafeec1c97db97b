#pragma once

#include "mailsync/core/error.hpp"
#include "mailsync/util/enum.hpp"
#include "mailsync/util/id.hpp"
#include "mailsync/util/time.hpp"

#include <boost/describe/enum.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mailsync {

enum class RunStatus : std::uint8_t {
  Pending,
  InProgress,
  Paused,
  Completed,
  Failed,
};
BOOST_DESCRIBE_ENUM(RunStatus, Pending, InProgress, Paused, Completed, Failed)
MAILSYNC_DEFINE_ENUM_SERDE(RunStatus, RunStatus::Pending)

[[nodiscard]] constexpr auto is_terminal(RunStatus s) noexcept -> bool {
  return s == RunStatus::Completed || s == RunStatus::Failed;
}

// One classify/apply execution. The cursor is an opaque page token owned by
// the mailbox transport.
struct ProcessingRun {
  RunId id;
  Principal principal;
  RunStatus status{RunStatus::Pending};
  std::string folder{"INBOX"};
  int item_limit{0}; // 0 = until the folder is exhausted
  bool apply{false};

  int total{0};
  int processed{0};
  int generated{0};
  int applied{0};

  std::string cursor;
  std::vector<std::string> error_log;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};
  util::TimePoint finished_at{};

  [[nodiscard]] static auto create(Principal principal, std::string folder,
                                   int item_limit, bool apply,
                                   util::TimePoint now) -> ProcessingRun;

  [[nodiscard]] auto start(util::TimePoint now) -> Result<void>;
  [[nodiscard]] auto pause(util::TimePoint now) -> Result<void>;
  [[nodiscard]] auto resume(util::TimePoint now) -> Result<void>;
  [[nodiscard]] auto complete(util::TimePoint now) -> Result<void>;
  [[nodiscard]] auto fail(std::string_view reason, util::TimePoint now)
      -> Result<void>;

  // Appends "[<iso8601>] <message>".
  auto add_error(std::string_view message, util::TimePoint now) -> void;

  [[nodiscard]] auto progress_percentage() const noexcept -> double;
  [[nodiscard]] auto success_rate() const noexcept -> double;
  [[nodiscard]] auto is_finished() const noexcept -> bool {
    return is_terminal(status);
  }
};

} // namespace mailsync
