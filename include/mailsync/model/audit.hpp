#pragma once

#include "mailsync/util/enum.hpp"
#include "mailsync/util/id.hpp"
#include "mailsync/util/time.hpp"

#include <boost/describe/enum.hpp>
#include <cstdint>
#include <string>

namespace mailsync {

enum class MutationOp : std::uint8_t { AddLabel, RemoveLabel };
BOOST_DESCRIBE_ENUM(MutationOp, AddLabel, RemoveLabel)
MAILSYNC_DEFINE_ENUM_SERDE(MutationOp, MutationOp::AddLabel)

enum class RemoteOutcome : std::uint8_t { Unknown, Applied, Absent };
BOOST_DESCRIBE_ENUM(RemoteOutcome, Unknown, Applied, Absent)
MAILSYNC_DEFINE_ENUM_SERDE(RemoteOutcome, RemoteOutcome::Unknown)

// Intent record written before a remote mutation is attempted. `synced`
// flips only in the same transaction that updates the suggestion.
struct AuditLogEntry {
  std::int64_t id{0};
  RunId run_id;
  SuggestionId suggestion_id;
  MutationOp op{MutationOp::AddLabel};
  std::string item_id;
  std::string folder;
  std::string label;
  util::TimePoint attempted_at{};
  bool synced{false};
  util::TimePoint synced_at{};
  RemoteOutcome outcome{RemoteOutcome::Unknown};
  std::string last_error;
};

} // namespace mailsync
