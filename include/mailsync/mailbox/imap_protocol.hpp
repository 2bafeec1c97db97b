#pragma once

#include "mailsync/core/error.hpp"
#include "mailsync/model/mailbox.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Pure IMAP4rev1 text handling: no sockets here, so every function is
// testable against captured server output.
namespace mailsync::imap {

enum class Status : std::uint8_t { Ok, No, Bad, Bye, Preauth, Unknown };

// One logical response line. Literal payloads are lifted out into
// `literals`; their "{N}" markers stay in `text`.
struct Line {
  std::string text;
  std::vector<std::string> literals;
};

struct Response {
  std::string tag;
  Status status{Status::Unknown};
  std::string text;
  std::vector<Line> untagged;
};

[[nodiscard]] auto parse_status(std::string_view atom) noexcept -> Status;

// Size announced by a trailing "{N}" (or "{N+}"), if the line ends in one.
[[nodiscard]] auto trailing_literal_size(std::string_view line)
    -> std::optional<std::size_t>;

// "<tag> OK text" -> {Ok, "text"}; nullopt if the line is not tagged `tag`.
[[nodiscard]] auto parse_tagged(std::string_view line, std::string_view tag)
    -> std::optional<std::pair<Status, std::string>>;

[[nodiscard]] auto quote(std::string_view value) -> std::string;

// Splits the body of a parenthesized list into atoms and unquoted strings.
[[nodiscard]] auto split_list(std::string_view inner)
    -> std::vector<std::string>;

[[nodiscard]] auto parse_capabilities(std::span<const Line> lines,
                                      std::string_view tagged_text)
    -> std::vector<std::string>;

[[nodiscard]] auto parse_list_line(std::string_view line)
    -> std::optional<Folder>;

[[nodiscard]] auto parse_select(std::span<const Line> lines) -> FolderStatus;

[[nodiscard]] auto parse_search(std::span<const Line> lines)
    -> std::vector<std::uint64_t>;

// One step of a paged UID scan. `last` is empty for an open "first:*" range.
struct UidRange {
  std::uint64_t first{1};
  std::optional<std::uint64_t> last;
};

// The range after UID `after`, at most `span` UIDs wide while it stays below
// the highest UID known from SELECT. The step that reaches that UID is left
// open so mail delivered since SELECT is still found.
[[nodiscard]] auto next_search_range(std::uint64_t after, std::uint64_t span,
                                     std::int64_t uid_next) -> UidRange;

// "first:last" or "first:*".
[[nodiscard]] auto format_uid_range(const UidRange &range) -> std::string;

// One "* n FETCH (...)" line. Labels come from X-GM-LABELS when present,
// otherwise from the keyword part of FLAGS.
[[nodiscard]] auto parse_fetch(const Line &line) -> std::optional<MailItem>;

struct HeaderFields {
  std::string subject;
  std::string from;
};

// Unfolds continuation lines; header names match case-insensitively.
[[nodiscard]] auto parse_header_fields(std::string_view header)
    -> HeaderFields;

// IMAP keywords are atoms; characters outside atom-char become '_'.
[[nodiscard]] auto keyword_for_label(std::string_view label) -> std::string;

// SASL XOAUTH2 initial client response, base64 encoded.
[[nodiscard]] auto xoauth2_initial_response(std::string_view user,
                                            std::string_view token)
    -> std::string;

// Gmail signals throttling with [THROTTLED] or a "too many" reply text.
[[nodiscard]] auto is_throttled(std::string_view text) -> bool;

// Maps a non-OK tagged reply to an error kind. `negative` is what a plain NO
// means for the command that produced it.
[[nodiscard]] auto reply_error(const Response &response, Error negative)
    -> Error;

} // namespace mailsync::imap
