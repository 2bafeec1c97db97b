#include "mailsync/mailbox/imap_protocol.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/find.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace mailsync::imap {

namespace {

struct Token {
  std::string value;
  bool quoted{false};
  bool list{false};
};

auto skip_spaces(std::string_view &rest) -> void {
  while (!rest.empty() && rest.front() == ' ') {
    rest.remove_prefix(1);
  }
}

// Reads one token: a quoted string (unescaped), a parenthesized group (its
// inner text), or an atom. Square brackets inside an atom may hold spaces,
// as in BODY[HEADER.FIELDS (SUBJECT FROM)].
[[nodiscard]] auto next_token(std::string_view &rest) -> std::optional<Token> {
  skip_spaces(rest);
  if (rest.empty() || rest.front() == ')') {
    return std::nullopt;
  }

  Token tok;
  if (rest.front() == '"') {
    tok.quoted = true;
    std::size_t i = 1;
    for (; i < rest.size(); ++i) {
      const char c = rest[i];
      if (c == '\\' && i + 1 < rest.size()) {
        tok.value.push_back(rest[++i]);
        continue;
      }
      if (c == '"') {
        break;
      }
      tok.value.push_back(c);
    }
    rest.remove_prefix(std::min(i + 1, rest.size()));
    return tok;
  }

  if (rest.front() == '(') {
    tok.list = true;
    int depth = 0;
    bool in_quote = false;
    std::size_t i = 0;
    for (; i < rest.size(); ++i) {
      const char c = rest[i];
      if (in_quote) {
        if (c == '\\') {
          ++i;
        } else if (c == '"') {
          in_quote = false;
        }
        continue;
      }
      if (c == '"') {
        in_quote = true;
      } else if (c == '(') {
        ++depth;
      } else if (c == ')' && --depth == 0) {
        break;
      }
    }
    tok.value = std::string(rest.substr(1, i > 0 ? i - 1 : 0));
    rest.remove_prefix(std::min(i + 1, rest.size()));
    return tok;
  }

  std::size_t i = 0;
  int bracket = 0;
  for (; i < rest.size(); ++i) {
    const char c = rest[i];
    if (c == '[') {
      ++bracket;
    } else if (c == ']' && bracket > 0) {
      --bracket;
    } else if (bracket == 0 && (c == ' ' || c == '(' || c == ')')) {
      break;
    }
  }
  tok.value = std::string(rest.substr(0, i));
  rest.remove_prefix(i);
  return tok;
}

[[nodiscard]] auto parse_u64(std::string_view text)
    -> std::optional<std::uint64_t> {
  std::uint64_t value = 0;
  const auto *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

[[nodiscard]] auto is_atom_char(unsigned char c) noexcept -> bool {
  if (c <= 0x20 || c >= 0x7f) {
    return false;
  }
  switch (c) {
  case '(':
  case ')':
  case '{':
  case '%':
  case '*':
  case '"':
  case '\\':
  case ']':
    return false;
  default:
    return true;
  }
}

} // namespace

auto parse_status(std::string_view atom) noexcept -> Status {
  using boost::algorithm::iequals;
  if (iequals(atom, "OK")) {
    return Status::Ok;
  }
  if (iequals(atom, "NO")) {
    return Status::No;
  }
  if (iequals(atom, "BAD")) {
    return Status::Bad;
  }
  if (iequals(atom, "BYE")) {
    return Status::Bye;
  }
  if (iequals(atom, "PREAUTH")) {
    return Status::Preauth;
  }
  return Status::Unknown;
}

auto trailing_literal_size(std::string_view line)
    -> std::optional<std::size_t> {
  if (line.empty() || line.back() != '}') {
    return std::nullopt;
  }
  const auto open = line.rfind('{');
  if (open == std::string_view::npos) {
    return std::nullopt;
  }
  auto digits = line.substr(open + 1, line.size() - open - 2);
  if (!digits.empty() && digits.back() == '+') {
    digits.remove_suffix(1);
  }
  auto value = parse_u64(digits);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(*value);
}

auto parse_tagged(std::string_view line, std::string_view tag)
    -> std::optional<std::pair<Status, std::string>> {
  if (!line.starts_with(tag) || line.size() <= tag.size() ||
      line[tag.size()] != ' ') {
    return std::nullopt;
  }
  auto rest = line.substr(tag.size() + 1);
  const auto space = rest.find(' ');
  const auto atom = rest.substr(0, space);
  std::string text;
  if (space != std::string_view::npos) {
    text = std::string(rest.substr(space + 1));
  }
  return std::pair{parse_status(atom), std::move(text)};
}

auto quote(std::string_view value) -> std::string {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

auto split_list(std::string_view inner) -> std::vector<std::string> {
  std::vector<std::string> out;
  while (auto tok = next_token(inner)) {
    if (tok->list) {
      continue;
    }
    out.push_back(std::move(tok->value));
  }
  return out;
}

auto parse_capabilities(std::span<const Line> lines,
                        std::string_view tagged_text)
    -> std::vector<std::string> {
  std::vector<std::string> caps;
  auto collect = [&](std::string_view words) {
    for (auto &word : split_list(words)) {
      boost::algorithm::to_upper(word);
      caps.push_back(std::move(word));
    }
  };

  for (const auto &line : lines) {
    std::string_view text = line.text;
    if (boost::algorithm::istarts_with(text, "* CAPABILITY ")) {
      collect(text.substr(13));
    }
  }
  // Servers may piggyback the list on a response code: "OK [CAPABILITY ...]".
  if (auto pos = tagged_text.find("[CAPABILITY "); pos != std::string_view::npos) {
    auto rest = tagged_text.substr(pos + 12);
    collect(rest.substr(0, rest.find(']')));
  }
  return caps;
}

auto parse_list_line(std::string_view line) -> std::optional<Folder> {
  if (!boost::algorithm::istarts_with(line, "* LIST ") &&
      !boost::algorithm::istarts_with(line, "* LSUB ")) {
    return std::nullopt;
  }
  auto rest = line.substr(7);

  auto flags_tok = next_token(rest);
  if (!flags_tok || !flags_tok->list) {
    return std::nullopt;
  }
  auto delim_tok = next_token(rest);
  if (!delim_tok) {
    return std::nullopt;
  }
  auto name_tok = next_token(rest);
  if (!name_tok || name_tok->value.empty()) {
    return std::nullopt;
  }

  std::string delimiter;
  if (delim_tok->quoted || !boost::algorithm::iequals(delim_tok->value, "NIL")) {
    delimiter = delim_tok->value;
  }
  return make_folder(split_list(flags_tok->value), delimiter, name_tok->value);
}

auto parse_select(std::span<const Line> lines) -> FolderStatus {
  FolderStatus status;
  for (const auto &line : lines) {
    std::string_view text = line.text;
    if (!text.starts_with("* ")) {
      continue;
    }
    auto rest = text.substr(2);
    if (auto pos = rest.find("[UIDVALIDITY "); pos != std::string_view::npos) {
      auto value = rest.substr(pos + 13);
      value = value.substr(0, value.find(']'));
      if (auto v = parse_u64(value)) {
        status.uid_validity = static_cast<std::int64_t>(*v);
      }
      continue;
    }
    if (auto pos = rest.find("[UIDNEXT "); pos != std::string_view::npos) {
      auto value = rest.substr(pos + 9);
      value = value.substr(0, value.find(']'));
      if (auto v = parse_u64(value)) {
        status.uid_next = static_cast<std::int64_t>(*v);
      }
      continue;
    }
    const auto space = rest.find(' ');
    if (space != std::string_view::npos &&
        boost::algorithm::iequals(rest.substr(space + 1), "EXISTS")) {
      if (auto v = parse_u64(rest.substr(0, space))) {
        status.exists = static_cast<std::int64_t>(*v);
      }
    }
  }
  return status;
}

auto next_search_range(std::uint64_t after, std::uint64_t span,
                       std::int64_t uid_next) -> UidRange {
  UidRange range{.first = after + 1, .last = std::nullopt};
  if (uid_next <= 1 || span == 0) {
    return range;
  }
  const auto top = static_cast<std::uint64_t>(uid_next - 1);
  if (range.first + span - 1 < top) {
    range.last = range.first + span - 1;
  }
  return range;
}

auto format_uid_range(const UidRange &range) -> std::string {
  return range.last ? std::format("{}:{}", range.first, *range.last)
                    : std::format("{}:*", range.first);
}

auto parse_search(std::span<const Line> lines) -> std::vector<std::uint64_t> {
  std::vector<std::uint64_t> uids;
  for (const auto &line : lines) {
    std::string_view text = line.text;
    if (!boost::algorithm::istarts_with(text, "* SEARCH")) {
      continue;
    }
    auto rest = text.substr(8);
    while (auto tok = next_token(rest)) {
      if (tok->value.empty()) {
        break;
      }
      if (auto v = parse_u64(tok->value)) {
        uids.push_back(*v);
      }
    }
  }
  return uids;
}

auto parse_fetch(const Line &line) -> std::optional<MailItem> {
  std::string_view text = line.text;
  if (!text.starts_with("* ")) {
    return std::nullopt;
  }
  auto range = boost::algorithm::ifind_first(text, " FETCH (");
  if (range.empty()) {
    return std::nullopt;
  }
  auto rest = text.substr(
      static_cast<std::size_t>(range.end() - text.begin()));

  MailItem item;
  std::vector<std::string> flags;
  std::optional<std::vector<std::string>> gm_labels;
  std::size_t literal_index = 0;

  while (auto key = next_token(rest)) {
    if (key->value.empty()) {
      break;
    }
    auto value = next_token(rest);
    if (!value) {
      break;
    }
    const auto name = boost::algorithm::to_upper_copy(key->value);

    // A "{N}" value refers to the next lifted literal.
    std::string payload = value->value;
    if (!value->quoted && !value->list && payload.starts_with('{')) {
      if (literal_index < line.literals.size()) {
        payload = line.literals[literal_index];
      } else {
        payload.clear();
      }
      ++literal_index;
    }

    if (name == "UID") {
      item.id = payload;
    } else if (name == "FLAGS") {
      flags = split_list(payload);
    } else if (name == "X-GM-LABELS") {
      gm_labels = split_list(payload);
    } else if (name.starts_with("BODY[") || name.starts_with("BODY.PEEK[")) {
      auto fields = parse_header_fields(payload);
      item.subject = std::move(fields.subject);
      item.from = std::move(fields.from);
    }
  }

  if (item.id.empty()) {
    return std::nullopt;
  }
  if (gm_labels) {
    item.labels = std::move(*gm_labels);
  } else {
    for (auto &flag : flags) {
      if (!flag.starts_with('\\')) {
        item.labels.push_back(std::move(flag));
      }
    }
  }
  return item;
}

auto parse_header_fields(std::string_view header) -> HeaderFields {
  HeaderFields out;
  std::string *current = nullptr;

  while (!header.empty()) {
    auto eol = header.find('\n');
    auto raw = header.substr(0, eol);
    header = eol == std::string_view::npos ? std::string_view{}
                                           : header.substr(eol + 1);
    if (!raw.empty() && raw.back() == '\r') {
      raw.remove_suffix(1);
    }
    if (raw.empty()) {
      current = nullptr;
      continue;
    }

    if ((raw.front() == ' ' || raw.front() == '\t') && current != nullptr) {
      current->push_back(' ');
      current->append(boost::algorithm::trim_copy(std::string(raw)));
      continue;
    }

    const auto colon = raw.find(':');
    if (colon == std::string_view::npos) {
      current = nullptr;
      continue;
    }
    const auto name = raw.substr(0, colon);
    auto value = boost::algorithm::trim_copy(std::string(raw.substr(colon + 1)));
    if (boost::algorithm::iequals(name, "Subject")) {
      out.subject = std::move(value);
      current = &out.subject;
    } else if (boost::algorithm::iequals(name, "From")) {
      out.from = std::move(value);
      current = &out.from;
    } else {
      current = nullptr;
    }
  }
  return out;
}

auto keyword_for_label(std::string_view label) -> std::string {
  std::string out;
  out.reserve(label.size());
  for (char c : label) {
    out.push_back(is_atom_char(static_cast<unsigned char>(c)) ? c : '_');
  }
  return out;
}

auto xoauth2_initial_response(std::string_view user, std::string_view token)
    -> std::string {
  const auto raw = std::format("user={}\x01" "auth=Bearer {}\x01\x01", user,
                               token);
  std::string encoded(4 * ((raw.size() + 2) / 3) + 1, '\0');
  const int n = EVP_EncodeBlock(
      reinterpret_cast<unsigned char *>(encoded.data()),
      reinterpret_cast<const unsigned char *>(raw.data()),
      static_cast<int>(raw.size()));
  encoded.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
  return encoded;
}

auto is_throttled(std::string_view text) -> bool {
  return !boost::algorithm::ifind_first(text, "[THROTTLED]").empty() ||
         !boost::algorithm::ifind_first(text, "too many").empty();
}

auto reply_error(const Response &response, Error negative) -> Error {
  if (is_throttled(response.text)) {
    return Error::RateLimited;
  }
  switch (response.status) {
  case Status::No:
    return negative;
  case Status::Bye:
    return Error::ConnectionFailed;
  default:
    return Error::ProtocolError;
  }
}

} // namespace mailsync::imap
