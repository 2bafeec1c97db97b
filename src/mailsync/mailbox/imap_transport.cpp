#include "mailsync/mailbox/imap_connection.hpp"
#include "mailsync/mailbox/imap_protocol.hpp"
#include "mailsync/mailbox/transport.hpp"
#include "mailsync/util/log.hpp"
#include "mailsync/util/redact.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <span>
#include <string>
#include <vector>

namespace mailsync {

namespace {

struct PasswordLogin {
  static constexpr AuthMode kMode = AuthMode::Password;

  static auto authenticate(imap::Connection &conn, const Principal &principal,
                           std::string_view secret)
      -> task<Result<imap::Response>> {
    co_return co_await conn.command(
        std::format("LOGIN {} {}", imap::quote(principal.value()),
                    imap::quote(secret)),
        "LOGIN <redacted>");
  }
};

struct XOAuth2Login {
  static constexpr AuthMode kMode = AuthMode::OAuth;

  static auto authenticate(imap::Connection &conn, const Principal &principal,
                           std::string_view token)
      -> task<Result<imap::Response>> {
    if (!conn.has_capability("AUTH=XOAUTH2")) {
      log::error("Server does not offer AUTH=XOAUTH2");
      co_return fail(Error::Unsupported);
    }
    co_return co_await conn.command(
        std::format("AUTHENTICATE XOAUTH2 {}",
                    imap::xoauth2_initial_response(principal.value(), token)),
        "AUTHENTICATE XOAUTH2 <redacted>");
  }
};

[[nodiscard]] auto parse_cursor(std::string_view cursor)
    -> std::optional<std::uint64_t> {
  if (cursor.empty()) {
    return 0;
  }
  std::uint64_t value = 0;
  const auto *end = cursor.data() + cursor.size();
  auto [ptr, ec] = std::from_chars(cursor.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

[[nodiscard]] auto join_uids(std::span<const std::uint64_t> uids)
    -> std::string {
  std::string out;
  for (auto uid : uids) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += std::to_string(uid);
  }
  return out;
}

// IMAP4rev1 transport. Labels are Gmail X-GM-LABELS when the server has
// X-GM-EXT-1 and plain keywords otherwise.
template <typename AuthPolicy>
class ImapTransport final : public MailboxTransport {
public:
  ImapTransport(boost::asio::any_io_executor executor,
                const MailboxConfig &config)
      : conn_(std::move(executor), config), cfg_(config) {}

  auto connect() -> task<Result<void>> override {
    selected_.clear();
    co_return co_await conn_.connect();
  }

  auto authenticate(const Principal &principal, std::string_view secret)
      -> task<Result<void>> override {
    auto resp = co_await AuthPolicy::authenticate(conn_, principal, secret);
    if (!resp) {
      co_return fail(resp.error());
    }
    if (resp->status != imap::Status::Ok) {
      log::warn("Authentication rejected for user {}: {}",
                util::hash_principal(principal.value()),
                util::sanitize_error(resp->text));
      co_return fail(imap::reply_error(*resp, Error::AuthenticationFailed));
    }

    // The capability list usually grows after login.
    auto caps = imap::parse_capabilities(resp->untagged, resp->text);
    if (caps.empty()) {
      auto refreshed = co_await run("CAPABILITY", Error::ProtocolError);
      if (!refreshed) {
        co_return fail(refreshed.error());
      }
      caps = imap::parse_capabilities(refreshed->untagged, refreshed->text);
    }
    conn_.set_capabilities(std::move(caps));
    gmail_ = conn_.has_capability("X-GM-EXT-1");
    co_return ok();
  }

  auto logout() -> task<Result<void>> override {
    if (!conn_.is_open()) {
      co_return ok();
    }
    auto resp = co_await conn_.command("LOGOUT");
    conn_.close();
    selected_.clear();
    if (!resp) {
      co_return fail(resp.error());
    }
    co_return ok();
  }

  auto noop() -> task<Result<void>> override {
    auto resp = co_await run("NOOP", Error::ProtocolError);
    if (!resp) {
      co_return fail(resp.error());
    }
    co_return ok();
  }

  auto list_folders() -> task<Result<std::vector<Folder>>> override {
    auto resp = co_await run(R"(LIST "" "*")", Error::ProtocolError);
    if (!resp) {
      co_return fail(resp.error());
    }
    std::vector<Folder> folders;
    for (const auto &line : resp->untagged) {
      if (auto folder = imap::parse_list_line(line.text)) {
        folders.push_back(std::move(*folder));
      }
    }
    co_return ok(std::move(folders));
  }

  auto select_folder(std::string_view folder)
      -> task<Result<FolderStatus>> override {
    auto resp = co_await run(std::format("SELECT {}", imap::quote(folder)),
                             Error::NotFound);
    if (!resp) {
      selected_.clear();
      co_return fail(resp.error());
    }
    selected_ = std::string(folder);
    selected_status_ = imap::parse_select(resp->untagged);
    co_return ok(selected_status_);
  }

  auto fetch_page(std::string_view folder, std::string_view cursor, int limit)
      -> task<Result<MailPage>> override {
    auto after = parse_cursor(cursor);
    if (!after || limit <= 0) {
      co_return fail(Error::InvalidArgument);
    }
    if (auto sel = co_await ensure_selected(folder); !sel) {
      co_return fail(sel.error());
    }

    // Scan forward in bounded UID windows; the UIDs held for one page grow
    // with the page size, not with the folder.
    std::vector<std::uint64_t> uids;
    std::uint64_t scanned = *after;
    auto span = std::max<std::uint64_t>(static_cast<std::uint64_t>(limit) * 4,
                                        kMinSearchSpan);
    bool reached_end = false;
    while (uids.size() < static_cast<std::size_t>(limit)) {
      const auto range =
          imap::next_search_range(scanned, span, selected_status_.uid_next);
      auto search = co_await run(
          std::format("UID SEARCH UID {} {}", imap::format_uid_range(range),
                      cfg_.search),
          Error::ProtocolError);
      if (!search) {
        co_return fail(search.error());
      }

      // "n:*" always matches the highest UID, even when it is below n.
      auto found = imap::parse_search(search->untagged);
      std::erase_if(found, [&](std::uint64_t uid) { return uid <= scanned; });
      std::ranges::sort(found);
      found.erase(std::unique(found.begin(), found.end()), found.end());
      uids.insert(uids.end(), found.begin(), found.end());

      if (!range.last) {
        reached_end = true;
        break;
      }
      scanned = *range.last;
      span = std::min(span * 2, kMaxSearchSpan);
    }

    MailPage page;
    if (uids.empty()) {
      page.next_cursor = std::string(cursor);
      page.exhausted = true;
      co_return ok(std::move(page));
    }

    const auto take = std::min(uids.size(), static_cast<std::size_t>(limit));
    std::span<const std::uint64_t> batch(uids.data(), take);
    auto fetch = co_await run(
        std::format("UID FETCH {} (UID FLAGS{} BODY.PEEK[HEADER.FIELDS "
                    "(SUBJECT FROM)])",
                    join_uids(batch), gmail_ ? " X-GM-LABELS" : ""),
        Error::ProtocolError);
    if (!fetch) {
      co_return fail(fetch.error());
    }

    for (const auto &line : fetch->untagged) {
      if (auto item = imap::parse_fetch(line)) {
        page.items.push_back(std::move(*item));
      }
    }
    std::ranges::sort(page.items, [](const MailItem &a, const MailItem &b) {
      return parse_cursor(a.id).value_or(0) < parse_cursor(b.id).value_or(0);
    });
    page.next_cursor = std::to_string(batch.back());
    page.exhausted = reached_end && take == uids.size();
    co_return ok(std::move(page));
  }

  auto mutate_label(std::string_view folder, std::string_view item_id,
                    std::string_view label, MutationOp op)
      -> task<Result<void>> override {
    if (auto sel = co_await ensure_selected(folder); !sel) {
      co_return fail(sel.error());
    }
    const char sign = op == MutationOp::AddLabel ? '+' : '-';
    const auto cmd =
        gmail_ ? std::format("UID STORE {} {}X-GM-LABELS.SILENT ({})", item_id,
                             sign, imap::quote(label))
               : std::format("UID STORE {} {}FLAGS.SILENT ({})", item_id, sign,
                             imap::keyword_for_label(label));
    auto resp = co_await run(cmd, Error::ProtocolError);
    if (!resp) {
      co_return fail(resp.error());
    }
    co_return ok();
  }

  auto has_label(std::string_view folder, std::string_view item_id,
                 std::string_view label) -> task<Result<bool>> override {
    if (auto sel = co_await ensure_selected(folder); !sel) {
      co_return fail(sel.error());
    }
    auto resp = co_await run(
        std::format("UID FETCH {} (UID {})", item_id,
                    gmail_ ? "X-GM-LABELS" : "FLAGS"),
        Error::ProtocolError);
    if (!resp) {
      co_return fail(resp.error());
    }
    const std::string wanted =
        gmail_ ? std::string(label) : imap::keyword_for_label(label);
    for (const auto &line : resp->untagged) {
      auto item = imap::parse_fetch(line);
      if (item && item->id == item_id) {
        co_return ok(std::ranges::find(item->labels, wanted) !=
                     item->labels.end());
      }
    }
    // The item is gone from the folder, so it carries no label here.
    co_return ok(false);
  }

  [[nodiscard]] auto auth_mode() const noexcept -> AuthMode override {
    return AuthPolicy::kMode;
  }

private:
  auto run(std::string_view cmd, Error negative)
      -> task<Result<imap::Response>> {
    auto resp = co_await conn_.command(cmd);
    if (!resp) {
      co_return fail(resp.error());
    }
    if (resp->status != imap::Status::Ok) {
      co_return fail(imap::reply_error(*resp, negative));
    }
    co_return std::move(resp);
  }

  auto ensure_selected(std::string_view folder) -> task<Result<void>> {
    if (selected_ == folder) {
      co_return ok();
    }
    auto status = co_await select_folder(folder);
    if (!status) {
      co_return fail(status.error());
    }
    co_return ok();
  }

  static constexpr std::uint64_t kMinSearchSpan = 256;
  static constexpr std::uint64_t kMaxSearchSpan = 65536;

  imap::Connection conn_;
  MailboxConfig cfg_;
  std::string selected_;
  FolderStatus selected_status_;
  bool gmail_{false};
};

} // namespace

auto make_transport_factory(boost::asio::any_io_executor executor,
                            const MailboxConfig &config) -> TransportFactory {
  return [executor = std::move(executor),
          config]() -> std::unique_ptr<MailboxTransport> {
    switch (config.auth_mode) {
    case AuthMode::OAuth:
      return std::make_unique<ImapTransport<XOAuth2Login>>(executor, config);
    case AuthMode::Password:
      break;
    }
    return std::make_unique<ImapTransport<PasswordLogin>>(executor, config);
  };
}

} // namespace mailsync
