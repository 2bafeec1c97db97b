#pragma once

#include "mailsync/config/system_config.hpp"
#include "mailsync/core/coroutine.hpp"
#include "mailsync/core/error.hpp"
#include "mailsync/model/audit.hpp"
#include "mailsync/model/mailbox.hpp"
#include "mailsync/util/id.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace mailsync {

// One authenticated connection to the remote mailbox. Implementations are
// not thread-safe; the session manager serializes use of each instance.
//
// Error mapping: bad credentials -> AuthenticationFailed, socket failures ->
// ConnectionFailed, deadlines -> Timeout, server throttling -> RateLimited,
// any other negative reply -> ProtocolError.
class MailboxTransport {
public:
  virtual ~MailboxTransport() = default;

  virtual auto connect() -> task<Result<void>> = 0;
  virtual auto authenticate(const Principal &principal, std::string_view secret)
      -> task<Result<void>> = 0;
  virtual auto logout() -> task<Result<void>> = 0;
  virtual auto noop() -> task<Result<void>> = 0;

  virtual auto list_folders() -> task<Result<std::vector<Folder>>> = 0;
  virtual auto select_folder(std::string_view folder)
      -> task<Result<FolderStatus>> = 0;
  // Items after `cursor` (empty = from the start), oldest first, at most
  // `limit` of them.
  virtual auto fetch_page(std::string_view folder, std::string_view cursor,
                          int limit) -> task<Result<MailPage>> = 0;
  virtual auto mutate_label(std::string_view folder, std::string_view item_id,
                            std::string_view label, MutationOp op)
      -> task<Result<void>> = 0;
  virtual auto has_label(std::string_view folder, std::string_view item_id,
                         std::string_view label) -> task<Result<bool>> = 0;

  [[nodiscard]] virtual auto auth_mode() const noexcept -> AuthMode = 0;
};

using TransportFactory = std::function<std::unique_ptr<MailboxTransport>()>;

// Picks the password or XOAUTH2 transport from `config.auth_mode`.
[[nodiscard]] auto make_transport_factory(boost::asio::any_io_executor executor,
                                          const MailboxConfig &config)
    -> TransportFactory;

} // namespace mailsync
