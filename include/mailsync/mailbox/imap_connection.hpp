#pragma once

#include "mailsync/config/system_config.hpp"
#include "mailsync/core/coroutine.hpp"
#include "mailsync/core/error.hpp"
#include "mailsync/mailbox/imap_protocol.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mailsync::imap {

// Tagged command/response dialog over implicit TLS. Every socket operation
// carries its own deadline; a deadline that fires leaves the connection
// unusable and the caller is expected to reconnect.
class Connection {
public:
  Connection(boost::asio::any_io_executor executor, const MailboxConfig &config);
  ~Connection();

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  [[nodiscard]] auto connect() -> task<Result<void>>;

  // Sends "<tag> <command>" and collects untagged lines until the tagged
  // completion. A continuation request is answered with an empty line, which
  // aborts SASL exchanges that the server wants to extend.
  // `redacted` replaces the command text in trace logs.
  [[nodiscard]] auto command(std::string_view command,
                             std::string_view redacted = {})
      -> task<Result<Response>>;

  auto close() noexcept -> void;

  [[nodiscard]] auto is_open() const noexcept -> bool { return stream_ != nullptr; }
  [[nodiscard]] auto has_capability(std::string_view cap) const -> bool;
  auto set_capabilities(std::vector<std::string> caps) -> void {
    capabilities_ = std::move(caps);
  }

private:
  using Stream = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

  [[nodiscard]] auto read_line() -> task<Result<std::string>>;
  [[nodiscard]] auto read_exact(std::size_t n) -> task<Result<std::string>>;
  [[nodiscard]] auto read_response_line() -> task<Result<Line>>;
  [[nodiscard]] auto write(std::string data) -> task<Result<void>>;

  boost::asio::any_io_executor executor_;
  MailboxConfig cfg_;
  boost::asio::ssl::context ssl_ctx_;
  std::unique_ptr<Stream> stream_;
  std::string buffer_;
  std::vector<std::string> capabilities_;
  std::uint32_t next_tag_{0};
};

} // namespace mailsync::imap
