#include "mailsync/mailbox/imap_connection.hpp"

#include "mailsync/core/asio_awaitable.hpp"
#include "mailsync/util/log.hpp"
#include "mailsync/util/redact.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/write.hpp>

#include <openssl/ssl.h>

#include <algorithm>
#include <array>
#include <format>

namespace mailsync::imap {

namespace {

constexpr std::size_t kMaxLineLength = 1 << 20;
constexpr std::size_t kMaxLiteralSize = 64 << 20;

} // namespace

Connection::Connection(boost::asio::any_io_executor executor,
                       const MailboxConfig &config)
    : executor_(std::move(executor)), cfg_(config),
      ssl_ctx_(boost::asio::ssl::context::tls_client) {
  boost::system::error_code ec;
  ssl_ctx_.set_default_verify_paths(ec);
  if (ec) {
    log::warn("Could not load system CA paths: {}", ec.message());
  }
}

Connection::~Connection() { close(); }

auto Connection::connect() -> task<Result<void>> {
  close();
  const auto connect_timeout = std::chrono::seconds(cfg_.connect_timeout_sec);

  boost::asio::ip::tcp::resolver resolver(executor_);
  auto [resolve_ec, endpoints] = co_await resolver.async_resolve(
      cfg_.host, std::to_string(cfg_.port),
      boost::asio::cancel_after(connect_timeout, use_nothrow));
  if (resolve_ec) {
    log::debug("Failed to resolve {}:{} - {}", cfg_.host, cfg_.port,
               resolve_ec.message());
    co_return fail(network_error(resolve_ec));
  }

  auto stream = std::make_unique<Stream>(executor_, ssl_ctx_);
  if (SSL_set_tlsext_host_name(stream->native_handle(), cfg_.host.c_str()) !=
      1) {
    log::error("Failed to set TLS SNI host name {}", cfg_.host);
    co_return fail(Error::ConnectionFailed);
  }
  if (cfg_.verify_tls) {
    stream->set_verify_mode(boost::asio::ssl::verify_peer);
    stream->set_verify_callback(
        boost::asio::ssl::host_name_verification(cfg_.host));
  } else {
    stream->set_verify_mode(boost::asio::ssl::verify_none);
  }

  auto [connect_ec, endpoint] = co_await boost::asio::async_connect(
      stream->lowest_layer(), endpoints,
      boost::asio::cancel_after(connect_timeout, use_nothrow));
  (void)endpoint;
  if (connect_ec) {
    log::debug("Failed to connect to {}:{} - {}", cfg_.host, cfg_.port,
               connect_ec.message());
    co_return fail(network_error(connect_ec));
  }

  auto [handshake_ec] = co_await stream->async_handshake(
      boost::asio::ssl::stream_base::client,
      boost::asio::cancel_after(connect_timeout, use_nothrow));
  if (handshake_ec) {
    log::warn("TLS handshake with {} failed: {}", cfg_.host,
              handshake_ec.message());
    co_return fail(network_error(handshake_ec));
  }

  stream_ = std::move(stream);
  buffer_.clear();
  next_tag_ = 0;

  auto greeting = co_await read_response_line();
  if (!greeting) {
    co_return fail(greeting.error());
  }
  std::string_view text = greeting->text;
  if (!boost::algorithm::istarts_with(text, "* OK") &&
      !boost::algorithm::istarts_with(text, "* PREAUTH")) {
    log::warn("Unexpected IMAP greeting from {}: {}", cfg_.host,
              util::sanitize_error(text));
    close();
    co_return fail(Error::ConnectionFailed);
  }

  capabilities_ = parse_capabilities({}, text);
  if (capabilities_.empty()) {
    auto caps = co_await command("CAPABILITY");
    if (!caps) {
      co_return fail(caps.error());
    }
    capabilities_ = parse_capabilities(caps->untagged, caps->text);
  }
  log::debug("Connected to {}:{} ({} capabilities)", cfg_.host, cfg_.port,
             capabilities_.size());
  co_return ok();
}

auto Connection::command(std::string_view command, std::string_view redacted)
    -> task<Result<Response>> {
  if (!stream_) {
    co_return fail(Error::ConnectionFailed);
  }

  Response response;
  response.tag = std::format("A{:04}", ++next_tag_);
  log::trace("imap > {} {}", response.tag,
             redacted.empty() ? command : redacted);

  if (auto sent = co_await write(std::format("{} {}\r\n", response.tag, command));
      !sent) {
    co_return fail(sent.error());
  }

  while (true) {
    auto line = co_await read_response_line();
    if (!line) {
      co_return fail(line.error());
    }
    if (line->text.starts_with('+')) {
      if (auto sent = co_await write("\r\n"); !sent) {
        co_return fail(sent.error());
      }
      continue;
    }
    if (auto tagged = parse_tagged(line->text, response.tag)) {
      response.status = tagged->first;
      response.text = std::move(tagged->second);
      break;
    }
    response.untagged.push_back(std::move(*line));
  }

  if (response.status != Status::Ok) {
    log::debug("imap < {} {}", response.tag,
               util::sanitize_error(response.text));
  }
  co_return ok(std::move(response));
}

auto Connection::close() noexcept -> void {
  if (!stream_) {
    return;
  }
  boost::system::error_code ec;
  stream_->lowest_layer().shutdown(boost::asio::ip::tcp::socket::shutdown_both,
                                   ec);
  stream_->lowest_layer().close(ec);
  stream_.reset();
  buffer_.clear();
}

auto Connection::has_capability(std::string_view cap) const -> bool {
  return std::ranges::any_of(capabilities_, [cap](const std::string &c) {
    return boost::algorithm::iequals(c, cap);
  });
}

auto Connection::read_line() -> task<Result<std::string>> {
  const auto timeout = std::chrono::seconds(cfg_.command_timeout_sec);
  std::array<char, 4096> chunk{};

  while (true) {
    if (auto pos = buffer_.find("\r\n"); pos != std::string::npos) {
      std::string line = buffer_.substr(0, pos);
      buffer_.erase(0, pos + 2);
      co_return ok(std::move(line));
    }
    if (buffer_.size() > kMaxLineLength) {
      log::warn("IMAP line exceeds {} bytes", kMaxLineLength);
      close();
      co_return fail(Error::ProtocolError);
    }
    if (!stream_) {
      co_return fail(Error::ConnectionFailed);
    }
    auto [ec, n] = co_await stream_->async_read_some(
        boost::asio::buffer(chunk), boost::asio::cancel_after(timeout, use_nothrow));
    if (ec) {
      log::debug("IMAP read failed: {}", ec.message());
      close();
      co_return fail(network_error(ec));
    }
    buffer_.append(chunk.data(), n);
  }
}

auto Connection::read_exact(std::size_t n) -> task<Result<std::string>> {
  const auto timeout = std::chrono::seconds(cfg_.command_timeout_sec);
  std::array<char, 4096> chunk{};

  while (buffer_.size() < n) {
    if (!stream_) {
      co_return fail(Error::ConnectionFailed);
    }
    auto [ec, got] = co_await stream_->async_read_some(
        boost::asio::buffer(chunk), boost::asio::cancel_after(timeout, use_nothrow));
    if (ec) {
      log::debug("IMAP literal read failed: {}", ec.message());
      close();
      co_return fail(network_error(ec));
    }
    buffer_.append(chunk.data(), got);
  }
  std::string out = buffer_.substr(0, n);
  buffer_.erase(0, n);
  co_return ok(std::move(out));
}

auto Connection::read_response_line() -> task<Result<Line>> {
  Line line;
  auto first = co_await read_line();
  if (!first) {
    co_return fail(first.error());
  }
  line.text = std::move(*first);

  while (auto size = trailing_literal_size(line.text)) {
    if (*size > kMaxLiteralSize) {
      log::warn("IMAP literal of {} bytes refused", *size);
      close();
      co_return fail(Error::ProtocolError);
    }
    auto literal = co_await read_exact(*size);
    if (!literal) {
      co_return fail(literal.error());
    }
    line.literals.push_back(std::move(*literal));

    auto continuation = co_await read_line();
    if (!continuation) {
      co_return fail(continuation.error());
    }
    line.text += *continuation;
  }
  co_return ok(std::move(line));
}

auto Connection::write(std::string data) -> task<Result<void>> {
  if (!stream_) {
    co_return fail(Error::ConnectionFailed);
  }
  const auto timeout = std::chrono::seconds(cfg_.command_timeout_sec);
  auto [ec, written] = co_await boost::asio::async_write(
      *stream_, boost::asio::buffer(data),
      boost::asio::cancel_after(timeout, use_nothrow));
  (void)written;
  if (ec) {
    log::debug("IMAP write failed: {}", ec.message());
    close();
    co_return fail(network_error(ec));
  }
  co_return ok();
}

} // namespace mailsync::imap
