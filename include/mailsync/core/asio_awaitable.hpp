#pragma once

#include "mailsync/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace mailsync {

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);
namespace awaitable_ops = boost::asio::experimental::awaitable_operators;

// Socket-level failures collapse into the two transient kinds. A cancelled
// operation here is always a cancel_after deadline firing.
[[nodiscard]] inline auto
network_error(const boost::system::error_code &ec) noexcept -> Error {
  if (ec == boost::asio::error::operation_aborted ||
      ec == boost::asio::error::timed_out) {
    return Error::Timeout;
  }
  return Error::ConnectionFailed;
}

} // namespace mailsync
