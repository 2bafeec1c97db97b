#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <functional>

namespace mailsync {

template <typename T = void> using task = boost::asio::awaitable<T>;

using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

/// Suspends the calling coroutine on its own executor. Throws
/// boost::system::system_error when the timer is cancelled.
inline auto async_sleep(std::chrono::milliseconds duration) -> task<void> {
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
  timer.expires_after(duration);
  co_await timer.async_wait(use_awaitable);
}

/// Injection point for components that wait between retries; tests replace
/// it to observe delays without sleeping.
using SleepFn = std::function<task<void>(std::chrono::milliseconds)>;

[[nodiscard]] inline auto default_sleep() -> SleepFn {
  return [](std::chrono::milliseconds d) -> task<void> {
    co_await async_sleep(d);
  };
}

} // namespace mailsync
