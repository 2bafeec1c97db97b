#pragma once

#include "mailsync/core/coroutine.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <utility>

namespace mailsync::util {

// Coroutine mutex: a one-slot channel where holding the lock means owning
// the buffered message. Waiters queue in async_send in FIFO order.
class AsyncMutex {
public:
  class Guard {
  public:
    Guard() noexcept = default;
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;
    Guard(Guard &&other) noexcept
        : mutex_(std::exchange(other.mutex_, nullptr)) {}
    Guard &operator=(Guard &&other) noexcept {
      if (this != &other) {
        release();
        mutex_ = std::exchange(other.mutex_, nullptr);
      }
      return *this;
    }
    ~Guard() { release(); }

  private:
    friend class AsyncMutex;
    explicit Guard(AsyncMutex &mutex) noexcept : mutex_(&mutex) {}

    auto release() noexcept -> void {
      if (mutex_ != nullptr) {
        mutex_->unlock();
        mutex_ = nullptr;
      }
    }

    AsyncMutex *mutex_{nullptr};
  };

  explicit AsyncMutex(boost::asio::any_io_executor executor)
      : slot_(std::move(executor), 1) {}

  AsyncMutex(const AsyncMutex &) = delete;
  AsyncMutex &operator=(const AsyncMutex &) = delete;

  // Throws boost::system::system_error if the wait is cancelled.
  [[nodiscard]] auto lock() -> task<Guard> {
    co_await slot_.async_send(boost::system::error_code{}, use_awaitable);
    co_return Guard(*this);
  }

private:
  auto unlock() noexcept -> void {
    slot_.try_receive([](boost::system::error_code) {});
  }

  boost::asio::experimental::concurrent_channel<void(boost::system::error_code)>
      slot_;
};

} // namespace mailsync::util
