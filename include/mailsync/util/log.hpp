#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace mailsync::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

inline constexpr std::string_view kColorReset = "\o{33}[0m";

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Async logger: producers format on their own thread and hand the line to a
// bounded channel drained by one writer thread.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 4096;
  static constexpr std::size_t BATCH_LIMIT = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stderr};
  std::atomic<bool> colored_{false};
  std::atomic<std::uint64_t> dropped_{0};
  std::mutex sink_mu_;
  FILE *owned_file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;

  [[nodiscard]] static auto is_terminal(FILE *out) noexcept -> bool {
    if (out == nullptr) {
      return false;
    }
    const int fd = ::fileno(out);
    return fd >= 0 && ::isatty(fd) != 0;
  }

  auto write_batch(const std::vector<std::string> &batch) -> void {
    std::scoped_lock lock(sink_mu_);
    auto *out = output_.load(std::memory_order_acquire);
    for (const auto &line : batch) {
      std::fwrite(line.data(), 1, line.size(), out);
    }
    std::fflush(out);
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    std::vector<std::string> batch;
    batch.reserve(BATCH_LIMIT);

    while (running_.load(std::memory_order_acquire)) {
      std::optional<std::string> first;
      boost::system::error_code recv_ec;
      queue->async_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            recv_ec = ec;
            if (!ec) {
              first = std::move(item);
            }
          });

      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (recv_ec || !first) {
        break;
      }

      batch.clear();
      batch.push_back(std::move(*first));
      while (batch.size() < BATCH_LIMIT &&
             queue->try_receive(
                 [&](const boost::system::error_code &ec, std::string item) {
                   if (!ec) {
                     batch.push_back(std::move(item));
                   }
                 })) {
      }
      write_batch(batch);
    }

    // Flush whatever producers queued before stop().
    batch.clear();
    while (queue->try_receive(
        [&](const boost::system::error_code &ec, std::string item) {
          if (!ec) {
            batch.push_back(std::move(item));
          }
        })) {
    }
    if (!batch.empty()) {
      write_batch(batch);
    }
  }

  template <typename... Args>
  [[nodiscard]] auto format_line(Level level, std::format_string<Args...> fmt,
                                 Args &&...args) const -> std::string {
    auto now = std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    const bool color = colored_.load(std::memory_order_relaxed);
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                       color ? level_color(level) : "", level_name(level),
                       color ? kColorReset : "", tid,
                       std::format(fmt, std::forward<Args>(args)...));
  }

public:
  Logger() { colored_.store(is_terminal(stderr), std::memory_order_relaxed); }
  ~Logger() {
    stop();
    if (owned_file_) {
      std::fclose(owned_file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    queue_ctx_.restart();
    auto channel = std::make_shared<LogChannel>(queue_ctx_.get_executor(),
                                                QUEUE_CAPACITY);
    queue_.store(channel, std::memory_order_release);
    writer_ = std::jthread([this, channel] { writer_loop(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (auto channel = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
      channel->close();
    }
    queue_ctx_.stop();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() -> void {
    std::scoped_lock lock(sink_mu_);
    output_.store(stderr, std::memory_order_release);
    colored_.store(is_terminal(stderr), std::memory_order_relaxed);
    if (owned_file_) {
      std::fclose(owned_file_);
      owned_file_ = nullptr;
    }
  }

  // Appends to `path`; an empty path restores stderr.
  auto set_output_file(std::string_view path) -> bool {
    if (path.empty()) {
      set_output_stderr();
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    std::scoped_lock lock(sink_mu_);
    output_.store(f, std::memory_order_release);
    colored_.store(false, std::memory_order_relaxed);
    if (owned_file_) {
      std::fclose(owned_file_);
    }
    owned_file_ = f;
    return true;
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    auto line = format_line(level, fmt, std::forward<Args>(args)...);

    auto channel = queue_.load(std::memory_order_acquire);
    if (channel && channel->try_send(boost::system::error_code{}, line)) {
      return;
    }
    auto *out = output_.load(std::memory_order_acquire);
    // Blocking on a full pipe would stall the caller; drop instead unless a
    // human is watching the terminal.
    if (channel && !is_terminal(out)) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    std::scoped_lock lock(sink_mu_);
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

// Starts the writer for the lifetime of a scope.
class ScopedLogger {
public:
  ScopedLogger() { start(); }
  ~ScopedLogger() { stop(); }
  ScopedLogger(const ScopedLogger &) = delete;
  ScopedLogger &operator=(const ScopedLogger &) = delete;
};

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace mailsync::log
