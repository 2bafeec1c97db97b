#pragma once

#include "mailsync/util/time.hpp"

#include <chrono>
#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace mailsync::cli::fmt {

namespace ansi {

inline auto is_tty() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout));
  return tty;
}

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kDim = "\033[2m";

inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kYellow = "\033[33m";
inline constexpr std::string_view kBlue = "\033[34m";
inline constexpr std::string_view kCyan = "\033[36m";

inline auto colorize(std::string_view text, std::string_view color)
    -> std::string {
  if (!is_tty()) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto bold(std::string_view text) -> std::string {
  return colorize(text, kBold);
}

inline auto green(std::string_view text) -> std::string {
  return colorize(text, kGreen);
}

inline auto red(std::string_view text) -> std::string {
  return colorize(text, kRed);
}

inline auto yellow(std::string_view text) -> std::string {
  return colorize(text, kYellow);
}

inline auto blue(std::string_view text) -> std::string {
  return colorize(text, kBlue);
}

inline auto cyan(std::string_view text) -> std::string {
  return colorize(text, kCyan);
}

inline auto dim(std::string_view text) -> std::string {
  return colorize(text, kDim);
}

inline auto ansi_visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  bool in_escape = false;
  for (char c : s) {
    if (in_escape) {
      if (c == 'm')
        in_escape = false;
    } else if (c == '\033') {
      in_escape = true;
    } else {
      ++width;
    }
  }
  return width;
}

} // namespace ansi

inline auto colorize_run_status(std::string_view status) -> std::string {
  if (status == "completed")
    return ansi::green(status);
  if (status == "failed")
    return ansi::red(status);
  if (status == "in_progress")
    return ansi::yellow(status);
  if (status == "paused")
    return ansi::cyan(status);
  return std::string(status);
}

inline auto colorize_suggestion_status(std::string_view status)
    -> std::string {
  if (status == "applied")
    return ansi::green(status);
  if (status == "approved")
    return ansi::blue(status);
  if (status == "rejected")
    return ansi::red(status);
  if (status == "no_match")
    return ansi::dim(status);
  return std::string(status);
}

inline auto colorize_session_state(std::string_view state) -> std::string {
  if (state == "connected")
    return ansi::green(state);
  if (state == "error")
    return ansi::red(state);
  if (state == "connecting")
    return ansi::yellow(state);
  return ansi::dim(state);
}

// Cuts to `width` visible characters, marking the cut with "...".
inline auto truncate(std::string_view text, std::size_t width) -> std::string {
  if (text.size() <= width) {
    return std::string(text);
  }
  if (width <= 3) {
    return std::string(text.substr(0, width));
  }
  return std::format("{}...", text.substr(0, width - 3));
}

class Table {
public:
  struct Column {
    std::string header;
    std::size_t width;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  auto print_header() const -> void {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      if (i > 0)
        std::print(" ");
      const auto &col = columns_[i];
      if (col.right_align) {
        std::print("{:>{}}", col.header, col.width);
      } else {
        std::print("{:<{}}", col.header, col.width);
      }
    }
    std::println("");

    std::size_t total_width = 0;
    for (const auto &col : columns_)
      total_width += col.width;
    total_width += columns_.size() - 1;
    std::println("{}", std::string(total_width, '-'));
  }

  auto print_row(const std::vector<std::string> &values) const -> void {
    for (std::size_t i = 0; i < columns_.size() && i < values.size(); ++i) {
      if (i > 0)
        std::print(" ");
      const auto &col = columns_[i];
      const auto &val = values[i];
      auto visible = ansi::ansi_visible_width(val);
      auto pad = visible < col.width ? col.width - visible : 0;
      if (col.right_align) {
        std::print("{}{}", std::string(pad, ' '), val);
      } else {
        std::print("{}{}", val, std::string(pad, ' '));
      }
    }
    std::println("");
  }

private:
  std::vector<Column> columns_;
};

inline auto format_timestamp(std::chrono::system_clock::time_point tp)
    -> std::string {
  return util::format_local_timestamp(tp);
}

inline auto format_confidence(double confidence) -> std::string {
  return std::format("{:.0f}%", confidence * 100.0);
}

inline auto ascii_bar(double fraction, std::size_t width = 30) -> std::string {
  if (fraction < 0.0)
    fraction = 0.0;
  auto filled = static_cast<std::size_t>(fraction * static_cast<double>(width));
  if (filled > width)
    filled = width;
  return std::format("[{}{}]", std::string(filled, '#'),
                     std::string(width - filled, ' '));
}

} // namespace mailsync::cli::fmt
