#pragma once

#include <boost/describe/enum.hpp>

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace mailsync {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Timeout,
  Cancelled,
  SystemNotRunning,
  ResourceExhausted,
  InvalidState,
  ProtocolError,
  AuthenticationFailed,
  LockedOut,
  ConnectionFailed,
  RateLimited,
  ValidationFailed,
  DataIntegrity,
  Unsupported,
  Unknown,
};
BOOST_DESCRIBE_ENUM(Error, Success, FileNotFound, FileOpenFailed, ParseError,
                    DatabaseError, DatabaseOpenFailed, DatabaseQueryFailed,
                    InvalidArgument, NotFound, AlreadyExists, Timeout,
                    Cancelled, SystemNotRunning, ResourceExhausted,
                    InvalidState, ProtocolError, AuthenticationFailed,
                    LockedOut, ConnectionFailed, RateLimited, ValidationFailed,
                    DataIntegrity, Unsupported, Unknown)

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 24> messages = {
      "success",
      "file not found",
      "failed to open file",
      "parse error",
      "database error",
      "failed to open database",
      "database query failed",
      "invalid argument",
      "not found",
      "already exists",
      "timeout",
      "cancelled",
      "system not running",
      "resource exhausted",
      "invalid state transition",
      "protocol error",
      "authentication failed",
      "too many failed authentication attempts",
      "connection failed",
      "rate limited",
      "validation failed",
      "local and remote state out of sync",
      "operation not supported by server",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "mailsync";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unrecognized error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

// Connection drops and timeouts are worth another attempt; everything else is
// final for the operation that produced it.
[[nodiscard]] inline auto is_transient(std::error_code ec) noexcept -> bool {
  return ec == make_error_code(Error::ConnectionFailed) ||
         ec == make_error_code(Error::Timeout);
}

// Stable snake_case kind for user-facing messages, e.g. "locked_out".
[[nodiscard]] auto error_kind(std::error_code ec) -> std::string_view;

} // namespace mailsync

template <> struct std::is_error_code_enum<mailsync::Error> : std::true_type {};
