#pragma once

#include <algorithm>
#include <cctype>
#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace mailsync {

[[nodiscard]] inline auto has_control_chars(std::string_view value) noexcept
    -> bool {
  return std::any_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

// Phantom type tags for type-safe ID disambiguation
struct PrincipalTag {};
struct SessionTag {};
struct RunTag {};
struct SuggestionTag {};

// Type-safe ID wrapper using phantom type pattern
// Prevents accidental mixing of different ID types at compile time
template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

using Principal = TypedId<PrincipalTag>;
using SessionId = TypedId<SessionTag>;
using RunId = TypedId<RunTag>;
using SuggestionId = TypedId<SuggestionTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

namespace detail {
[[nodiscard]] auto generate_short_uuid() -> std::string;
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

// Time-ordered, so ids sort by creation time in listings.
[[nodiscard]] inline auto generate_run_id() -> RunId {
  return RunId{detail::generate_uuid_v7_like()};
}

[[nodiscard]] inline auto generate_session_id() -> SessionId {
  return SessionId{detail::generate_uuid_v7_like()};
}

// Suggestion ids are derived from the run and the remote item so that
// re-classifying the same item during a resumed run maps to the same row.
[[nodiscard]] inline auto make_suggestion_id(const RunId &run_id,
                                             std::string_view remote_item_id)
    -> SuggestionId {
  return SuggestionId{std::format("{}:{}", run_id.value(), remote_item_id)};
}

} // namespace mailsync

// `is_avalanching` makes ankerl::unordered_dense::hash delegate here instead
// of hashing the object bytes.
template <typename Tag> struct std::hash<mailsync::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const mailsync::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<mailsync::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const mailsync::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
