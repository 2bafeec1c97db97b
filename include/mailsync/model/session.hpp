#pragma once

#include "mailsync/config/system_config.hpp"
#include "mailsync/util/enum.hpp"
#include "mailsync/util/id.hpp"
#include "mailsync/util/time.hpp"

#include <boost/describe/enum.hpp>
#include <cstdint>
#include <map>
#include <string>

namespace mailsync {

enum class SessionState : std::uint8_t {
  Connecting,
  Connected,
  Disconnected,
  Error,
};
BOOST_DESCRIBE_ENUM(SessionState, Connecting, Connected, Disconnected, Error)
MAILSYNC_DEFINE_ENUM_SERDE(SessionState, SessionState::Disconnected)

// Snapshot of a live session, also the shape mirrored to the sessions table.
struct SessionInfo {
  SessionId id;
  Principal principal;
  SessionState state{SessionState::Connecting};
  AuthMode auth_mode{AuthMode::Password};
  util::TimePoint created_at{};
  util::TimePoint last_activity{};
  int retry_count{0};
  int keepalive_failures{0};
  std::int64_t owner_pid{0};
  std::string selected_folder;

  [[nodiscard]] auto is_stale(util::TimePoint now,
                              std::chrono::seconds threshold) const noexcept
      -> bool {
    return now - last_activity > threshold;
  }
};

struct SessionStats {
  int total{0};
  int active{0};
  int stale{0};
  std::map<std::string, int> by_principal;
};

} // namespace mailsync
