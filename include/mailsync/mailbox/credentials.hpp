#pragma once

#include "mailsync/config/system_config.hpp"
#include "mailsync/core/error.hpp"
#include "mailsync/util/id.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mailsync {

// Each *_problem function returns a user-facing reason, or nullopt when the
// value is acceptable. The validate_* wrappers turn a reason into
// ValidationFailed.
[[nodiscard]] auto principal_problem(std::string_view principal)
    -> std::optional<std::string_view>;

// Accepts a Gmail app password (16 lowercase letters, spaces ignored) or a
// regular password of 12-64 characters with at least three character
// classes and no character repeated three times in a row.
[[nodiscard]] auto password_problem(std::string_view password)
    -> std::optional<std::string_view>;

[[nodiscard]] auto oauth_token_problem(std::string_view token)
    -> std::optional<std::string_view>;

[[nodiscard]] auto secret_problem(AuthMode mode, std::string_view secret)
    -> std::optional<std::string_view>;

// App passwords are shown grouped ("abcd efgh ijkl mnop"); the server wants
// them without spaces. Other secrets are returned unchanged.
[[nodiscard]] auto normalize_secret(AuthMode mode, std::string_view secret)
    -> std::string;

class CredentialStore {
public:
  virtual ~CredentialStore() = default;

  [[nodiscard]] virtual auto get(const Principal &principal)
      -> Result<std::optional<std::string>> = 0;
  [[nodiscard]] virtual auto put(const Principal &principal,
                                 std::string_view secret) -> Result<void> = 0;
  // false when nothing was stored for the principal.
  [[nodiscard]] virtual auto remove(const Principal &principal)
      -> Result<bool> = 0;
};

// JSON file keyed by principal, created with mode 0600 and replaced
// atomically on every write.
class FileCredentialStore final : public CredentialStore {
public:
  explicit FileCredentialStore(std::filesystem::path path);

  [[nodiscard]] auto get(const Principal &principal)
      -> Result<std::optional<std::string>> override;
  [[nodiscard]] auto put(const Principal &principal, std::string_view secret)
      -> Result<void> override;
  [[nodiscard]] auto remove(const Principal &principal)
      -> Result<bool> override;

  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path & {
    return path_;
  }

private:
  std::filesystem::path path_;
  std::mutex mu_;
};

} // namespace mailsync
