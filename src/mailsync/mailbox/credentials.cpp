#include "mailsync/mailbox/credentials.hpp"

#include "mailsync/config/toml_util.hpp"
#include "mailsync/util/log.hpp"
#include "mailsync/util/redact.hpp"
#include "mailsync/util/time.hpp"

#include <glaze/json.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <system_error>

namespace mailsync::detail {

struct CredentialRecord {
  std::string secret;
  std::string updated_at;
};

struct CredentialFile {
  int version{1};
  std::map<std::string, CredentialRecord> credentials;
};

} // namespace mailsync::detail

namespace glz {

template <> struct meta<mailsync::detail::CredentialRecord> {
  using T = mailsync::detail::CredentialRecord;
  static constexpr auto value =
      object("secret", &T::secret, "updated_at", &T::updated_at);
};

template <> struct meta<mailsync::detail::CredentialFile> {
  using T = mailsync::detail::CredentialFile;
  static constexpr auto value =
      object("version", &T::version, "credentials", &T::credentials);
};

} // namespace glz

namespace mailsync {

namespace {

constexpr std::size_t kAppPasswordLength = 16;
constexpr std::size_t kMinPasswordLength = 12;
constexpr std::size_t kMaxPasswordLength = 64;

[[nodiscard]] auto strip_spaces(std::string_view s) -> std::string {
  std::string out;
  out.reserve(s.size());
  std::ranges::copy_if(s, std::back_inserter(out),
                       [](char c) { return c != ' '; });
  return out;
}

[[nodiscard]] auto looks_like_app_password(std::string_view secret) -> bool {
  const auto clean = strip_spaces(secret);
  return clean.size() == kAppPasswordLength &&
         std::ranges::all_of(clean, [](char c) {
           return std::isalpha(static_cast<unsigned char>(c)) != 0;
         });
}

[[nodiscard]] auto load_file(const std::filesystem::path &path)
    -> Result<detail::CredentialFile> {
  std::error_code fs_ec;
  if (!std::filesystem::exists(path, fs_ec)) {
    return ok(detail::CredentialFile{});
  }
  auto text = toml_util::read_file(path.string());
  if (!text) {
    return fail(Error::FileOpenFailed);
  }
  detail::CredentialFile file;
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(file, *text); ec) {
    log::error("Credential file {} is corrupt", path.string());
    return fail(Error::ParseError);
  }
  return ok(std::move(file));
}

[[nodiscard]] auto save_file(const std::filesystem::path &path,
                             const detail::CredentialFile &file)
    -> Result<void> {
  std::string json;
  if (auto out = glz::write_json(file); out) {
    json = std::move(*out);
  } else {
    return fail(Error::ParseError);
  }

  std::error_code fs_ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), fs_ec);
    if (fs_ec) {
      log::error("Cannot create {}: {}", path.parent_path().string(),
                 fs_ec.message());
      return fail(Error::FileOpenFailed);
    }
  }

  // Written beside the target and renamed over it, so readers never see a
  // partial file and the mode is 0600 from the first byte.
  const auto tmp = path.string() + ".tmp";
  const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (fd < 0) {
    log::error("Cannot open {} for writing", tmp);
    return fail(Error::FileOpenFailed);
  }
  std::size_t written = 0;
  while (written < json.size()) {
    const auto n = ::write(fd, json.data() + written, json.size() - written);
    if (n <= 0) {
      ::close(fd);
      std::filesystem::remove(tmp, fs_ec);
      log::error("Short write to {}", tmp);
      return fail(Error::FileOpenFailed);
    }
    written += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0 || ::close(fd) != 0) {
    std::filesystem::remove(tmp, fs_ec);
    return fail(Error::FileOpenFailed);
  }

  std::filesystem::rename(tmp, path, fs_ec);
  if (fs_ec) {
    log::error("Cannot replace {}: {}", path.string(), fs_ec.message());
    std::filesystem::remove(tmp, fs_ec);
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

} // namespace

auto principal_problem(std::string_view principal)
    -> std::optional<std::string_view> {
  static const std::regex kEmail(
      R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
  if (principal.empty()) {
    return "email address is required";
  }
  if (!std::regex_match(principal.begin(), principal.end(), kEmail)) {
    return "not a valid email address";
  }
  return std::nullopt;
}

auto password_problem(std::string_view password)
    -> std::optional<std::string_view> {
  if (password.empty()) {
    return "password is required";
  }
  if (has_control_chars(password)) {
    return "password contains control characters";
  }
  if (looks_like_app_password(password)) {
    const auto clean = strip_spaces(password);
    if (!std::ranges::all_of(clean, [](char c) {
          return std::islower(static_cast<unsigned char>(c)) != 0;
        })) {
      return "app passwords are lowercase; generate a new one at "
             "https://myaccount.google.com/apppasswords";
    }
    return std::nullopt;
  }

  if (password.size() > kMaxPasswordLength) {
    return "password must not exceed 64 characters";
  }
  if (password.size() < kMinPasswordLength) {
    return "regular passwords need at least 12 characters; consider an app "
           "password";
  }

  bool upper = false;
  bool lower = false;
  bool digit = false;
  bool special = false;
  for (char ch : password) {
    const auto c = static_cast<unsigned char>(ch);
    upper = upper || std::isupper(c) != 0;
    lower = lower || std::islower(c) != 0;
    digit = digit || std::isdigit(c) != 0;
    special = special || std::ispunct(c) != 0;
  }
  if (int{upper} + int{lower} + int{digit} + int{special} < 3) {
    return "password needs 3 of: uppercase, lowercase, digits, punctuation";
  }

  for (std::size_t i = 2; i < password.size(); ++i) {
    if (password[i] == password[i - 1] && password[i] == password[i - 2]) {
      return "password repeats a character three times in a row";
    }
  }
  return std::nullopt;
}

auto oauth_token_problem(std::string_view token)
    -> std::optional<std::string_view> {
  if (token.empty()) {
    return "access token is required";
  }
  if (std::ranges::any_of(token, [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0 ||
               std::iscntrl(static_cast<unsigned char>(c)) != 0;
      })) {
    return "access token must not contain whitespace";
  }
  return std::nullopt;
}

auto secret_problem(AuthMode mode, std::string_view secret)
    -> std::optional<std::string_view> {
  return mode == AuthMode::OAuth ? oauth_token_problem(secret)
                                 : password_problem(secret);
}

auto normalize_secret(AuthMode mode, std::string_view secret) -> std::string {
  if (mode == AuthMode::Password && looks_like_app_password(secret)) {
    return strip_spaces(secret);
  }
  return std::string(secret);
}

FileCredentialStore::FileCredentialStore(std::filesystem::path path)
    : path_(std::move(path)) {}

auto FileCredentialStore::get(const Principal &principal)
    -> Result<std::optional<std::string>> {
  std::lock_guard lock(mu_);
  auto file = load_file(path_);
  if (!file) {
    return fail(file.error());
  }
  auto it = file->credentials.find(principal.str());
  if (it == file->credentials.end()) {
    return ok(std::optional<std::string>{});
  }
  return ok(std::optional<std::string>{std::move(it->second.secret)});
}

auto FileCredentialStore::put(const Principal &principal,
                              std::string_view secret) -> Result<void> {
  std::lock_guard lock(mu_);
  auto file = load_file(path_);
  if (!file) {
    return fail(file.error());
  }
  file->credentials[principal.str()] = detail::CredentialRecord{
      .secret = std::string(secret),
      .updated_at = util::format_iso8601(util::Clock::now()),
  };
  if (auto saved = save_file(path_, *file); !saved) {
    return fail(saved.error());
  }
  log::info("Stored credentials for user {}",
            util::hash_principal(principal.value()));
  return ok();
}

auto FileCredentialStore::remove(const Principal &principal) -> Result<bool> {
  std::lock_guard lock(mu_);
  auto file = load_file(path_);
  if (!file) {
    return fail(file.error());
  }
  if (file->credentials.erase(principal.str()) == 0) {
    return ok(false);
  }
  if (auto saved = save_file(path_, *file); !saved) {
    return fail(saved.error());
  }
  log::info("Removed credentials for user {}",
            util::hash_principal(principal.value()));
  return ok(true);
}

} // namespace mailsync
