#pragma once

#include <string>
#include <string_view>

namespace mailsync::util {

// First 12 hex chars of SHA-256 over the principal. Logs carry this instead
// of the raw mailbox address.
[[nodiscard]] auto hash_principal(std::string_view principal) -> std::string;

// Masks anything that looks like a credential in server or library error
// text: quoted LOGIN arguments, "password=...", "token=...", bearer values.
[[nodiscard]] auto sanitize_error(std::string_view text) -> std::string;

} // namespace mailsync::util
