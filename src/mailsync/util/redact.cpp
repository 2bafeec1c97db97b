#include "mailsync/util/redact.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>
#include <memory>
#include <regex>

namespace mailsync::util {

namespace {

struct MdCtxDeleter {
  auto operator()(EVP_MD_CTX *ctx) const noexcept -> void {
    EVP_MD_CTX_free(ctx);
  }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

constexpr std::size_t kPrincipalHashLen = 12;

} // namespace

auto hash_principal(std::string_view principal) -> std::string {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;

  MdCtxPtr ctx{EVP_MD_CTX_new()};
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), principal.data(), principal.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
    // Never fall back to the raw principal.
    return std::string(kPrincipalHashLen, '?');
  }

  std::string out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len && out.size() < kPrincipalHashLen;
       ++i) {
    out += std::format("{:02x}", digest[i]);
  }
  out.resize(kPrincipalHashLen);
  return out;
}

auto sanitize_error(std::string_view text) -> std::string {
  static const std::regex kEmail(
      R"(\b[A-Za-z0-9._%+-]+@([A-Za-z0-9.-]+\.[A-Za-z]{2,})\b)");
  static const std::regex kLogin(R"((LOGIN\s+)\S+\s+("[^"]*"|\S+))",
                                 std::regex::icase);
  static const std::regex kXoauth(R"((XOAUTH2\s+)\S+)", std::regex::icase);
  static const std::regex kBearer(R"((Bearer\s+)\S+)", std::regex::icase);
  static const std::regex kGoogleToken(R"(ya29\.[A-Za-z0-9_-]+)");
  static const std::regex kKeyValue(
      R"(\b(password|passwd|secret|token|access_token)(\s*[=:]\s*)\S+)",
      std::regex::icase);

  std::string out{text};
  out = std::regex_replace(out, kLogin, "$1*** ***");
  out = std::regex_replace(out, kXoauth, "$1***");
  out = std::regex_replace(out, kBearer, "$1***");
  out = std::regex_replace(out, kGoogleToken, "ya29.***");
  out = std::regex_replace(out, kKeyValue, "$1$2***");
  out = std::regex_replace(out, kEmail, "***@$1");
  return out;
}

} // namespace mailsync::util
