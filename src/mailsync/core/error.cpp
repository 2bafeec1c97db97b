#include "mailsync/core/error.hpp"

#include "mailsync/util/enum.hpp"

namespace mailsync {

auto error_kind(std::error_code ec) -> std::string_view {
  if (ec.category() == error_category()) {
    return util::enum_to_snake_case_view(static_cast<Error>(ec.value()));
  }
  return ec.category().name();
}

} // namespace mailsync
