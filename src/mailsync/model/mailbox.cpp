#include "mailsync/model/mailbox.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace mailsync {

namespace {

constexpr std::string_view kGmailPrefix = "[Gmail]";

[[nodiscard]] auto has_flag(const std::vector<std::string> &flags,
                            std::string_view wanted) -> bool {
  return std::ranges::any_of(flags, [wanted](const std::string &f) {
    return f.size() == wanted.size() &&
           std::ranges::equal(f, wanted, [](char a, char b) {
             return std::tolower(static_cast<unsigned char>(a)) ==
                    std::tolower(static_cast<unsigned char>(b));
           });
  });
}

} // namespace

auto make_folder(const std::vector<std::string> &flags,
                 std::string_view delimiter, std::string_view name)
    -> Folder {
  Folder folder;
  folder.name = std::string(name);
  folder.delimiter = std::string(delimiter);
  folder.selectable = !has_flag(flags, "\\Noselect");

  if (name == "INBOX") {
    folder.type = FolderType::Inbox;
  } else if (has_flag(flags, "\\Sent")) {
    folder.type = FolderType::Sent;
  } else if (has_flag(flags, "\\Drafts")) {
    folder.type = FolderType::Drafts;
  } else if (has_flag(flags, "\\Trash")) {
    folder.type = FolderType::Trash;
  } else if (name.starts_with(kGmailPrefix)) {
    folder.type = FolderType::System;
  } else {
    folder.type = FolderType::Label;
  }

  folder.display_name = folder.name;
  if (name.starts_with(kGmailPrefix) && name.size() > kGmailPrefix.size() &&
      delimiter.size() == 1 && name[kGmailPrefix.size()] == delimiter[0]) {
    folder.display_name =
        std::string(name.substr(kGmailPrefix.size() + 1));
  }
  return folder;
}

} // namespace mailsync
