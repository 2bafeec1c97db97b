#pragma once

#include "mailsync/util/enum.hpp"

#include <boost/describe/enum.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mailsync {

enum class FolderType : std::uint8_t {
  Inbox,
  Sent,
  Drafts,
  Trash,
  System,
  Label,
};
BOOST_DESCRIBE_ENUM(FolderType, Inbox, Sent, Drafts, Trash, System, Label)
MAILSYNC_DEFINE_ENUM_SERDE(FolderType, FolderType::Label)

struct Folder {
  std::string name;         // server-side mailbox name, used in commands
  std::string display_name; // name without the "[Gmail]/" prefix
  FolderType type{FolderType::Label};
  bool selectable{true};
  std::string delimiter{"/"};

  [[nodiscard]] auto is_user_label() const noexcept -> bool {
    return type == FolderType::Label && selectable;
  }

  auto operator==(const Folder &) const -> bool = default;
};

struct FolderStatus {
  std::int64_t exists{0};
  std::int64_t uid_validity{0};
  std::int64_t uid_next{0}; // 0 when the server did not report it
};

// Only the fields the classifier and review screen need.
struct MailItem {
  std::string id; // remote item id (UID)
  std::string subject;
  std::string from;
  std::vector<std::string> labels;
};

struct MailPage {
  std::vector<MailItem> items;
  std::string next_cursor;
  bool exhausted{false};
};

// Builds a Folder from one LIST response entry. Special-use flags decide the
// type; \Noselect marks a hierarchy-only node.
[[nodiscard]] auto make_folder(const std::vector<std::string> &flags,
                               std::string_view delimiter,
                               std::string_view name) -> Folder;

} // namespace mailsync
