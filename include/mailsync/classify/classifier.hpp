#pragma once

#include "mailsync/core/coroutine.hpp"
#include "mailsync/core/error.hpp"
#include "mailsync/model/mailbox.hpp"

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mailsync {

// One candidate label for one item. Confidence is in [0, 1].
struct LabelScore {
  std::string item_id;
  std::string label_id;   // Folder::name
  std::string label_name; // Folder::display_name
  double confidence{0.0};
  std::string reasoning;
};

// Pluggable scorer. Items may receive any number of scores, including none;
// the caller ranks them and applies the confidence threshold.
class Classifier {
public:
  virtual ~Classifier() = default;

  [[nodiscard]] virtual auto classify(std::span<const MailItem> batch,
                                      std::span<const Folder> labels)
      -> task<Result<std::vector<LabelScore>>> = 0;

  [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;
};

// Token overlap between a label name and the item's subject and sender.
// A label scores the fraction of its name tokens found in the item; labels
// whose full name appears verbatim in the subject score 1.
[[nodiscard]] auto create_keyword_classifier(int max_labels_per_item = 3)
    -> std::unique_ptr<Classifier>;

// Lowercased alphanumeric words of at least two characters.
[[nodiscard]] auto tokenize(std::string_view text) -> std::vector<std::string>;

} // namespace mailsync
