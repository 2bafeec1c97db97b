#include "mailsync/classify/classifier.hpp"

#include "mailsync/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_set>

namespace mailsync {

namespace {

[[nodiscard]] auto to_lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

// Hierarchical labels ("Work/Projects") score on their leaf segment.
[[nodiscard]] auto leaf_name(const Folder &folder) -> std::string_view {
  std::string_view name = folder.display_name.empty()
                              ? std::string_view{folder.name}
                              : std::string_view{folder.display_name};
  if (!folder.delimiter.empty()) {
    if (auto pos = name.rfind(folder.delimiter); pos != std::string_view::npos) {
      name.remove_prefix(pos + folder.delimiter.size());
    }
  }
  return name;
}

class KeywordClassifier final : public Classifier {
public:
  explicit KeywordClassifier(int max_labels)
      : max_labels_(std::max(1, max_labels)) {}

  auto classify(std::span<const MailItem> batch, std::span<const Folder> labels)
      -> task<Result<std::vector<LabelScore>>> override {
    struct Candidate {
      const Folder *folder;
      std::string phrase;
      std::vector<std::string> tokens;
    };
    std::vector<Candidate> candidates;
    candidates.reserve(labels.size());
    for (const auto &folder : labels) {
      const auto leaf = leaf_name(folder);
      auto tokens = tokenize(leaf);
      if (tokens.empty()) {
        continue;
      }
      candidates.push_back({&folder, to_lower(leaf), std::move(tokens)});
    }

    std::vector<LabelScore> out;
    for (const auto &item : batch) {
      const auto subject = to_lower(item.subject);
      const auto words = tokenize(std::format("{} {}", item.subject, item.from));
      const std::unordered_set<std::string> present(words.begin(), words.end());

      std::vector<LabelScore> scored;
      for (const auto &c : candidates) {
        std::vector<std::string_view> matched;
        for (const auto &t : c.tokens) {
          if (present.contains(t)) {
            matched.push_back(t);
          }
        }
        if (matched.empty()) {
          continue;
        }
        double confidence = static_cast<double>(matched.size()) /
                            static_cast<double>(c.tokens.size());
        std::string reasoning;
        if (subject.find(c.phrase) != std::string::npos) {
          confidence = 1.0;
          reasoning = std::format("subject contains \"{}\"", c.phrase);
        } else {
          reasoning = "matched";
          for (auto m : matched) {
            reasoning += std::format(" {}", m);
          }
        }
        scored.push_back({.item_id = item.id,
                          .label_id = c.folder->name,
                          .label_name = c.folder->display_name,
                          .confidence = confidence,
                          .reasoning = std::move(reasoning)});
      }

      std::ranges::stable_sort(scored, [](const auto &a, const auto &b) {
        return a.confidence > b.confidence;
      });
      if (scored.size() > static_cast<std::size_t>(max_labels_)) {
        scored.resize(static_cast<std::size_t>(max_labels_));
      }
      std::ranges::move(scored, std::back_inserter(out));
    }

    log::trace("Keyword scorer: {} item(s), {} label(s), {} score(s)",
               batch.size(), candidates.size(), out.size());
    co_return ok(std::move(out));
  }

  [[nodiscard]] auto name() const noexcept -> std::string_view override {
    return "keyword";
  }

private:
  int max_labels_;
};

} // namespace

auto tokenize(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> out;
  std::string current;
  auto flush = [&] {
    if (current.size() >= 2) {
      out.push_back(std::move(current));
    }
    current.clear();
  };
  for (char ch : text) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isalnum(c) != 0) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else {
      flush();
    }
  }
  flush();
  return out;
}

auto create_keyword_classifier(int max_labels_per_item)
    -> std::unique_ptr<Classifier> {
  return std::make_unique<KeywordClassifier>(max_labels_per_item);
}

} // namespace mailsync
