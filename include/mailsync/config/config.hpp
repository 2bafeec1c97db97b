#pragma once

#include "mailsync/config/system_config.hpp"
#include "mailsync/core/error.hpp"

namespace mailsync {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
  // Defaults plus MAILSYNC_* overrides, for runs without a config file.
  [[nodiscard]] static auto load_defaults() -> Result<SystemConfig>;

  [[nodiscard]] static auto validate(const SystemConfig &cfg) -> Result<void>;
};

// "~/x" -> "$HOME/x"; other paths are returned unchanged.
[[nodiscard]] auto expand_home(std::string_view path) -> std::string;

} // namespace mailsync
