#pragma once

#include "boxrun/common/result.hpp"
#include "boxrun/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace boxrun::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Default image reference: <repository>:<version>-<variant>.
[[nodiscard]] std::string default_image(const SandboxConfig &sandbox);

/// Dotted-key access used by `boxrun config get/set`.
[[nodiscard]] common::Result<std::string> get_config_value(const Config &config,
                                                           const std::string &key);
/// Every key accepted by get/set, sorted.
[[nodiscard]] std::vector<std::string> config_keys();
[[nodiscard]] common::Status set_config_value(Config &config, const std::string &key,
                                              const std::string &value);

} // namespace boxrun::config
