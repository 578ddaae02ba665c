#pragma once

#include "scrubline/common/result.hpp"
#include "scrubline/config/schema.hpp"
#include "scrubline/patch/patcher.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scrubline::config {

[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Defaults, then the config file when it exists, then environment overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);

/// TOML text that parse_config reads back into the same Config.
[[nodiscard]] std::string render_config(const Config &config);

/// Hard errors fail; softer problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] patch::PatchOptions patch_options(const Config &config);

} // namespace scrubline::config
