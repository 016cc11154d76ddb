#pragma once

#include "captlog/common/result.hpp"
#include "captlog/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace captlog::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] std::filesystem::path default_log_dir();

/// `override_path` (the --config flag) beats $CAPTLOG_CONFIG_PATH, which beats
/// ~/.captlog/config.toml. A directory means "<dir>/config.toml".
[[nodiscard]] common::Result<std::filesystem::path>
config_path(const std::optional<std::filesystem::path> &override_path = std::nullopt);

[[nodiscard]] Config default_config();

[[nodiscard]] common::Result<Config> load_config(const std::filesystem::path &path);
[[nodiscard]] common::Result<Config> parse_config(const std::string &content,
                                                  const std::filesystem::path &base_dir);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

[[nodiscard]] std::string render_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace captlog::config
