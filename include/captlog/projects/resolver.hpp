#pragma once

#include "captlog/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace captlog::projects {

struct Project {
  std::string name;
  std::filesystem::path root;
  std::optional<std::filesystem::path> log_repo;
  bool ad_hoc = false;
};

/// Maps a working directory to a project. Never fails: the most specific
/// configured root containing `cwd` wins, otherwise an ad-hoc project named
/// after the enclosing repository (or `cwd`) is synthesized.
[[nodiscard]] Project resolve_project(const std::filesystem::path &cwd,
                                      const config::Config &config);

[[nodiscard]] std::string repository_name(const std::filesystem::path &dir);

} // namespace captlog::projects
