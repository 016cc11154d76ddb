#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace captlog::config {

struct ProjectConfig {
  std::string name;
  std::filesystem::path root;
  std::optional<std::filesystem::path> log_repo;
};

struct HooksConfig {
  std::vector<std::string> pre_commit_configs = {".pre-commit-config.yaml",
                                                 ".pre-commit-config.yml"};
  std::string pre_commit_command = "pre-commit";
};

struct Config {
  std::optional<std::filesystem::path> global_log_repo;
  std::filesystem::path log_dir;
  /// Declaration order is significant: first declared wins on equal roots.
  std::vector<ProjectConfig> projects;
  bool publish = true;
  std::string observability = "log";
  HooksConfig hooks;

  [[nodiscard]] const ProjectConfig *find_project(const std::string &name) const;
};

} // namespace captlog::config
