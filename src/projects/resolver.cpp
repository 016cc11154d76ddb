#include "captlog/projects/resolver.hpp"

#include "captlog/common/fs.hpp"

#include <iterator>

namespace captlog::projects {

namespace {

std::size_t depth(const std::filesystem::path &path) {
  return static_cast<std::size_t>(std::distance(path.begin(), path.end()));
}

std::string base_name(const std::filesystem::path &path) {
  const std::string name = path.filename().string();
  return name.empty() ? "root" : name;
}

} // namespace

std::string repository_name(const std::filesystem::path &dir) {
  const auto normalized = common::normalize_path(dir);
  if (const auto repo_root = common::find_repository_root(normalized); repo_root.has_value()) {
    return base_name(*repo_root);
  }
  return base_name(normalized);
}

Project resolve_project(const std::filesystem::path &cwd, const config::Config &config) {
  const auto target = common::normalize_path(cwd);

  const config::ProjectConfig *best = nullptr;
  std::size_t best_depth = 0;
  for (const auto &candidate : config.projects) {
    if (candidate.root.empty()) {
      continue;
    }
    const auto root = common::normalize_path(candidate.root);
    if (!common::is_subpath(target, root)) {
      continue;
    }
    // Strictly longer only: on identical roots the first declared stays.
    const std::size_t candidate_depth = depth(root);
    if (best == nullptr || candidate_depth > best_depth) {
      best = &candidate;
      best_depth = candidate_depth;
    }
  }

  if (best != nullptr) {
    return Project{.name = best->name,
                   .root = common::normalize_path(best->root),
                   .log_repo = best->log_repo,
                   .ad_hoc = false};
  }

  return Project{.name = repository_name(target),
                 .root = target,
                 .log_repo = config.global_log_repo,
                 .ad_hoc = true};
}

} // namespace captlog::projects
