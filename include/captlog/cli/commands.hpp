#pragma once

#include "captlog/git/publisher.hpp"
#include "captlog/git/runner.hpp"

#include <filesystem>
#include <optional>

namespace captlog::cli {

/// Collaborators wired at startup. Null members fall back to the real
/// git-backed implementations and the process working directory.
struct Services {
  git::IGitRunner *git = nullptr;
  git::IPublisher *publisher = nullptr;
  std::optional<std::filesystem::path> cwd;
};

int run_cli(int argc, char **argv);
int run_cli(int argc, char **argv, const Services &services);

} // namespace captlog::cli
