#pragma once

#include "captlog/common/result.hpp"
#include "captlog/git/runner.hpp"

#include <filesystem>
#include <string>

namespace captlog::git {

class IPublisher {
public:
  virtual ~IPublisher() = default;

  /// Stages `changed_file`, commits and pushes. A clean tree after staging is
  /// success without a commit.
  [[nodiscard]] virtual common::Status commit_and_push(const std::filesystem::path &repo_root,
                                                       const std::filesystem::path &changed_file,
                                                       const std::string &message) = 0;
};

class GitPublisher final : public IPublisher {
public:
  explicit GitPublisher(IGitRunner &runner);

  [[nodiscard]] common::Status commit_and_push(const std::filesystem::path &repo_root,
                                               const std::filesystem::path &changed_file,
                                               const std::string &message) override;

private:
  IGitRunner &runner_;
};

[[nodiscard]] bool has_lock_files(const std::filesystem::path &repo_root);

[[nodiscard]] std::string commit_message(const std::string &project, const std::string &date,
                                         bool manual);

} // namespace captlog::git
