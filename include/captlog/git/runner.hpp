#pragma once

#include "captlog/common/process.hpp"
#include "captlog/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace captlog::git {

struct GitCommandOptions {
  bool allow_failure = false;
};

class IGitRunner {
public:
  virtual ~IGitRunner() = default;

  /// `args` excludes the leading "git".
  [[nodiscard]] virtual common::Result<common::ProcessResult>
  run(const std::vector<std::string> &args, const GitCommandOptions &options = {}) = 0;
};

class GitCliRunner final : public IGitRunner {
public:
  [[nodiscard]] common::Result<common::ProcessResult>
  run(const std::vector<std::string> &args, const GitCommandOptions &options = {}) override;
};

[[nodiscard]] std::optional<std::string> head_commit(IGitRunner &runner,
                                                     const std::filesystem::path &repo);

[[nodiscard]] std::optional<std::string> head_subject(IGitRunner &runner,
                                                      const std::filesystem::path &repo);

} // namespace captlog::git
