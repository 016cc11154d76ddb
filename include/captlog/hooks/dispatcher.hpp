#pragma once

#include "captlog/common/result.hpp"
#include "captlog/config/schema.hpp"
#include "captlog/entries/entry_writer.hpp"
#include "captlog/git/runner.hpp"
#include "captlog/hooks/pipeline.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace captlog::hooks {

inline constexpr const char *kCommitMsgHook = "commit-msg";
inline constexpr const char *kPostCommitHook = "post-commit";
inline constexpr const char *kPreservedSuffix = ".local";

struct HookContext {
  std::string event;
  std::filesystem::path hooks_dir;
  std::vector<std::string> args;
  std::filesystem::path cwd;
};

class HookDispatcher {
public:
  HookDispatcher(const config::Config &config, git::IGitRunner &git,
                 const entries::EntryWriter &writer);

  /// Preserved hook, then pre-commit, then aggregation for commit-msg or
  /// hash annotation for post-commit.
  [[nodiscard]] std::vector<HookStep> steps_for(const HookContext &context) const;

  [[nodiscard]] int dispatch(const HookContext &context) const;

private:
  [[nodiscard]] HookStep preserved_hook_step(const HookContext &context) const;
  [[nodiscard]] HookStep pre_commit_step(const HookContext &context) const;
  [[nodiscard]] HookStep aggregation_step(const HookContext &context) const;
  [[nodiscard]] HookStep annotation_step(const HookContext &context) const;

  const config::Config &config_;
  git::IGitRunner &git_;
  const entries::EntryWriter &writer_;
};

[[nodiscard]] common::Result<std::string>
read_commit_subject(const std::filesystem::path &message_file);

} // namespace captlog::hooks
