#include "captlog/git/runner.hpp"

#include "captlog/common/fs.hpp"
#include "captlog/entries/entry.hpp"

namespace captlog::git {

namespace {

std::string join_args(const std::vector<std::string> &args) {
  std::string out = "git";
  for (const auto &arg : args) {
    out += " " + arg;
  }
  return out;
}

} // namespace

common::Result<common::ProcessResult> GitCliRunner::run(const std::vector<std::string> &args,
                                                        const GitCommandOptions &options) {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.emplace_back("git");
  argv.insert(argv.end(), args.begin(), args.end());

  auto result = common::run_process(argv);
  if (!result.ok()) {
    return common::Result<common::ProcessResult>::failure(result.error());
  }

  if (result.value().exit_code != 0 && !options.allow_failure) {
    const std::string detail = common::trim(result.value().stderr_text);
    return common::Result<common::ProcessResult>::failure(
        detail.empty() ? join_args(args) + " exited with " +
                             std::to_string(result.value().exit_code)
                       : join_args(args) + ": " + detail);
  }
  return result;
}

std::optional<std::string> head_commit(IGitRunner &runner, const std::filesystem::path &repo) {
  const auto result = runner.run({"-C", repo.string(), "rev-parse", "--verify", "HEAD"},
                                 GitCommandOptions{.allow_failure = true});
  if (!result.ok() || result.value().exit_code != 0) {
    return std::nullopt;
  }
  const std::string sha = common::trim(result.value().stdout_text);
  if (sha.empty()) {
    return std::nullopt;
  }
  return entries::short_sha(sha);
}

std::optional<std::string> head_subject(IGitRunner &runner, const std::filesystem::path &repo) {
  const auto result = runner.run({"-C", repo.string(), "log", "-1", "--format=%s"},
                                 GitCommandOptions{.allow_failure = true});
  if (!result.ok() || result.value().exit_code != 0) {
    return std::nullopt;
  }
  const std::string subject = common::trim(result.value().stdout_text);
  if (subject.empty()) {
    return std::nullopt;
  }
  return subject;
}

} // namespace captlog::git
