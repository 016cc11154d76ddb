#include "captlog/git/publisher.hpp"

#include "captlog/common/fs.hpp"

namespace captlog::git {

GitPublisher::GitPublisher(IGitRunner &runner) : runner_(runner) {}

bool has_lock_files(const std::filesystem::path &repo_root) {
  const auto git_dir = repo_root / ".git";
  std::error_code ec;
  if (!std::filesystem::is_directory(git_dir, ec)) {
    return false;
  }
  for (std::filesystem::directory_iterator it(git_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->path().extension() == ".lock") {
      return true;
    }
  }
  return false;
}

std::string commit_message(const std::string &project, const std::string &date,
                           const bool manual) {
  if (manual) {
    return "Add manual entry to " + project + " logs for " + date;
  }
  return "Update " + project + " logs for " + date;
}

common::Status GitPublisher::commit_and_push(const std::filesystem::path &repo_root,
                                             const std::filesystem::path &changed_file,
                                             const std::string &message) {
  if (has_lock_files(repo_root)) {
    return common::Status::error("git lock files present in " + repo_root.string());
  }

  const std::string repo = repo_root.string();
  std::filesystem::path target = changed_file.lexically_relative(repo_root);
  if (target.empty() || common::starts_with(target.string(), "..")) {
    target = changed_file;
  }

  const auto added = runner_.run({"-C", repo, "add", target.string()});
  if (!added.ok()) {
    return added.status().context("git add");
  }

  const auto status = runner_.run({"-C", repo, "status", "--porcelain"});
  if (!status.ok()) {
    return status.status().context("git status");
  }
  if (common::trim(status.value().stdout_text).empty()) {
    return common::Status::success();
  }

  const auto committed = runner_.run({"-C", repo, "commit", "-m", message});
  if (!committed.ok()) {
    return committed.status().context("git commit");
  }

  const auto pushed = runner_.run({"-C", repo, "push"});
  if (!pushed.ok()) {
    return pushed.status().context("git push");
  }
  return common::Status::success();
}

} // namespace captlog::git
