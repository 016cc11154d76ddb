#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "captlog/git/publisher.hpp"
#include "captlog/git/runner.hpp"

#include <filesystem>

namespace {

using Args = std::vector<std::string>;

} // namespace

void register_publisher_tests(std::vector<captlog::tests::TestCase> &tests) {
  using captlog::tests::require;
  namespace git = captlog::git;
  using captlog::testing::RecordingGitRunner;
  using captlog::testing::TempWorkspace;

  tests.push_back({"publisher_runs_add_status_commit_push", [] {
                     const TempWorkspace workspace;
                     workspace.create_dir("logrepo/.git");
                     const auto repo = workspace.path() / "logrepo";
                     RecordingGitRunner runner;
                     runner.respond("status", {.exit_code = 0,
                                               .stdout_text = " M demo/2024-05-01.md\n",
                                               .stderr_text = ""});
                     git::GitPublisher publisher(runner);

                     const auto status = publisher.commit_and_push(
                         repo, repo / "demo" / "2024-05-01.md", "Update demo logs for 2024-05-01");
                     require(status.ok(), status.error());
                     require(runner.calls.size() == 4, "four git commands expected");
                     const std::string r = repo.string();
                     require(runner.calls[0] == Args{"-C", r, "add", "demo/2024-05-01.md"},
                             "add should use the repo-relative path");
                     require(runner.calls[1] == Args{"-C", r, "status", "--porcelain"}, "status");
                     require(runner.calls[2] ==
                                 Args{"-C", r, "commit", "-m", "Update demo logs for 2024-05-01"},
                             "commit");
                     require(runner.calls[3] == Args{"-C", r, "push"}, "push");
                   }});

  tests.push_back({"publisher_skips_commit_when_clean", [] {
                     const TempWorkspace workspace;
                     workspace.create_dir("logrepo/.git");
                     const auto repo = workspace.path() / "logrepo";
                     RecordingGitRunner runner;
                     git::GitPublisher publisher(runner);
                     const auto status = publisher.commit_and_push(repo, repo / "x.md", "msg");
                     require(status.ok(), status.error());
                     require(runner.calls.size() == 2, "only add and status should run");
                   }});

  tests.push_back({"publisher_refuses_when_locked", [] {
                     const TempWorkspace workspace;
                     workspace.create_file("logrepo/.git/index.lock", "");
                     const auto repo = workspace.path() / "logrepo";
                     RecordingGitRunner runner;
                     git::GitPublisher publisher(runner);
                     const auto status = publisher.commit_and_push(repo, repo / "x.md", "msg");
                     require(!status.ok(), "lock files should block publishing");
                     require(status.error().find("lock") != std::string::npos, status.error());
                     require(runner.calls.empty(), "no git command should run");
                     require(git::has_lock_files(repo), "lock detection");
                   }});

  tests.push_back({"publisher_reports_push_failure", [] {
                     const TempWorkspace workspace;
                     workspace.create_dir("logrepo/.git");
                     const auto repo = workspace.path() / "logrepo";
                     RecordingGitRunner runner;
                     runner.respond("status", {.exit_code = 0, .stdout_text = "?? x.md\n", .stderr_text = ""});
                     runner.fail("push", "remote rejected");
                     git::GitPublisher publisher(runner);
                     const auto status = publisher.commit_and_push(repo, repo / "x.md", "msg");
                     require(!status.ok(), "push failure should be reported");
                     require(status.error() == "git push: remote rejected", status.error());
                   }});

  tests.push_back({"publisher_commit_messages", [] {
                     require(git::commit_message("demo", "2024-05-01", false) ==
                                 "Update demo logs for 2024-05-01",
                             "commit entry message");
                     require(git::commit_message("demo", "2024-05-01", true) ==
                                 "Add manual entry to demo logs for 2024-05-01",
                             "manual entry message");
                   }});

  tests.push_back({"head_commit_abbreviates_or_reports_none", [] {
                     RecordingGitRunner runner;
                     runner.respond("rev-parse", {.exit_code = 0,
                                                  .stdout_text = "0123456789abcdef\n",
                                                  .stderr_text = ""});
                     const auto head = git::head_commit(runner, "/repo");
                     require(head == std::optional<std::string>("0123456"), "seven characters");
                     require(runner.calls[0] == Args{"-C", "/repo", "rev-parse", "--verify", "HEAD"},
                             "rev-parse invocation");

                     RecordingGitRunner empty_repo;
                     empty_repo.respond("rev-parse",
                                        {.exit_code = 128, .stdout_text = "", .stderr_text = "bad"});
                     require(!git::head_commit(empty_repo, "/repo").has_value(),
                             "no HEAD before the first commit");
                   }});
}
