#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "captlog/common/fs.hpp"
#include "captlog/projects/resolver.hpp"

#include <filesystem>

namespace {

captlog::config::ProjectConfig project(const std::string &name, const std::filesystem::path &root) {
  return captlog::config::ProjectConfig{.name = name, .root = root, .log_repo = std::nullopt};
}

} // namespace

void register_resolver_tests(std::vector<captlog::tests::TestCase> &tests) {
  using captlog::tests::require;
  namespace projects = captlog::projects;
  using captlog::testing::TempWorkspace;

  tests.push_back({"resolver_longest_root_wins", [] {
                     const TempWorkspace workspace;
                     workspace.create_dir("code/work/sub");
                     workspace.create_dir("code/other");
                     auto config = captlog::testing::temp_config(workspace);
                     config.projects = {project("outer", workspace.path() / "code"),
                                        project("inner", workspace.path() / "code" / "work")};

                     const auto deep = projects::resolve_project(
                         workspace.path() / "code" / "work" / "sub", config);
                     require(deep.name == "inner", "inner should win, got " + deep.name);
                     require(!deep.ad_hoc, "configured project expected");

                     const auto side =
                         projects::resolve_project(workspace.path() / "code" / "other", config);
                     require(side.name == "outer", "outer should match, got " + side.name);

                     // Declaration order must not matter for nesting.
                     std::swap(config.projects[0], config.projects[1]);
                     const auto swapped = projects::resolve_project(
                         workspace.path() / "code" / "work" / "sub", config);
                     require(swapped.name == "inner", "inner should still win");
                   }});

  tests.push_back({"resolver_first_declared_wins_on_equal_roots", [] {
                     const TempWorkspace workspace;
                     workspace.create_dir("code");
                     auto config = captlog::testing::temp_config(workspace);
                     config.projects = {project("first", workspace.path().string() + "/code/"),
                                        project("second", workspace.path() / "code")};
                     const auto resolved = projects::resolve_project(workspace.path() / "code", config);
                     require(resolved.name == "first", "first declared should win");
                   }});

  tests.push_back({"resolver_follows_symlinked_roots", [] {
                     const TempWorkspace workspace;
                     workspace.create_dir("real/pkg");
                     std::filesystem::create_directory_symlink(workspace.path() / "real",
                                                               workspace.path() / "link");
                     auto config = captlog::testing::temp_config(workspace);
                     config.projects = {project("linked", workspace.path() / "link")};
                     const auto resolved =
                         projects::resolve_project(workspace.path() / "real" / "pkg", config);
                     require(resolved.name == "linked", "symlinked root should match");
                     require(resolved.root == workspace.path() / "real", "root should be resolved");
                   }});

  tests.push_back({"resolver_matches_whole_components", [] {
                     const TempWorkspace workspace;
                     workspace.create_dir("a/b");
                     workspace.create_dir("a/bc");
                     auto config = captlog::testing::temp_config(workspace);
                     config.projects = {project("b", workspace.path() / "a" / "b")};
                     const auto resolved = projects::resolve_project(workspace.path() / "a" / "bc", config);
                     require(resolved.ad_hoc, "a/bc is not inside a/b");
                     require(resolved.name == "bc", "ad-hoc name should be bc, got " + resolved.name);
                   }});

  tests.push_back({"resolver_falls_back_to_repository_name", [] {
                     const TempWorkspace workspace;
                     workspace.create_dir("myrepo/.git");
                     workspace.create_dir("myrepo/src/deep");
                     auto config = captlog::testing::temp_config(workspace);
                     config.global_log_repo = workspace.path() / "notes";
                     config.projects = {project("elsewhere", workspace.path() / "elsewhere")};

                     const auto cwd = workspace.path() / "myrepo" / "src" / "deep";
                     const auto resolved = projects::resolve_project(cwd, config);
                     require(resolved.ad_hoc, "ad-hoc project expected");
                     require(resolved.name == "myrepo", "repository name expected, got " + resolved.name);
                     require(resolved.root == captlog::common::normalize_path(cwd), "root is cwd");
                     require(resolved.log_repo == config.global_log_repo, "global repo inherited");
                   }});

  tests.push_back({"resolver_git_file_marks_repository", [] {
                     const TempWorkspace workspace;
                     workspace.create_file("worktree/.git", "gitdir: /elsewhere\n");
                     workspace.create_dir("worktree/lib");
                     require(projects::repository_name(workspace.path() / "worktree" / "lib") ==
                                 "worktree",
                             "a .git file should mark the repository root");
                   }});

  tests.push_back({"resolver_ignores_projects_without_root", [] {
                     const TempWorkspace workspace;
                     workspace.create_dir("plain");
                     auto config = captlog::testing::temp_config(workspace);
                     config.projects = {project("rootless", "")};
                     const auto resolved = projects::resolve_project(workspace.path() / "plain", config);
                     require(resolved.ad_hoc, "rootless project must not match");
                     require(resolved.name == "plain", "directory name expected, got " + resolved.name);
                   }});

  tests.push_back({"resolver_handles_missing_directories", [] {
                     const TempWorkspace workspace;
                     auto config = captlog::testing::temp_config(workspace);
                     config.projects = {project("ghost", workspace.path() / "not" / "yet")};
                     const auto resolved = projects::resolve_project(
                         workspace.path() / "not" / "yet" / "there" / "..", config);
                     require(resolved.name == "ghost", "lexical normalization should apply");
                   }});
}
