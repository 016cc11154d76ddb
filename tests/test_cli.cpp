#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "captlog/cli/commands.hpp"
#include "captlog/logs/locator.hpp"
#include "captlog/observability/global.hpp"

#include <filesystem>

namespace {

using captlog::testing::EnvGuard;
using captlog::testing::TempWorkspace;

struct CliEnv {
  EnvGuard home;
  EnvGuard config_path;
  EnvGuard log_repo{"CAPTLOG_LOG_REPO", std::nullopt};
  EnvGuard no_publish{"CAPTLOG_NO_PUBLISH", std::nullopt};

  explicit CliEnv(const TempWorkspace &workspace)
      : home("HOME", workspace.path().string()),
        config_path("CAPTLOG_CONFIG_PATH", (workspace.path() / "config.toml").string()) {}

  ~CliEnv() { captlog::observability::set_global_observer(nullptr); }
};

int run_cli(const std::vector<std::string> &args, const captlog::cli::Services &services) {
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  return captlog::cli::run_cli(static_cast<int>(argv.size()), argv.data(), services);
}

void write_demo_config(const TempWorkspace &workspace, const std::string &extra = "") {
  workspace.create_file("config.toml", "log_dir = \"" + (workspace.path() / "logs").string() +
                                           "\"\nobservability = \"none\"\n" + extra +
                                           "\n[projects.demo]\nroot = \"" +
                                           (workspace.path() / "code" / "demo").string() + "\"\n");
  workspace.create_dir("code/demo/src");
}

std::filesystem::path today_file(const TempWorkspace &workspace, const std::string &base,
                                 const std::string &project) {
  return workspace.path() / base / project / (captlog::logs::today_iso() + ".md");
}

} // namespace

void register_cli_tests(std::vector<captlog::tests::TestCase> &tests) {
  using captlog::tests::require;
  using captlog::testing::read_text;
  using captlog::testing::RecordingGitRunner;
  using captlog::testing::RecordingPublisher;

  tests.push_back({"cli_version_help_and_unknown", [] {
                     const TempWorkspace workspace;
                     const CliEnv env(workspace);
                     require(run_cli({"captlog", "version"}, {}) == 0, "version exits 0");
                     require(run_cli({"captlog", "help"}, {}) == 0, "help exits 0");
                     require(run_cli({"captlog", "frobnicate"}, {}) == 1, "unknown command exits 1");
                     require(run_cli({"captlog", "--config"}, {}) == 1, "--config needs a value");
                   }});

  tests.push_back({"cli_config_path_accepts_override", [] {
                     const TempWorkspace workspace;
                     const CliEnv env(workspace);
                     require(run_cli({"captlog", "--config", (workspace.path() / "x.toml").string(),
                                      "config-path"},
                                     {}) == 0,
                             "config-path exits 0");
                   }});

  tests.push_back({"cli_btw_requires_text", [] {
                     const TempWorkspace workspace;
                     const CliEnv env(workspace);
                     write_demo_config(workspace);
                     captlog::cli::Services services;
                     services.cwd = workspace.path() / "code" / "demo";
                     require(run_cli({"captlog", "btw"}, services) == 1, "empty btw is a usage error");
                     require(run_cli({"captlog", "btw", "  "}, services) == 1, "blank btw too");
                     require(run_cli({"captlog", "wtf"}, services) == 1, "empty wtf too");
                   }});

  tests.push_back({"cli_btw_records_in_other", [] {
                     const TempWorkspace workspace;
                     const CliEnv env(workspace);
                     write_demo_config(workspace);
                     RecordingPublisher publisher;
                     captlog::cli::Services services;
                     services.publisher = &publisher;
                     services.cwd = workspace.path() / "code" / "demo" / "src";

                     require(run_cli({"captlog", "btw", "Had", "lunch"}, services) == 0, "btw exits 0");
                     const auto file = today_file(workspace, "logs", "demo");
                     require(read_text(file).find("## other\n- Had lunch\n") != std::string::npos,
                             "manual entry missing:\n" + read_text(file));
                     require(run_cli({"captlog", "btw", "Had lunch"}, services) == 0,
                             "duplicate btw still exits 0");
                     require(publisher.calls.empty(), "no log repo configured");
                   }});

  tests.push_back({"cli_wtf_records_trouble_note", [] {
                     const TempWorkspace workspace;
                     const CliEnv env(workspace);
                     write_demo_config(workspace);
                     captlog::cli::Services services;
                     RecordingPublisher publisher;
                     services.publisher = &publisher;
                     services.cwd = workspace.path() / "code" / "demo";
                     require(run_cli({"captlog", "wtf", "disk", "filled", "up"}, services) == 0,
                             "wtf exits 0");
                     require(read_text(today_file(workspace, "logs", "demo"))
                                     .find("# What Broke or Got Weird\n\n- disk filled up\n") !=
                                 std::string::npos,
                             "trouble note missing");
                   }});

  tests.push_back({"cli_log_commit_records_and_publishes", [] {
                     const TempWorkspace workspace;
                     const CliEnv env(workspace);
                     write_demo_config(workspace, "global_log_repo = \"" +
                                                      (workspace.path() / "logrepo").string() + "\"");
                     RecordingPublisher publisher;
                     captlog::cli::Services services;
                     services.publisher = &publisher;

                     const int code = run_cli({"captlog", "log-commit", "demo-api",
                                               (workspace.path() / "code" / "demo").string(),
                                               "abcdef1234", "Ship", "it"},
                                              services);
                     require(code == 0, "log-commit exits 0");
                     const auto file = today_file(workspace, "logrepo", "demo");
                     require(read_text(file).find("## demo-api\n- (abcdef1) Ship it\n") !=
                                 std::string::npos,
                             "commit entry missing:\n" + read_text(file));
                     require(publisher.calls.size() == 1, "one publish expected");
                     require(publisher.calls[0].message ==
                                 "Update demo logs for " + captlog::logs::today_iso(),
                             publisher.calls[0].message);
                   }});

  tests.push_back({"cli_log_commit_skips_placeholder_sha", [] {
                     const TempWorkspace workspace;
                     const CliEnv env(workspace);
                     write_demo_config(workspace);
                     captlog::cli::Services services;
                     RecordingPublisher publisher;
                     services.publisher = &publisher;
                     require(run_cli({"captlog", "log-commit", "demo",
                                      (workspace.path() / "code" / "demo").string(), "no-sha",
                                      "Initial commit"},
                                     services) == 0,
                             "no-sha exits 0");
                     require(!std::filesystem::exists(today_file(workspace, "logs", "demo")),
                             "nothing should be recorded");
                     require(run_cli({"captlog", "log-commit", "demo"}, services) == 1,
                             "missing arguments are a usage error");
                   }});

  tests.push_back({"cli_hook_commit_msg_records_entry", [] {
                     const TempWorkspace workspace;
                     const CliEnv env(workspace);
                     write_demo_config(workspace);
                     workspace.create_dir("code/demo/.git");
                     workspace.create_file("code/demo/.git/COMMIT_EDITMSG", "Wire up hooks\n");
                     RecordingGitRunner git;
                     git.respond("rev-parse", {.exit_code = 0,
                                               .stdout_text = "fedcba9876543210\n",
                                               .stderr_text = ""});
                     captlog::cli::Services services;
                     services.git = &git;
                     services.cwd = workspace.path() / "code" / "demo";

                     const int code = run_cli({"captlog", "hook", "commit-msg", "--hooks-dir",
                                               (workspace.path() / "hooks").string(),
                                               ".git/COMMIT_EDITMSG"},
                                              services);
                     require(code == 0, "hook exits 0");
                     require(read_text(today_file(workspace, "logs", "demo"))
                                     .find("## demo\n- (fedcba9) Wire up hooks\n") != std::string::npos,
                             "hook entry missing");
                   }});

  tests.push_back({"cli_broken_config_degrades_to_defaults", [] {
                     const TempWorkspace workspace;
                     const CliEnv env(workspace);
                     workspace.create_file("config.toml", "not valid toml\n");
                     workspace.create_dir("somewhere");
                     captlog::cli::Services services;
                     services.cwd = workspace.path() / "somewhere";
                     require(run_cli({"captlog", "btw", "still", "works"}, services) == 0,
                             "bad config must not block entries");
                     require(std::filesystem::exists(
                                 today_file(workspace, ".captlog/projects", "somewhere")),
                             "default log dir should be used");
                   }});

  tests.push_back({"cli_install_hooks_writes_dispatchers", [] {
                     const TempWorkspace workspace;
                     const CliEnv env(workspace);
                     RecordingGitRunner git;
                     captlog::cli::Services services;
                     services.git = &git;
                     require(run_cli({"captlog", "install-hooks", "--hooks-dir",
                                      (workspace.path() / "hooks").string()},
                                     services) == 0,
                             "install-hooks exits 0");
                     require(std::filesystem::exists(workspace.path() / "hooks" / "commit-msg"),
                             "commit-msg dispatcher installed");
                     require(git.calls.empty(), "no global config without --global");
                   }});
}
