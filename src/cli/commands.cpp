#include "captlog/cli/commands.hpp"

#include "captlog/common/fs.hpp"
#include "captlog/common/process.hpp"
#include "captlog/config/config.hpp"
#include "captlog/entries/entry.hpp"
#include "captlog/entries/entry_writer.hpp"
#include "captlog/hooks/dispatcher.hpp"
#include "captlog/hooks/installer.hpp"
#include "captlog/logs/locator.hpp"
#include "captlog/observability/factory.hpp"
#include "captlog/observability/global.hpp"
#include "captlog/projects/resolver.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace captlog::cli {

namespace {

std::string version_string() {
#ifdef CAPTLOG_VERSION
  const std::string version = CAPTLOG_VERSION;
#else
  const std::string version = "0.1.0";
#endif
  return "captlog " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

// Global options are only recognised before the subcommand so hook
// arguments pass through untouched.
bool apply_global_options(std::vector<std::string> &args,
                          std::optional<std::filesystem::path> &config_override,
                          std::string &error) {
  while (!args.empty() && common::starts_with(args[0], "--config")) {
    if (args[0] == "--config") {
      if (args.size() < 2) {
        error = "missing value for --config";
        return false;
      }
      config_override = common::expand_path(args[1]);
      args.erase(args.begin(), args.begin() + 2);
      continue;
    }
    if (common::starts_with(args[0], "--config=")) {
      const auto value = args[0].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config_override = common::expand_path(value);
      args.erase(args.begin());
      continue;
    }
    break;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: captlog [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  btw <words...>                       Add a note to today's log (section 'other')\n";
  std::cout << "  wtf <words...>                       Add a note under 'What Broke or Got Weird'\n";
  std::cout << "  log-commit <name> <path> <sha> <msg> Record a commit in today's log\n";
  std::cout << "  hook <event> [--hooks-dir DIR] ...   Run the hook pipeline (called by git)\n";
  std::cout << "  install-hooks [--hooks-dir DIR] [--global]\n";
  std::cout << "                                       Install dispatcher hooks\n";
  std::cout << "  config-path                          Print the config file location\n";
  std::cout << "  config show                          Print the effective configuration\n";
  std::cout << "  version                              Print the version\n";
}

class App {
public:
  App(const std::optional<std::filesystem::path> &config_override, const Services &services)
      : config_(load_effective_config(config_override)),
        git_(services.git != nullptr ? services.git : &cli_runner_),
        git_publisher_(*git_),
        publisher_(services.publisher != nullptr ? services.publisher : &git_publisher_),
        writer_(config_, publisher_), cwd_(resolve_cwd(services.cwd)) {}

  int run_hook(std::vector<std::string> args);
  int run_note(std::vector<std::string> args, bool trouble);
  int run_log_commit(std::vector<std::string> args);
  int run_install_hooks(std::vector<std::string> args, const std::string &self);
  int run_config(std::vector<std::string> args);

private:
  static config::Config load_effective_config(const std::optional<std::filesystem::path> &path);
  static std::filesystem::path resolve_cwd(const std::optional<std::filesystem::path> &cwd);

  int report_record(const projects::Project &project, const entries::LogEntry &entry,
                    const common::Result<entries::RecordReport> &recorded);

  config::Config config_;
  git::GitCliRunner cli_runner_;
  git::IGitRunner *git_;
  git::GitPublisher git_publisher_;
  git::IPublisher *publisher_;
  entries::EntryWriter writer_;
  std::filesystem::path cwd_;
};

config::Config App::load_effective_config(const std::optional<std::filesystem::path> &path) {
  config::Config config;
  const auto location = config::config_path(path);
  if (!location.ok()) {
    observability::record_warning("config", location.error() + "; using defaults");
    config = config::default_config();
    config::apply_env_overrides(config);
  } else if (auto loaded = config::load_config(location.value()); loaded.ok()) {
    config = std::move(loaded.value());
  } else {
    observability::record_warning("config", loaded.error() + "; using defaults");
    config = config::default_config();
    config::apply_env_overrides(config);
  }

  observability::set_global_observer(observability::create_observer(config));

  const auto validated = config::validate_config(config);
  if (!validated.ok()) {
    observability::record_warning("config", validated.error());
  } else {
    for (const auto &warning : validated.value()) {
      observability::record_warning("config", warning);
    }
  }
  return config;
}

std::filesystem::path App::resolve_cwd(const std::optional<std::filesystem::path> &cwd) {
  if (cwd.has_value()) {
    return *cwd;
  }
  std::error_code ec;
  auto current = std::filesystem::current_path(ec);
  if (ec) {
    return std::filesystem::path(".");
  }
  return current;
}

int App::report_record(const projects::Project &project, const entries::LogEntry &entry,
                       const common::Result<entries::RecordReport> &recorded) {
  if (!recorded.ok()) {
    std::cerr << "failed to update " << project.name << " log: " << recorded.error() << "\n";
    return 1;
  }
  if (recorded.value().status == entries::ApplyStatus::Duplicate) {
    std::cout << "Entry already exists in " << project.name << " log: " << entry.text << "\n";
  } else {
    std::cout << "Added entry to " << project.name << " log: " << entry.text << "\n";
  }
  return 0;
}

int App::run_hook(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: captlog hook <event> [--hooks-dir DIR] [args...]\n";
    return 1;
  }

  hooks::HookContext context;
  context.event = args[0];
  context.cwd = cwd_;
  context.hooks_dir = hooks::default_hooks_dir();
  std::size_t first_arg = 1;
  if (args.size() >= 2 && args[1] == "--hooks-dir") {
    if (args.size() < 3) {
      std::cerr << "missing value for --hooks-dir\n";
      return 1;
    }
    context.hooks_dir = args[2];
    first_arg = 3;
  }
  context.args.assign(args.begin() + static_cast<long>(first_arg), args.end());

  const hooks::HookDispatcher dispatcher(config_, *git_, writer_);
  return dispatcher.dispatch(context);
}

int App::run_note(std::vector<std::string> args, const bool trouble) {
  const std::string text = entries::sanitize_text(join_tokens(args));
  if (text.empty()) {
    std::cerr << "usage: captlog " << (trouble ? "wtf" : "btw") << " <words...>\n";
    return 1;
  }

  const auto project = projects::resolve_project(cwd_, config_);
  const auto entry = trouble ? entries::make_trouble_entry(text) : entries::make_manual_entry(text);
  return report_record(project, entry, writer_.record(project, entry, logs::today_iso()));
}

int App::run_log_commit(std::vector<std::string> args) {
  if (args.size() < 4) {
    std::cerr << "usage: captlog log-commit <repo-name> <repo-path> <sha> <message>\n";
    return 1;
  }
  const std::string &repo_name = args[0];
  const std::filesystem::path repo_path = common::expand_path(args[1]);
  const std::string &sha = args[2];
  const std::string message = join_tokens(args, 3);

  if (entries::is_placeholder_sha(sha)) {
    std::cout << "Skipping commit without a hash\n";
    return 0;
  }

  const auto entry = entries::make_commit_entry(repo_name, message, sha);
  if (entry.text.empty() || entry.section.empty()) {
    std::cerr << "usage: captlog log-commit <repo-name> <repo-path> <sha> <message>\n";
    return 1;
  }
  const auto project = projects::resolve_project(repo_path, config_);
  return report_record(project, entry, writer_.record(project, entry, logs::today_iso()));
}

int App::run_install_hooks(std::vector<std::string> args, const std::string &self) {
  hooks::InstallOptions options;
  options.hooks_dir = hooks::default_hooks_dir();
  options.set_global = take_flag(args, "--global");
  std::string value;
  if (take_option(args, "--hooks-dir", value)) {
    options.hooks_dir = common::expand_path(value);
  }
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args[0] << "\n";
    return 1;
  }

  std::error_code ec;
  auto executable = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec || executable.empty()) {
    executable = common::normalize_path(
        common::find_executable(self).value_or(std::filesystem::path(self)));
  }
  options.executable = executable;

  const auto report = hooks::install_hooks(options, *git_);
  if (!report.ok()) {
    std::cerr << "install-hooks failed: " << report.error() << "\n";
    return 1;
  }
  for (const auto &hook : report.value().hooks) {
    if (hook.action == hooks::InstallAction::Conflict) {
      observability::record_warning("install", hook.path.string() + " and " + hook.path.string() +
                                                   hooks::kPreservedSuffix +
                                                   " both exist; left untouched");
      continue;
    }
    std::cout << hook.event << ": " << hooks::install_action_name(hook.action) << " ("
              << hook.path.string() << ")\n";
  }
  if (report.value().global_configured) {
    std::cout << "core.hooksPath set to " << report.value().hooks_dir.string() << "\n";
  }
  return 0;
}

int App::run_config(std::vector<std::string> args) {
  if (args.empty() || args[0] == "show") {
    std::cout << config::render_config(config_);
    return 0;
  }
  std::cerr << "unknown config command\n";
  return 1;
}

} // namespace

int run_cli(int argc, char **argv) { return run_cli(argc, argv, Services{}); }

int run_cli(int argc, char **argv, const Services &services) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::optional<std::filesystem::path> config_override;
  std::string global_error;
  if (!apply_global_options(args, config_override, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path(config_override);
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  App app(config_override, services);
  if (subcommand == "hook") {
    return app.run_hook(std::move(args));
  }
  if (subcommand == "btw") {
    return app.run_note(std::move(args), false);
  }
  if (subcommand == "wtf") {
    return app.run_note(std::move(args), true);
  }
  if (subcommand == "log-commit") {
    return app.run_log_commit(std::move(args));
  }
  if (subcommand == "install-hooks") {
    return app.run_install_hooks(std::move(args), argv[0]);
  }
  if (subcommand == "config") {
    return app.run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace captlog::cli
