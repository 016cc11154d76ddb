#include "captlog/hooks/dispatcher.hpp"

#include "captlog/common/fs.hpp"
#include "captlog/common/process.hpp"
#include "captlog/entries/entry.hpp"
#include "captlog/logs/locator.hpp"
#include "captlog/projects/resolver.hpp"

namespace captlog::hooks {

namespace {

std::filesystem::path repository_top(const std::filesystem::path &cwd) {
  const auto normalized = common::normalize_path(cwd);
  return common::find_repository_root(normalized).value_or(normalized);
}

bool is_log_repository(const std::filesystem::path &top, const config::Config &config) {
  std::vector<std::filesystem::path> repos;
  if (config.global_log_repo.has_value()) {
    repos.push_back(*config.global_log_repo);
  }
  for (const auto &project : config.projects) {
    if (project.log_repo.has_value()) {
      repos.push_back(*project.log_repo);
    }
  }
  for (const auto &repo : repos) {
    if (common::normalize_path(repo) == top) {
      return true;
    }
  }
  return false;
}

common::Result<StepOutcome> run_inherited(const std::vector<std::string> &argv,
                                          const std::filesystem::path &working_dir) {
  common::ProcessOptions options;
  options.working_dir = working_dir;
  options.capture_output = false;
  const auto result = common::run_process(argv, options);
  if (!result.ok()) {
    return common::Result<StepOutcome>::failure(result.error());
  }
  return common::Result<StepOutcome>::success(StepOutcome::ran(result.value().exit_code));
}

} // namespace

common::Result<std::string> read_commit_subject(const std::filesystem::path &message_file) {
  const auto content = common::read_file(message_file);
  if (!content.ok()) {
    return content;
  }
  for (const auto &line : common::split_lines(content.value())) {
    const std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    return common::Result<std::string>::success(trimmed);
  }
  return common::Result<std::string>::success("");
}

HookDispatcher::HookDispatcher(const config::Config &config, git::IGitRunner &git,
                               const entries::EntryWriter &writer)
    : config_(config), git_(git), writer_(writer) {}

std::vector<HookStep> HookDispatcher::steps_for(const HookContext &context) const {
  std::vector<HookStep> steps;
  steps.push_back(preserved_hook_step(context));
  steps.push_back(pre_commit_step(context));
  if (context.event == kCommitMsgHook) {
    steps.push_back(aggregation_step(context));
  } else if (context.event == kPostCommitHook) {
    steps.push_back(annotation_step(context));
  }
  return steps;
}

int HookDispatcher::dispatch(const HookContext &context) const {
  return run_pipeline(context.event, steps_for(context));
}

HookStep HookDispatcher::preserved_hook_step(const HookContext &context) const {
  return HookStep{
      .name = "preserved-hook",
      .policy = FailurePolicy::AbortOnFailure,
      .run = [context]() -> common::Result<StepOutcome> {
        const auto hook = context.hooks_dir / (context.event + kPreservedSuffix);
        std::error_code ec;
        if (!std::filesystem::exists(hook, ec)) {
          return common::Result<StepOutcome>::success(StepOutcome::skipped(""));
        }
        if (!common::is_executable(hook)) {
          return common::Result<StepOutcome>::success(
              StepOutcome::skipped(hook.string() + " is not executable"));
        }
        std::vector<std::string> argv{hook.string()};
        argv.insert(argv.end(), context.args.begin(), context.args.end());
        return run_inherited(argv, context.cwd);
      }};
}

HookStep HookDispatcher::pre_commit_step(const HookContext &context) const {
  return HookStep{
      .name = "pre-commit",
      .policy = FailurePolicy::AbortOnFailure,
      .run = [this, context]() -> common::Result<StepOutcome> {
        const auto top = repository_top(context.cwd);
        std::optional<std::string> config_file;
        for (const auto &candidate : config_.hooks.pre_commit_configs) {
          std::error_code ec;
          if (std::filesystem::is_regular_file(top / candidate, ec)) {
            config_file = candidate;
            break;
          }
        }
        if (!config_file.has_value()) {
          return common::Result<StepOutcome>::success(StepOutcome::skipped(""));
        }

        const auto tool =
            common::find_executable(common::expand_path(config_.hooks.pre_commit_command));
        if (!tool.has_value()) {
          return common::Result<StepOutcome>::success(StepOutcome::skipped(
              *config_file + " present but '" + config_.hooks.pre_commit_command +
              "' is not installed"));
        }

        std::vector<std::string> argv{tool->string(),
                                      "hook-impl",
                                      "--config=" + *config_file,
                                      "--hook-type=" + context.event,
                                      "--hook-dir=" + context.hooks_dir.string(),
                                      "--skip-on-missing-config",
                                      "--"};
        argv.insert(argv.end(), context.args.begin(), context.args.end());
        return run_inherited(argv, top);
      }};
}

HookStep HookDispatcher::aggregation_step(const HookContext &context) const {
  return HookStep{
      .name = "captlog",
      .policy = FailurePolicy::WarnOnFailure,
      .run = [this, context]() -> common::Result<StepOutcome> {
        if (context.args.empty()) {
          return common::Result<StepOutcome>::failure("no commit message file given");
        }
        // Publishing commits into a log repository runs these hooks too.
        const auto top = repository_top(context.cwd);
        if (is_log_repository(top, config_)) {
          return common::Result<StepOutcome>::success(StepOutcome::skipped(""));
        }
        std::filesystem::path message_file(context.args.front());
        if (message_file.is_relative()) {
          message_file = context.cwd / message_file;
        }
        const auto subject = read_commit_subject(message_file);
        if (!subject.ok()) {
          return common::Result<StepOutcome>::failure(subject.error());
        }
        if (subject.value().empty()) {
          return common::Result<StepOutcome>::success(StepOutcome::skipped(""));
        }

        const auto project = projects::resolve_project(context.cwd, config_);
        const auto entry = entries::make_commit_entry(projects::repository_name(context.cwd),
                                                      subject.value(), git::head_commit(git_, top));
        const auto recorded = writer_.record(project, entry, logs::today_iso());
        if (!recorded.ok()) {
          return common::Result<StepOutcome>::failure(recorded.error());
        }
        return common::Result<StepOutcome>::success(StepOutcome::ran(0));
      }};
}

// commit-msg runs before the commit exists, so its entry carries the parent
// hash. Recording again with the new HEAD replaces that line.
HookStep HookDispatcher::annotation_step(const HookContext &context) const {
  return HookStep{
      .name = "captlog-annotate",
      .policy = FailurePolicy::WarnOnFailure,
      .run = [this, context]() -> common::Result<StepOutcome> {
        const auto top = repository_top(context.cwd);
        if (is_log_repository(top, config_)) {
          return common::Result<StepOutcome>::success(StepOutcome::skipped(""));
        }
        const auto subject = git::head_subject(git_, top);
        const auto head = git::head_commit(git_, top);
        if (!subject.has_value() || !head.has_value()) {
          return common::Result<StepOutcome>::success(StepOutcome::skipped(""));
        }

        const auto project = projects::resolve_project(context.cwd, config_);
        const auto entry = entries::make_commit_entry(projects::repository_name(context.cwd),
                                                      *subject, head);
        const auto recorded = writer_.record(project, entry, logs::today_iso());
        if (!recorded.ok()) {
          return common::Result<StepOutcome>::failure(recorded.error());
        }
        return common::Result<StepOutcome>::success(StepOutcome::ran(0));
      }};
}

} // namespace captlog::hooks
