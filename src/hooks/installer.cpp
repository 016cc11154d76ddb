#include "captlog/hooks/installer.hpp"

#include "captlog/common/fs.hpp"
#include "captlog/hooks/dispatcher.hpp"
#include "captlog/logs/log_store.hpp"

namespace captlog::hooks {

namespace {

std::string shell_quote(const std::string &value) {
  std::string out = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  return out + "'";
}

bool is_dispatcher(const std::filesystem::path &hook) {
  const auto content = common::read_file(hook);
  return content.ok() && content.value().find(kDispatcherMarker) != std::string::npos;
}

common::Status write_script(const std::filesystem::path &destination, const std::string &script) {
  const auto temp = logs::write_temp_file(destination, script);
  if (!temp.ok()) {
    return temp.status();
  }
  std::error_code ec;
  std::filesystem::permissions(temp.value(),
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec |
                                   std::filesystem::perms::others_read |
                                   std::filesystem::perms::others_exec,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    std::filesystem::remove(temp.value(), ec);
    return common::Status::error("failed to make " + destination.string() + " executable");
  }
  return logs::commit_temp_file(temp.value(), destination);
}

common::Result<HookInstallResult> install_one(const std::filesystem::path &hooks_dir,
                                              const std::filesystem::path &executable,
                                              const std::string &event) {
  const auto hook = hooks_dir / event;
  const auto preserved = hooks_dir / (event + kPreservedSuffix);
  HookInstallResult result{.event = event, .action = InstallAction::Created, .path = hook};

  std::error_code ec;
  if (std::filesystem::exists(hook, ec)) {
    if (is_dispatcher(hook)) {
      result.action = InstallAction::Updated;
    } else if (std::filesystem::exists(preserved, ec)) {
      result.action = InstallAction::Conflict;
      return common::Result<HookInstallResult>::success(result);
    } else {
      std::filesystem::rename(hook, preserved, ec);
      if (ec) {
        return common::Result<HookInstallResult>::failure("failed to preserve " + hook.string() +
                                                          ": " + ec.message());
      }
      result.action = InstallAction::Preserved;
    }
  }

  const auto written = write_script(hook, dispatcher_script(executable, event));
  if (!written.ok()) {
    return common::Result<HookInstallResult>::failure(written.error());
  }
  return common::Result<HookInstallResult>::success(result);
}

} // namespace

std::string_view install_action_name(const InstallAction action) {
  switch (action) {
  case InstallAction::Created:
    return "created";
  case InstallAction::Updated:
    return "updated";
  case InstallAction::Preserved:
    return "preserved existing hook";
  case InstallAction::Conflict:
    return "conflict";
  }
  return "created";
}

std::filesystem::path default_hooks_dir() {
  if (const auto home = common::home_dir(); home.ok()) {
    return home.value() / ".git-hooks";
  }
  return ".git-hooks";
}

std::string dispatcher_script(const std::filesystem::path &executable, const std::string &event) {
  return "#!/bin/sh\n# " + std::string(kDispatcherMarker) + "\nexec " +
         shell_quote(executable.string()) + " hook " + event +
         " --hooks-dir \"$(dirname \"$0\")\" \"$@\"\n";
}

common::Result<InstallReport> install_hooks(const InstallOptions &options, git::IGitRunner &git) {
  const auto dir = common::ensure_dir(options.hooks_dir);
  if (!dir.ok()) {
    return common::Result<InstallReport>::failure(dir.error());
  }

  InstallReport report;
  report.hooks_dir = options.hooks_dir;
  for (const char *event : kManagedHooks) {
    auto installed = install_one(options.hooks_dir, options.executable, event);
    if (!installed.ok()) {
      return common::Result<InstallReport>::failure(installed.error());
    }
    report.hooks.push_back(installed.value());
  }

  if (options.set_global) {
    const auto configured =
        git.run({"config", "--global", "core.hooksPath", options.hooks_dir.string()});
    if (!configured.ok()) {
      return common::Result<InstallReport>::failure(
          configured.status().context("git config core.hooksPath").error());
    }
    report.global_configured = true;
  }
  return common::Result<InstallReport>::success(std::move(report));
}

} // namespace captlog::hooks
