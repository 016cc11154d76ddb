#pragma once

#include "captlog/common/result.hpp"
#include "captlog/git/runner.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace captlog::hooks {

inline constexpr std::array<const char *, 4> kManagedHooks = {"commit-msg", "post-commit",
                                                              "pre-commit", "pre-push"};
inline constexpr std::string_view kDispatcherMarker = "captlog-dispatcher";

enum class InstallAction {
  Created,
  Updated,
  Preserved,
  Conflict,
};

[[nodiscard]] std::string_view install_action_name(InstallAction action);

struct InstallOptions {
  std::filesystem::path hooks_dir;
  std::filesystem::path executable;
  bool set_global = false;
};

struct HookInstallResult {
  std::string event;
  InstallAction action = InstallAction::Created;
  std::filesystem::path path;
};

struct InstallReport {
  std::filesystem::path hooks_dir;
  std::vector<HookInstallResult> hooks;
  bool global_configured = false;
};

[[nodiscard]] std::filesystem::path default_hooks_dir();

[[nodiscard]] std::string dispatcher_script(const std::filesystem::path &executable,
                                            const std::string &event);

[[nodiscard]] common::Result<InstallReport> install_hooks(const InstallOptions &options,
                                                          git::IGitRunner &git);

} // namespace captlog::hooks
