#pragma once

#include "captlog/config/schema.hpp"
#include "captlog/projects/resolver.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace captlog::logs {

struct LogLocation {
  std::optional<std::filesystem::path> log_repo;
  /// <base>/<project>/<YYYY-MM-DD>.md
  std::filesystem::path file;
};

[[nodiscard]] LogLocation locate_log(const projects::Project &project,
                                     const config::Config &config, const std::string &date);

[[nodiscard]] std::string today_iso();

} // namespace captlog::logs
