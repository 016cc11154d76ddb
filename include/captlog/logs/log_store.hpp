#pragma once

#include "captlog/common/result.hpp"
#include "captlog/logs/daily_log.hpp"

#include <filesystem>
#include <string>

namespace captlog::logs {

enum class LoadOutcome {
  Parsed,
  Skeleton,
};

struct LoadResult {
  LoadOutcome outcome = LoadOutcome::Skeleton;
  DailyLog log;
  std::string reason;
};

/// Never fails. Corrupt files are not modified here; the next save replaces
/// them with a well-formed document.
[[nodiscard]] LoadResult load_log(const std::filesystem::path &path);

[[nodiscard]] common::Status save_log(const std::filesystem::path &path, const DailyLog &log);

[[nodiscard]] common::Result<std::filesystem::path>
write_temp_file(const std::filesystem::path &destination, const std::string &content);

[[nodiscard]] common::Status commit_temp_file(const std::filesystem::path &temp,
                                              const std::filesystem::path &destination);

} // namespace captlog::logs
