#pragma once

#include "captlog/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace captlog::common {

struct ProcessOptions {
  std::optional<std::filesystem::path> working_dir;
  bool capture_output = true;
  std::optional<std::chrono::milliseconds> timeout;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

/// Runs argv[0] (looked up on PATH) and waits for it. A failure Result means
/// the process could not be started or was killed; a non-zero exit is still a
/// success Result carrying that exit code.
[[nodiscard]] Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                                const ProcessOptions &options = {});

[[nodiscard]] std::optional<std::filesystem::path> find_executable(const std::string &name);

[[nodiscard]] bool is_executable(const std::filesystem::path &path);

} // namespace captlog::common
