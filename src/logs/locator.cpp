#include "captlog/logs/locator.hpp"

#include "captlog/config/config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace captlog::logs {

LogLocation locate_log(const projects::Project &project, const config::Config &config,
                       const std::string &date) {
  std::optional<std::filesystem::path> repo = project.log_repo;
  if (!repo.has_value()) {
    repo = config.global_log_repo;
  }

  std::filesystem::path base;
  if (repo.has_value()) {
    base = *repo;
  } else if (!config.log_dir.empty()) {
    base = config.log_dir;
  } else {
    base = config::default_log_dir();
  }
  return LogLocation{.log_repo = repo, .file = base / project.name / (date + ".md")};
}

std::string today_iso() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d");
  return out.str();
}

} // namespace captlog::logs
