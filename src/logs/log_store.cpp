#include "captlog/logs/log_store.hpp"

#include "captlog/common/fs.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace captlog::logs {

namespace {

std::atomic<unsigned> g_temp_counter{0};

std::string errno_text() { return std::strerror(errno); }

std::filesystem::path temp_sibling(const std::filesystem::path &destination) {
  const unsigned serial = g_temp_counter.fetch_add(1);
  return destination.parent_path() / ("." + destination.filename().string() + ".tmp." +
                                      std::to_string(::getpid()) + "." + std::to_string(serial));
}

void sync_directory(const std::filesystem::path &dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    return;
  }
  (void)::fsync(fd);
  ::close(fd);
}

} // namespace

LoadResult load_log(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return LoadResult{.outcome = LoadOutcome::Skeleton, .log = DailyLog::skeleton(), .reason = ""};
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return LoadResult{.outcome = LoadOutcome::Skeleton,
                      .log = DailyLog::skeleton(),
                      .reason = content.error()};
  }

  auto parsed = parse_daily_log(content.value());
  if (!parsed.has_value()) {
    return LoadResult{.outcome = LoadOutcome::Skeleton,
                      .log = DailyLog::skeleton(),
                      .reason = "missing '" + std::string(kHeaderMarker) + "' marker"};
  }
  return LoadResult{.outcome = LoadOutcome::Parsed, .log = std::move(*parsed), .reason = ""};
}

common::Result<std::filesystem::path> write_temp_file(const std::filesystem::path &destination,
                                                      const std::string &content) {
  const auto dir = destination.parent_path();
  if (!dir.empty()) {
    const auto created = common::ensure_dir(dir);
    if (!created.ok()) {
      return common::Result<std::filesystem::path>::failure(created.error());
    }
  }

  const auto temp = temp_sibling(destination);
  const int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    return common::Result<std::filesystem::path>::failure("failed to create " + temp.string() +
                                                           ": " + errno_text());
  }

  const char *data = content.data();
  std::size_t remaining = content.size();
  while (remaining > 0) {
    const ssize_t written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      const std::string message = "failed to write " + temp.string() + ": " + errno_text();
      ::close(fd);
      std::error_code ec;
      std::filesystem::remove(temp, ec);
      return common::Result<std::filesystem::path>::failure(message);
    }
    data += written;
    remaining -= static_cast<std::size_t>(written);
  }

  const bool synced = ::fsync(fd) == 0;
  const bool closed = ::close(fd) == 0;
  if (!synced || !closed) {
    const std::string message = "failed to flush " + temp.string() + ": " + errno_text();
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    return common::Result<std::filesystem::path>::failure(message);
  }
  return common::Result<std::filesystem::path>::success(temp);
}

common::Status commit_temp_file(const std::filesystem::path &temp,
                                const std::filesystem::path &destination) {
  std::error_code ec;
  std::filesystem::rename(temp, destination, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp, ignored);
    return common::Status::error("failed to replace " + destination.string() + ": " +
                                 ec.message());
  }
  sync_directory(destination.parent_path().empty() ? std::filesystem::path(".")
                                                   : destination.parent_path());
  return common::Status::success();
}

common::Status save_log(const std::filesystem::path &path, const DailyLog &log) {
  const auto temp = write_temp_file(path, render_daily_log(log));
  if (!temp.ok()) {
    return temp.status();
  }
  return commit_temp_file(temp.value(), path);
}

} // namespace captlog::logs
