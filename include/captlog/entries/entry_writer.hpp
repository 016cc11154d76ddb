#pragma once

#include "captlog/common/result.hpp"
#include "captlog/config/schema.hpp"
#include "captlog/entries/entry.hpp"
#include "captlog/git/publisher.hpp"
#include "captlog/logs/daily_log.hpp"
#include "captlog/logs/log_store.hpp"
#include "captlog/projects/resolver.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace captlog::entries {

enum class ApplyStatus {
  Added,
  Duplicate,
  Replaced,
};

[[nodiscard]] std::string_view apply_status_name(ApplyStatus status);

struct ApplyOutcome {
  logs::DailyLog log;
  ApplyStatus status = ApplyStatus::Added;
};

[[nodiscard]] ApplyOutcome apply(logs::DailyLog log, const LogEntry &entry);

struct RecordReport {
  std::filesystem::path file;
  ApplyStatus status = ApplyStatus::Added;
  logs::LoadOutcome load_outcome = logs::LoadOutcome::Skeleton;
  bool written = false;
  bool published = false;
  std::optional<std::string> publish_error;
};

class EntryWriter {
public:
  EntryWriter(const config::Config &config, git::IPublisher *publisher);

  [[nodiscard]] common::Result<RecordReport> record(const projects::Project &project,
                                                    const LogEntry &entry,
                                                    const std::string &date) const;

private:
  const config::Config &config_;
  git::IPublisher *publisher_;
};

} // namespace captlog::entries
