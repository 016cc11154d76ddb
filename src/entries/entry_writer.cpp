#include "captlog/entries/entry_writer.hpp"

#include "captlog/logs/locator.hpp"
#include "captlog/observability/global.hpp"

#include <algorithm>

namespace captlog::entries {

namespace {

ApplyStatus add_line(std::vector<std::string> &lines, const std::string &line) {
  if (std::find(lines.begin(), lines.end(), line) != lines.end()) {
    return ApplyStatus::Duplicate;
  }
  lines.push_back(line);
  return ApplyStatus::Added;
}

// Drops lines for the same message under another hash or none.
bool remove_amended(std::vector<std::string> &lines, const LogEntry &entry) {
  const auto stale = [&entry](const std::string &line) {
    const auto parsed = parse_entry_line(line);
    return parsed.has_value() && parsed->text == entry.text &&
           parsed->commit_ref != entry.commit_ref;
  };
  const auto before = lines.size();
  lines.erase(std::remove_if(lines.begin(), lines.end(), stale), lines.end());
  return lines.size() != before;
}

} // namespace

std::string_view apply_status_name(const ApplyStatus status) {
  switch (status) {
  case ApplyStatus::Added:
    return "added";
  case ApplyStatus::Duplicate:
    return "duplicate";
  case ApplyStatus::Replaced:
    return "replaced";
  }
  return "added";
}

ApplyOutcome apply(logs::DailyLog log, const LogEntry &entry) {
  const std::string line = entry.render();

  if (entry.kind == EntryKind::Trouble) {
    auto &block = log.footer_block(std::string(logs::kBrokeBlock));
    const auto status = add_line(block.lines, line);
    return ApplyOutcome{.log = std::move(log), .status = status};
  }

  auto &lines = log.section(entry.section).entries;
  if (std::find(lines.begin(), lines.end(), line) != lines.end()) {
    return ApplyOutcome{.log = std::move(log), .status = ApplyStatus::Duplicate};
  }

  bool replaced = false;
  if (entry.kind == EntryKind::Commit && entry.commit_ref.has_value()) {
    replaced = remove_amended(lines, entry);
  }
  lines.push_back(line);
  return ApplyOutcome{.log = std::move(log),
                      .status = replaced ? ApplyStatus::Replaced : ApplyStatus::Added};
}

EntryWriter::EntryWriter(const config::Config &config, git::IPublisher *publisher)
    : config_(config), publisher_(publisher) {}

common::Result<RecordReport> EntryWriter::record(const projects::Project &project,
                                                 const LogEntry &entry,
                                                 const std::string &date) const {
  if (entry.text.empty()) {
    return common::Result<RecordReport>::failure("entry text is empty");
  }
  if (entry.section.empty()) {
    return common::Result<RecordReport>::failure("entry section is empty");
  }

  const auto location = logs::locate_log(project, config_, date);
  RecordReport report;
  report.file = location.file;

  auto loaded = logs::load_log(location.file);
  report.load_outcome = loaded.outcome;
  if (!loaded.reason.empty()) {
    observability::record_warning("logs", location.file.string() + ": " + loaded.reason +
                                              "; starting from an empty log");
  }

  auto outcome = apply(std::move(loaded.log), entry);
  report.status = outcome.status;
  observability::record_entry(project.name, entry.section, location.file.string(),
                              std::string(apply_status_name(outcome.status)));
  if (outcome.status == ApplyStatus::Duplicate) {
    return common::Result<RecordReport>::success(std::move(report));
  }

  const auto saved = logs::save_log(location.file, outcome.log);
  if (!saved.ok()) {
    return common::Result<RecordReport>::failure(saved.error());
  }
  report.written = true;

  if (!location.log_repo.has_value() || !config_.publish || publisher_ == nullptr) {
    return common::Result<RecordReport>::success(std::move(report));
  }

  const std::string message =
      git::commit_message(project.name, date, entry.kind != EntryKind::Commit);
  const auto published = publisher_->commit_and_push(*location.log_repo, location.file, message);
  observability::record_publish(location.log_repo->string(), published.ok(), published.error());
  if (published.ok()) {
    report.published = true;
  } else {
    report.publish_error = published.error();
  }
  return common::Result<RecordReport>::success(std::move(report));
}

} // namespace captlog::entries
