#include "captlog/entries/entry.hpp"

#include "captlog/common/fs.hpp"
#include "captlog/logs/daily_log.hpp"

#include <algorithm>

namespace captlog::entries {

std::string LogEntry::render() const {
  std::string line(logs::kEntryMarker);
  if (commit_ref.has_value() && !commit_ref->empty()) {
    line += "(" + *commit_ref + ") ";
  }
  return line + text;
}

std::optional<ParsedLine> parse_entry_line(const std::string &line) {
  const std::string trimmed = common::trim(line);
  const std::string marker(logs::kEntryMarker);
  if (!common::starts_with(trimmed, marker)) {
    return std::nullopt;
  }

  std::string rest = trimmed.substr(marker.size());
  ParsedLine parsed;
  if (!rest.empty() && rest.front() == '(') {
    const auto close = rest.find(") ");
    if (close != std::string::npos && close > 1) {
      parsed.commit_ref = rest.substr(1, close - 1);
      rest = rest.substr(close + 2);
    }
  }
  parsed.text = rest;
  return parsed;
}

std::string short_sha(const std::string &sha) {
  const std::string trimmed = common::trim(sha);
  return trimmed.substr(0, std::min(trimmed.size(), kShortShaLength));
}

bool is_placeholder_sha(const std::string &sha) {
  const std::string trimmed = common::trim(sha);
  return trimmed.empty() || common::starts_with(trimmed, "no-sha");
}

std::string commit_subject(const std::string &message) {
  const auto newline = message.find('\n');
  return common::trim(newline == std::string::npos ? message : message.substr(0, newline));
}

std::string sanitize_text(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    out.push_back(ch == '\n' || ch == '\r' ? ' ' : ch);
  }
  return common::trim(out);
}

LogEntry make_commit_entry(const std::string &repository, const std::string &message,
                           const std::optional<std::string> &sha) {
  LogEntry entry;
  entry.kind = EntryKind::Commit;
  entry.section = repository;
  entry.text = sanitize_text(commit_subject(message));
  if (sha.has_value() && !is_placeholder_sha(*sha)) {
    entry.commit_ref = short_sha(*sha);
  }
  return entry;
}

LogEntry make_manual_entry(const std::string &text) {
  return LogEntry{.kind = EntryKind::Manual,
                  .section = std::string(logs::kOtherSection),
                  .text = sanitize_text(text),
                  .commit_ref = std::nullopt};
}

LogEntry make_trouble_entry(const std::string &text) {
  return LogEntry{.kind = EntryKind::Trouble,
                  .section = std::string(logs::kBrokeBlock),
                  .text = sanitize_text(text),
                  .commit_ref = std::nullopt};
}

} // namespace captlog::entries
