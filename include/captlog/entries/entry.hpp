#pragma once

#include <optional>
#include <string>

namespace captlog::entries {

inline constexpr std::size_t kShortShaLength = 7;

enum class EntryKind {
  Commit,
  Manual,
  Trouble,
};

struct LogEntry {
  EntryKind kind = EntryKind::Manual;
  std::string section;
  std::string text;
  std::optional<std::string> commit_ref;

  [[nodiscard]] std::string render() const;
};

struct ParsedLine {
  std::optional<std::string> commit_ref;
  std::string text;
};

[[nodiscard]] std::optional<ParsedLine> parse_entry_line(const std::string &line);

[[nodiscard]] std::string short_sha(const std::string &sha);

/// Empty or "no-sha..." placeholders written by hooks that run before HEAD
/// exists.
[[nodiscard]] bool is_placeholder_sha(const std::string &sha);

[[nodiscard]] std::string commit_subject(const std::string &message);

[[nodiscard]] std::string sanitize_text(const std::string &text);

[[nodiscard]] LogEntry make_commit_entry(const std::string &repository, const std::string &message,
                                         const std::optional<std::string> &sha);
[[nodiscard]] LogEntry make_manual_entry(const std::string &text);
[[nodiscard]] LogEntry make_trouble_entry(const std::string &text);

} // namespace captlog::entries
