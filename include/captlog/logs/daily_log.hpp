#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace captlog::logs {

inline constexpr std::string_view kHeaderMarker = "# What I did";
inline constexpr std::string_view kSectionMarker = "## ";
inline constexpr std::string_view kEntryMarker = "- ";
inline constexpr std::string_view kOtherSection = "other";
inline constexpr std::string_view kNextBlock = "Whats next";
inline constexpr std::string_view kBrokeBlock = "What Broke or Got Weird";

struct Section {
  std::string name;
  std::vector<std::string> entries;

  [[nodiscard]] bool contains(const std::string &line) const;
  bool operator==(const Section &other) const = default;
};

struct FooterBlock {
  std::string title;
  std::vector<std::string> lines;

  [[nodiscard]] bool contains(const std::string &line) const;
  bool operator==(const FooterBlock &other) const = default;
};

/// One day's log for one project. Section names are unique; entry lines are
/// unique within a section.
struct DailyLog {
  /// Lines above the "# What I did" marker, kept verbatim.
  std::vector<std::string> preamble;
  std::vector<Section> sections;
  std::vector<FooterBlock> footer;

  [[nodiscard]] static DailyLog skeleton();

  [[nodiscard]] const Section *find_section(const std::string &name) const;
  Section &section(const std::string &name);

  [[nodiscard]] const FooterBlock *find_footer_block(const std::string &title) const;
  FooterBlock &footer_block(const std::string &title);

  /// Sections that will be written, in file order: case-insensitive by name,
  /// "other" last, empty sections dropped.
  [[nodiscard]] std::vector<const Section *> ordered_sections() const;

  bool operator==(const DailyLog &other) const = default;
};

[[nodiscard]] std::optional<DailyLog> parse_daily_log(const std::string &content);
[[nodiscard]] std::string render_daily_log(const DailyLog &log);

} // namespace captlog::logs
