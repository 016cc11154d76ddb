#include "captlog/logs/daily_log.hpp"

#include "captlog/common/fs.hpp"

#include <algorithm>
#include <sstream>
#include <tuple>

namespace captlog::logs {

namespace {

bool is_footer_heading(const std::string &trimmed) { return common::starts_with(trimmed, "# "); }

bool is_section_heading(const std::string &trimmed) {
  return trimmed == "##" || common::starts_with(trimmed, std::string(kSectionMarker));
}

// Drops blank lines at both ends; blank lines in between are kept.
void trim_blank_lines(std::vector<std::string> &lines) {
  const auto blank = [](const std::string &line) { return common::trim(line).empty(); };
  while (!lines.empty() && blank(lines.back())) {
    lines.pop_back();
  }
  const auto first = std::find_if_not(lines.begin(), lines.end(), blank);
  lines.erase(lines.begin(), first);
}

void render_footer(std::ostringstream &out, const std::vector<FooterBlock> &footer) {
  for (std::size_t i = 0; i < footer.size(); ++i) {
    if (i > 0) {
      out << "\n\n";
    }
    out << "# " << footer[i].title << "\n";
    if (!footer[i].lines.empty()) {
      out << "\n";
      for (const auto &line : footer[i].lines) {
        out << line << "\n";
      }
    }
  }
}

} // namespace

bool Section::contains(const std::string &line) const {
  return std::find(entries.begin(), entries.end(), line) != entries.end();
}

bool FooterBlock::contains(const std::string &line) const {
  return std::find(lines.begin(), lines.end(), line) != lines.end();
}

DailyLog DailyLog::skeleton() {
  DailyLog log;
  log.footer.push_back(FooterBlock{.title = std::string(kNextBlock), .lines = {}});
  log.footer.push_back(FooterBlock{.title = std::string(kBrokeBlock), .lines = {}});
  return log;
}

const Section *DailyLog::find_section(const std::string &name) const {
  for (const auto &candidate : sections) {
    if (candidate.name == name) {
      return &candidate;
    }
  }
  return nullptr;
}

Section &DailyLog::section(const std::string &name) {
  for (auto &candidate : sections) {
    if (candidate.name == name) {
      return candidate;
    }
  }
  sections.push_back(Section{.name = name, .entries = {}});
  return sections.back();
}

const FooterBlock *DailyLog::find_footer_block(const std::string &title) const {
  for (const auto &block : footer) {
    if (block.title == title) {
      return &block;
    }
  }
  return nullptr;
}

FooterBlock &DailyLog::footer_block(const std::string &title) {
  for (auto &block : footer) {
    if (block.title == title) {
      return block;
    }
  }
  footer.push_back(FooterBlock{.title = title, .lines = {}});
  return footer.back();
}

std::vector<const Section *> DailyLog::ordered_sections() const {
  std::vector<const Section *> ordered;
  for (const auto &candidate : sections) {
    if (!candidate.entries.empty()) {
      ordered.push_back(&candidate);
    }
  }

  auto sort_key = [](const Section *s) {
    return std::make_tuple(s->name == kOtherSection, common::to_lower(s->name), s->name);
  };
  std::stable_sort(ordered.begin(), ordered.end(),
                   [&sort_key](const Section *lhs, const Section *rhs) {
                     return sort_key(lhs) < sort_key(rhs);
                   });
  return ordered;
}

std::optional<DailyLog> parse_daily_log(const std::string &content) {
  const auto lines = common::split_lines(content);

  DailyLog log;
  std::size_t index = 0;
  while (index < lines.size() && common::trim(lines[index]) != kHeaderMarker) {
    log.preamble.push_back(common::trim_right(lines[index]));
    ++index;
  }
  if (index == lines.size()) {
    return std::nullopt;
  }
  ++index;
  trim_blank_lines(log.preamble);

  std::optional<std::size_t> current;
  for (; index < lines.size(); ++index) {
    const std::string trimmed = common::trim(lines[index]);
    if (is_footer_heading(trimmed)) {
      break;
    }
    if (is_section_heading(trimmed)) {
      const std::string name = common::trim(trimmed.substr(2));
      if (name.empty()) {
        current.reset();
        continue;
      }
      Section &target = log.section(name);
      current = static_cast<std::size_t>(&target - log.sections.data());
      continue;
    }
    if (!current.has_value() || trimmed.empty()) {
      continue;
    }
    Section &target = log.sections[*current];
    if (!target.contains(trimmed)) {
      target.entries.push_back(trimmed);
    }
  }

  FooterBlock *block = nullptr;
  for (; index < lines.size(); ++index) {
    const std::string trimmed = common::trim(lines[index]);
    if (is_footer_heading(trimmed)) {
      block = &log.footer_block(common::trim(trimmed.substr(2)));
      continue;
    }
    if (block != nullptr) {
      block->lines.push_back(common::trim_right(lines[index]));
    }
  }
  for (auto &block : log.footer) {
    trim_blank_lines(block.lines);
  }

  if (log.footer.empty()) {
    log.footer = DailyLog::skeleton().footer;
  }
  return log;
}

std::string render_daily_log(const DailyLog &log) {
  std::ostringstream out;
  if (!log.preamble.empty()) {
    for (const auto &line : log.preamble) {
      out << line << "\n";
    }
    out << "\n";
  }
  out << kHeaderMarker << "\n\n";

  const auto ordered = log.ordered_sections();
  if (ordered.empty()) {
    out << "\n";
  } else {
    for (std::size_t i = 0; i < ordered.size(); ++i) {
      if (i > 0) {
        out << "\n";
      }
      out << kSectionMarker << ordered[i]->name << "\n";
      for (const auto &entry : ordered[i]->entries) {
        out << entry << "\n";
      }
    }
    out << "\n";
  }

  render_footer(out, log.footer);
  return out.str();
}

} // namespace captlog::logs
