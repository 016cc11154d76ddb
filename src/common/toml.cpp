#include "captlog/common/toml.hpp"

#include "captlog/common/fs.hpp"

#include <algorithm>
#include <sstream>

namespace captlog::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_double = false;
  bool in_single = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && !in_single && (i == 0 || line[i - 1] != '\\')) {
      in_double = !in_double;
    } else if (ch == '\'' && !in_double) {
      in_single = !in_single;
    }
    if (!in_double && !in_single && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const char ch = array_value[i];
    if (ch == '"' && (i == 0 || array_value[i - 1] != '\\')) {
      in_quotes = !in_quotes;
      current.push_back(ch);
      continue;
    }

    if (!in_quotes && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }

    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  bool escaped = false;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
        continue;
      }
      out.push_back(ch);
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

// Table keys may be quoted: [projects."my repo"].
std::string unquote_key_path(const std::string &raw) {
  std::string out;
  std::string segment;
  bool in_quotes = false;
  for (const char ch : raw) {
    if (ch == '"') {
      in_quotes = !in_quotes;
      continue;
    }
    if (ch == '.' && !in_quotes) {
      out += trim(segment) + ".";
      segment.clear();
      continue;
    }
    segment.push_back(ch);
  }
  out += in_quotes ? segment : trim(segment);
  return out;
}

void remember(TomlDocument &document, const std::string &key) {
  if (std::find(document.order.begin(), document.order.end(), key) == document.order.end()) {
    document.order.push_back(key);
  }
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

std::vector<std::string> TomlDocument::child_names(const std::string &prefix) const {
  const std::string head = prefix + ".";
  std::vector<std::string> names;
  for (const auto &key : order) {
    if (!starts_with(key, head) || key.size() == head.size()) {
      continue;
    }
    const std::string rest = key.substr(head.size());
    const std::string name = rest.substr(0, rest.find('.'));
    if (std::find(names.begin(), names.end(), name) == names.end()) {
      names.push_back(name);
    }
  }
  return names;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = unquote_key_path(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      remember(document, current_section);
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = unquote_key_path(trim(clean_line.substr(0, equals_index)));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " +
                                           std::to_string(line_number));
    }
    if (value.empty()) {
      return Result<TomlDocument>::failure("Missing value for '" + key + "' at line " +
                                           std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
    remember(document, full_key);
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace captlog::common
