#pragma once

#include "captlog/common/result.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace captlog::common {

/// Flat view of a TOML file: `[a.b]` + `c = 1` is stored under "a.b.c".
/// Only the subset used by captlog configs is understood (strings, bools,
/// inline string arrays, tables).
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;
  std::vector<std::string> order;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

  [[nodiscard]] std::vector<std::string> child_names(const std::string &prefix) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace captlog::common
