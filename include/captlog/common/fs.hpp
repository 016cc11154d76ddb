#pragma once

#include "captlog/common/result.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace captlog::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] std::string trim_right(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_lines(const std::string &content);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Absolute, symlink-resolved (for the existing prefix), lexically normal form
/// without a trailing separator. Two spellings of one directory compare equal.
[[nodiscard]] std::filesystem::path normalize_path(const std::filesystem::path &path);

/// True when `candidate` equals `parent` or lies below it. Compares whole
/// components, so `/a/bc` is not below `/a/b`.
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

[[nodiscard]] std::optional<std::filesystem::path>
find_repository_root(const std::filesystem::path &start);

} // namespace captlog::common
