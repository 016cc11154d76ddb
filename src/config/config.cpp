#include "captlog/config/config.hpp"

#include "captlog/common/fs.hpp"
#include "captlog/common/toml.hpp"

#include <cstdlib>
#include <sstream>

namespace captlog::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".captlog";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *PROJECTS_FOLDER = "projects";

std::filesystem::path expand_config_path(const std::string &value,
                                         const std::filesystem::path &base_dir) {
  std::filesystem::path path(common::expand_path(common::trim(value)));
  if (path.is_relative() && !base_dir.empty()) {
    path = base_dir / path;
  }
  return path.lexically_normal();
}

std::optional<std::filesystem::path> optional_path(const common::TomlDocument &doc,
                                                   const std::string &key,
                                                   const std::filesystem::path &base_dir) {
  if (!doc.has(key)) {
    return std::nullopt;
  }
  const std::string raw = doc.get_string(key);
  if (common::trim(raw).empty()) {
    return std::nullopt;
  }
  return expand_config_path(raw, base_dir);
}

void load_projects(Config &config, const common::TomlDocument &doc,
                   const std::filesystem::path &base_dir) {
  for (const auto &name : doc.child_names("projects")) {
    const std::string prefix = "projects." + name;
    ProjectConfig project;
    project.name = name;

    if (doc.has(prefix)) {
      // personal = "~/code/personal"
      const std::string root = doc.get_string(prefix);
      if (!common::trim(root).empty()) {
        project.root = expand_config_path(root, base_dir);
      }
    } else {
      if (const auto root = optional_path(doc, prefix + ".root", base_dir); root.has_value()) {
        project.root = *root;
      }
      project.log_repo = optional_path(doc, prefix + ".log_repo", base_dir);
    }

    config.projects.push_back(std::move(project));
  }
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

bool env_flag_set(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr) {
    return false;
  }
  const std::string normalized = common::to_lower(common::trim(value));
  return normalized == "1" || normalized == "true" || normalized == "yes";
}

} // namespace

const ProjectConfig *Config::find_project(const std::string &name) const {
  for (const auto &project : projects) {
    if (project.name == name) {
      return &project;
    }
  }
  return nullptr;
}

common::Result<std::filesystem::path> config_dir() {
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

std::filesystem::path default_log_dir() {
  if (const auto dir = config_dir(); dir.ok()) {
    return dir.value() / PROJECTS_FOLDER;
  }
  return std::filesystem::path(CONFIG_FOLDER) / PROJECTS_FOLDER;
}

common::Result<std::filesystem::path>
config_path(const std::optional<std::filesystem::path> &override_path) {
  std::optional<std::filesystem::path> candidate;
  if (override_path.has_value() && !override_path->empty()) {
    candidate = std::filesystem::path(common::expand_path(override_path->string()));
  } else if (const char *env = std::getenv("CAPTLOG_CONFIG_PATH");
             env != nullptr && *env != '\0') {
    candidate = std::filesystem::path(common::expand_path(env));
  }

  if (candidate.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*candidate, ec) || !candidate->has_filename()) {
      return common::Result<std::filesystem::path>::success(*candidate / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*candidate);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

Config default_config() {
  Config config;
  config.log_dir = default_log_dir();
  return config;
}

void apply_env_overrides(Config &config) {
  if (const char *repo = std::getenv("CAPTLOG_LOG_REPO"); repo != nullptr && *repo != '\0') {
    config.global_log_repo = std::filesystem::path(common::expand_path(repo));
  }
  if (env_flag_set("CAPTLOG_NO_PUBLISH")) {
    config.publish = false;
  }
}

common::Result<Config> parse_config(const std::string &content,
                                    const std::filesystem::path &base_dir) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config = default_config();
  config.global_log_repo = optional_path(doc, "global_log_repo", base_dir);
  if (const auto log_dir = optional_path(doc, "log_dir", base_dir); log_dir.has_value()) {
    config.log_dir = *log_dir;
  }
  config.publish = doc.get_bool("publish", config.publish);
  config.observability = doc.get_string("observability", config.observability);

  config.hooks.pre_commit_configs =
      doc.get_string_array("hooks.pre_commit_configs", config.hooks.pre_commit_configs);
  config.hooks.pre_commit_command =
      doc.get_string("hooks.pre_commit_command", config.hooks.pre_commit_command);

  load_projects(config, doc, base_dir);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config = default_config();
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value(), path.parent_path());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::string backend = common::to_lower(common::trim(config.observability));
  if (backend != "log" && backend != "none" && backend != "noop") {
    return common::Result<std::vector<std::string>>::failure(
        "Invalid observability backend: " + config.observability);
  }

  if (common::trim(config.hooks.pre_commit_command).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "hooks.pre_commit_command must not be empty");
  }

  for (std::size_t i = 0; i < config.projects.size(); ++i) {
    const auto &project = config.projects[i];
    if (project.root.empty()) {
      warnings.push_back("project '" + project.name + "' has no root and is ignored");
      continue;
    }

    const auto normalized = common::normalize_path(project.root);
    for (std::size_t j = 0; j < i; ++j) {
      const auto &earlier = config.projects[j];
      if (!earlier.root.empty() && common::normalize_path(earlier.root) == normalized) {
        warnings.push_back("projects '" + earlier.name + "' and '" + project.name +
                           "' share root " + normalized.string() + "; '" + earlier.name +
                           "' wins");
        break;
      }
    }
  }

  std::error_code ec;
  if (config.global_log_repo.has_value() &&
      !std::filesystem::is_directory(*config.global_log_repo, ec)) {
    warnings.push_back("global_log_repo does not exist: " + config.global_log_repo->string());
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  if (config.global_log_repo.has_value()) {
    out << "global_log_repo = " << common::quote_toml_string(config.global_log_repo->string())
        << "\n";
  }
  out << "log_dir = " << common::quote_toml_string(config.log_dir.string()) << "\n";
  out << "publish = " << bool_to_toml(config.publish) << "\n";
  out << "observability = " << common::quote_toml_string(config.observability) << "\n";

  out << "\n[hooks]\n";
  out << "pre_commit_configs = " << string_array_to_toml(config.hooks.pre_commit_configs)
      << "\n";
  out << "pre_commit_command = " << common::quote_toml_string(config.hooks.pre_commit_command)
      << "\n";

  for (const auto &project : config.projects) {
    out << "\n[projects." << common::quote_toml_string(project.name) << "]\n";
    out << "root = " << common::quote_toml_string(project.root.string()) << "\n";
    if (project.log_repo.has_value()) {
      out << "log_repo = " << common::quote_toml_string(project.log_repo->string()) << "\n";
    }
  }
  return out.str();
}

} // namespace captlog::config
