#pragma once
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Builds the shell command that runs pacman-conf with user locales disabled,
// so that its output is never translated.
std::string conf_command(const std::vector<std::string> &args);

std::string strip_trailing_newline(std::string text);

// Runs pacman-conf with the given arguments and returns its stdout without
// the final newline, or nullopt if it could not be run or failed.
std::optional<std::string> read_conf(const std::vector<std::string> &args);

// Runs one pacman-conf query; read_conf unless a caller supplies another.
using ConfReader = std::function<std::optional<std::string>(const std::vector<std::string> &)>;

struct RepositoryConfig {
  std::string name;
  int siglevel;
};

struct ConfigOverrides {
  std::optional<std::string> config_file;
  std::optional<std::string> root_dir;
  std::optional<std::string> db_path;
  std::vector<std::string> repositories;
};

struct PacmanConfig {
  std::string root_dir;
  std::string db_path;
  int default_siglevel;
  std::vector<RepositoryConfig> repositories;
};

// Throws QueryError(kDatabaseRegistrationFailure) if RootDir or DBPath can
// neither be read nor taken from the overrides.
PacmanConfig load_pacman_config(const ConfigOverrides &overrides, const ConfReader &reader = read_conf);
