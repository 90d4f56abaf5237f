#include "pacman_conf.hpp"
#include <array>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "error.hpp"
#include "siglevel.hpp"
#include "util.hpp"

namespace {

std::string shell_quote(std::string_view arg) {
  std::string quoted = "'";
  for (auto c : arg) {
    if (c == '\'') quoted += "'\\''";
    else quoted += c;
  }
  return quoted + "'";
}

struct PipeCloser {
  void operator()(FILE *pipe) const noexcept { pclose(pipe); }
};

} // namespace

std::string conf_command(const std::vector<std::string> &args) {
  std::string command = "LC_ALL=C.UTF-8 LANGUAGE=C.UTF-8 ";
  command.append(kPacmanConfCommand);
  for (const auto &arg : args) command.append(" ").append(shell_quote(arg));
  return command;
}

std::string strip_trailing_newline(std::string text) {
  if (!text.empty() && text.back() == '\n') text.pop_back();
  return text;
}

std::optional<std::string> read_conf(const std::vector<std::string> &args) {
  auto command = conf_command(args);
  FILE *raw_pipe = popen(command.c_str(), "r");
  if (!raw_pipe) return std::nullopt;
  std::unique_ptr<FILE, PipeCloser> pipe{raw_pipe};
  std::string output;
  std::array<char, 4096> buffer;
  while (auto n = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) output.append(buffer.data(), n);
  if (pclose(pipe.release()) != 0) return std::nullopt;
  return strip_trailing_newline(std::move(output));
}

PacmanConfig load_pacman_config(const ConfigOverrides &overrides, const ConfReader &reader) {
  std::vector<std::string> conf_args;
  if (overrides.config_file) conf_args.push_back("--config=" + *overrides.config_file);
  auto read = [&conf_args, &reader](std::string_view key) {
    auto args = conf_args;
    args.emplace_back(key);
    return reader(args);
  };

  PacmanConfig config;
  auto root_dir = overrides.root_dir ? overrides.root_dir : read("RootDir");
  auto db_path = overrides.db_path ? overrides.db_path : read("DBPath");
  if (!root_dir || !db_path)
    throw QueryError(kDatabaseRegistrationFailure, "failed to read RootDir and DBPath through pacman-conf");
  config.root_dir = *root_dir;
  config.db_path = *db_path;
  config.default_siglevel = default_siglevel(reader, conf_args);

  auto repositories = overrides.repositories;
  if (repositories.empty()) {
    auto repo_list = read("--repo-list").value_or("");
    for (auto repo : split_lines(repo_list))
      if (!trim(repo).empty()) repositories.emplace_back(trim(repo));
  }
  for (const auto &repo : repositories)
    config.repositories.push_back({repo, repo_siglevel(repo, config.default_siglevel, reader, conf_args)});
  return config;
}
