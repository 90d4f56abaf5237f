#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "pacman_conf.hpp"

// Parses one fine-grained SigLevel line as printed by pacman-conf and stacks
// it onto `level`. pacman-conf expands `Required` into `PackageRequired` and
// `DatabaseRequired`; only the expanded forms are accepted. Whitespace-only
// input leaves the level unchanged.
int process_siglevel(int level, std::string_view siglevel);

// Folds every line of a multi-line pacman-conf SigLevel output onto `level`.
int fold_siglevels(int level, std::string_view siglevels);

std::vector<std::string_view> siglevel_names(int level);

int default_siglevel(const ConfReader &reader, const std::vector<std::string> &conf_args = {});
int repo_siglevel(std::string_view repo, int level, const ConfReader &reader,
                  const std::vector<std::string> &conf_args = {});
