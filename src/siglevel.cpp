#include "siglevel.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <alpm.h>
#include "error.hpp"
#include "pacman_conf.hpp"
#include "util.hpp"

int process_siglevel(int level, std::string_view siglevel) {
  auto set = [level](int flags) { return (level | flags) & ~ALPM_SIG_USE_DEFAULT; };
  auto unset = [level](int flags) { return (level & ~flags) & ~ALPM_SIG_USE_DEFAULT; };
  constexpr int package_trust_all = ALPM_SIG_PACKAGE_MARGINAL_OK | ALPM_SIG_PACKAGE_UNKNOWN_OK;
  constexpr int database_trust_all = ALPM_SIG_DATABASE_MARGINAL_OK | ALPM_SIG_DATABASE_UNKNOWN_OK;

  auto value = trim(siglevel);
  if (value.empty()) return level;
  if (value == "PackageNever") return unset(ALPM_SIG_PACKAGE);
  if (value == "PackageOptional") return set(ALPM_SIG_PACKAGE | ALPM_SIG_PACKAGE_OPTIONAL);
  if (value == "PackageRequired") return set(ALPM_SIG_PACKAGE) & ~ALPM_SIG_PACKAGE_OPTIONAL;
  if (value == "PackageTrustedOnly") return unset(package_trust_all);
  if (value == "PackageTrustAll") return set(package_trust_all);
  if (value == "DatabaseNever") return unset(ALPM_SIG_DATABASE);
  if (value == "DatabaseOptional") return set(ALPM_SIG_DATABASE | ALPM_SIG_DATABASE_OPTIONAL);
  if (value == "DatabaseRequired") return set(ALPM_SIG_DATABASE) & ~ALPM_SIG_DATABASE_OPTIONAL;
  if (value == "DatabaseTrustedOnly") return unset(database_trust_all);
  if (value == "DatabaseTrustAll") return set(database_trust_all);
  throw QueryError(kDatabaseRegistrationFailure, "failed to parse the signature level: " + std::string(value));
}

int fold_siglevels(int level, std::string_view siglevels) {
  for (auto line : split_lines(siglevels)) level = process_siglevel(level, line);
  return level;
}

std::vector<std::string_view> siglevel_names(int level) {
  if (level & ALPM_SIG_USE_DEFAULT) return {"USE_DEFAULT"};
  std::vector<std::string_view> names;
  if (level & ALPM_SIG_PACKAGE) names.emplace_back("PACKAGE");
  if (level & ALPM_SIG_PACKAGE_OPTIONAL) names.emplace_back("PACKAGE_OPTIONAL");
  if (level & ALPM_SIG_PACKAGE_MARGINAL_OK) names.emplace_back("PACKAGE_MARGINAL_OK");
  if (level & ALPM_SIG_PACKAGE_UNKNOWN_OK) names.emplace_back("PACKAGE_UNKNOWN_OK");
  if (level & ALPM_SIG_DATABASE) names.emplace_back("DATABASE");
  if (level & ALPM_SIG_DATABASE_OPTIONAL) names.emplace_back("DATABASE_OPTIONAL");
  if (level & ALPM_SIG_DATABASE_MARGINAL_OK) names.emplace_back("DATABASE_MARGINAL_OK");
  if (level & ALPM_SIG_DATABASE_UNKNOWN_OK) names.emplace_back("DATABASE_UNKNOWN_OK");
  return names;
}

int default_siglevel(const ConfReader &reader, const std::vector<std::string> &conf_args) {
  auto args = conf_args;
  args.emplace_back("SigLevel");
  return fold_siglevels(ALPM_SIG_USE_DEFAULT, reader(args).value_or(""));
}

int repo_siglevel(std::string_view repo, int level, const ConfReader &reader,
                  const std::vector<std::string> &conf_args) {
  auto args = conf_args;
  args.emplace_back("--repo=" + std::string(repo));
  args.emplace_back("SigLevel");
  return fold_siglevels(level, reader(args).value_or(""));
}
