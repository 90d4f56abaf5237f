#include "dependency.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <alpm.h>
#include "util.hpp"

std::string Dependency::dep_string() const {
  std::string result = name;
  if (is_versioned()) result.append(operator_string(mod)).append(version);
  return result;
}

bool Dependency::satisfied_by_version(std::string_view candidate) const {
  if (!is_versioned()) return true;
  auto cmp = compare_versions(candidate, version);
  switch (mod) {
  case kModEq: return cmp == 0;
  case kModGe: return cmp >= 0;
  case kModLe: return cmp <= 0;
  case kModGt: return cmp > 0;
  case kModLt: return cmp < 0;
  default: return true;
  }
}

bool Dependency::satisfied_by(std::string_view pkg_name, std::string_view pkg_version,
  const std::vector<Dependency> &provides) const {
  if (pkg_name == name && satisfied_by_version(pkg_version)) return true;
  for (const auto &provision : provides) {
    if (provision.name != name) continue;
    if (!is_versioned()) return true;
    if (provision.mod == kModEq && satisfied_by_version(provision.version)) return true;
  }
  return false;
}

Dependency parse_dependency(std::string_view raw_dep) {
  Dependency dep;
  raw_dep = trim(raw_dep);
  if (auto colon = raw_dep.find(": "); colon != std::string_view::npos) {
    dep.description = trim(raw_dep.substr(colon + 2));
    raw_dep = trim(raw_dep.substr(0, colon));
  }
  auto op = raw_dep.find_first_of("<>=");
  if (op == std::string_view::npos) {
    dep.name = raw_dep;
    return dep;
  }
  dep.name = trim(raw_dep.substr(0, op));
  auto rest = raw_dep.substr(op);
  if (rest.starts_with("<=")) dep.mod = kModLe;
  else if (rest.starts_with(">=")) dep.mod = kModGe;
  else if (rest.starts_with('<')) dep.mod = kModLt;
  else if (rest.starts_with('>')) dep.mod = kModGt;
  else dep.mod = kModEq;
  dep.version = trim(rest.substr(operator_string(dep.mod).size()));
  return dep;
}

std::vector<Dependency> parse_dependencies(const std::vector<std::string_view> &raw_deps) {
  std::vector<Dependency> result;
  result.reserve(raw_deps.size());
  for (auto raw_dep : raw_deps)
    if (!trim(raw_dep).empty()) result.emplace_back(parse_dependency(raw_dep));
  return result;
}

int compare_versions(std::string_view a, std::string_view b) {
  return alpm_pkg_vercmp(std::string{a}.c_str(), std::string{b}.c_str());
}
