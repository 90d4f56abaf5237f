#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum DepMod : std::uint8_t { kModAny, kModEq, kModGe, kModLe, kModGt, kModLt };

constexpr std::string_view to_string(DepMod mod) noexcept {
  switch (mod) {
  case kModAny: return "Any";
  case kModEq: return "Eq";
  case kModGe: return "Ge";
  case kModLe: return "Le";
  case kModGt: return "Gt";
  case kModLt: return "Lt";
  }
  return "Any";
}

constexpr std::string_view operator_string(DepMod mod) noexcept {
  switch (mod) {
  case kModEq: return "=";
  case kModGe: return ">=";
  case kModLe: return "<=";
  case kModGt: return ">";
  case kModLt: return "<";
  default: return "";
  }
}

// A declared relationship: `name[op version][: description]`. The satisfier
// is the `name=version` key of the package the resolver matched it to.
struct Dependency {
  std::string name;
  DepMod mod = kModAny;
  std::string version;
  std::string description;
  std::optional<std::string> satisfier;

  bool is_versioned() const noexcept { return mod != kModAny; }

  std::string dep_string() const;

  bool satisfied_by_version(std::string_view candidate) const;

  // A candidate satisfies the dependency through its own name and version, or
  // through a provision of the same name. An unversioned provision never
  // satisfies a versioned dependency.
  bool satisfied_by(std::string_view name, std::string_view version, const std::vector<Dependency> &provides) const;
};

Dependency parse_dependency(std::string_view raw_dep);
std::vector<Dependency> parse_dependencies(const std::vector<std::string_view> &raw_deps);

int compare_versions(std::string_view a, std::string_view b);
