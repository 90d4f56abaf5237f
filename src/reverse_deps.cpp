#include "reverse_deps.hpp"
#include <string>
#include <vector>

ReverseDepsMap build_reverse_deps_map(const PackageDatabase &database, const DependencySelector &select,
                                      DatabaseScope scope) {
  ReverseDepsMap reverse_deps;
  database.for_each_package(scope, [&](const PackageRecord &pkg) {
    for (const auto &dep : select(pkg)) {
      auto it = reverse_deps.find(dep.name);
      if (it == reverse_deps.end()) it = reverse_deps.emplace(dep.name, ReverseDeps{}).first;
      it->second.insert(pkg.name);
    }
  });
  return reverse_deps;
}

const ReverseDeps &find_reverse_deps(const ReverseDepsMap &map, std::string_view name) noexcept {
  static const ReverseDeps kNone;
  auto it = map.find(name);
  return it != map.end() ? it->second : kNone;
}

ReverseDepsDatabase::ReverseDepsDatabase(const PackageDatabase &database)
  : required_by_(build_reverse_deps_map(database, [](const PackageRecord &pkg) -> const std::vector<Dependency> & {
      return pkg.depends_on;
    })),
    optional_for_(build_reverse_deps_map(database, [](const PackageRecord &pkg) -> const std::vector<Dependency> & {
      return pkg.optional_deps;
    })),
    required_by_make_(build_reverse_deps_map(database,
      [](const PackageRecord &pkg) -> const std::vector<Dependency> & { return pkg.make_deps; })),
    required_by_check_(build_reverse_deps_map(database,
      [](const PackageRecord &pkg) -> const std::vector<Dependency> & { return pkg.check_deps; })) {}

PackageRecord ReverseDepsDatabase::add_reverse_deps(PackageRecord record) const {
  auto assign = [&record](std::vector<std::string> &field, const ReverseDepsMap &map) {
    const auto &deps = find_reverse_deps(map, record.name);
    field.assign(deps.begin(), deps.end());
  };
  assign(record.required_by, required_by_);
  assign(record.optional_for, optional_for_);
  assign(record.required_by_make, required_by_make_);
  assign(record.required_by_check, required_by_check_);
  return record;
}
