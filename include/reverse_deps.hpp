#pragma once
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"
#include "package_database.hpp"
#include "package_record.hpp"
#include "string_map.hpp"

// Reverse dependencies are computed by one scan over the sync databases
// instead of asking each package who requires it: the per-package query walks
// the whole database every time, which makes a full dump quadratic.

using ReverseDeps = std::set<std::string>;

// From a package name to the names of the packages that declare a dependency
// on it. Names without dependents are absent.
using ReverseDepsMap = StringMap<ReverseDeps>;

using DependencySelector = std::function<const std::vector<Dependency> &(const PackageRecord &)>;

ReverseDepsMap build_reverse_deps_map(const PackageDatabase &database, const DependencySelector &select,
                                      DatabaseScope scope = kSync);

const ReverseDeps &find_reverse_deps(const ReverseDepsMap &map, std::string_view name) noexcept;

class ReverseDepsDatabase {
public:
  ReverseDepsDatabase() = default;
  explicit ReverseDepsDatabase(const PackageDatabase &database);

  const ReverseDepsMap &required_by() const noexcept { return required_by_; }
  const ReverseDepsMap &optional_for() const noexcept { return optional_for_; }
  const ReverseDepsMap &required_by_make() const noexcept { return required_by_make_; }
  const ReverseDepsMap &required_by_check() const noexcept { return required_by_check_; }

  PackageRecord add_reverse_deps(PackageRecord record) const;

private:
  ReverseDepsMap required_by_;
  ReverseDepsMap optional_for_;
  ReverseDepsMap required_by_make_;
  ReverseDepsMap required_by_check_;
};
