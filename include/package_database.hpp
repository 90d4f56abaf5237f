#pragma once
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"
#include "dependency.hpp"
#include "package_record.hpp"

// Read-only view over the local database and the registered sync databases.
// Lookups within a scope walk its databases in registration order.
class PackageDatabase {
public:
  using PackageVisitor = std::function<void(const PackageRecord &)>;

  virtual ~PackageDatabase() = default;

  virtual std::vector<std::string> repositories(DatabaseScope scope) const = 0;
  virtual std::optional<PackageRecord> get_package(std::string_view name, DatabaseScope scope) const = 0;
  virtual void for_each_package(DatabaseScope scope, const PackageVisitor &visit) const = 0;
  virtual std::optional<PackageRecord> find_satisfier(const Dependency &dep, DatabaseScope scope) const = 0;

  std::vector<PackageRecord> packages(DatabaseScope scope) const;
};
