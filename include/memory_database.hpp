#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "config.hpp"
#include "package_database.hpp"
#include "string_map.hpp"

class MemoryDatabase : public PackageDatabase {
public:
  MemoryDatabase() noexcept = default;
  ~MemoryDatabase() override = default;

  std::size_t database_count() const noexcept { return database_nodes_.size(); }
  std::size_t package_count() const noexcept { return package_nodes_.size(); }

  // The database named "local" is the local scope; every other name is a
  // sync database. Throws QueryError(kDatabaseRegistrationFailure) past the
  // DatabaseId range.
  DatabaseId add_database(std::string_view name);

  std::pair<PackageId, bool> add_package(DatabaseId dbid, PackageRecord record);
  const PackageRecord &get_package(PackageId pid) const noexcept { return package_nodes_[pid]; }

  std::vector<std::string> repositories(DatabaseScope scope) const override;
  std::optional<PackageRecord> get_package(std::string_view name, DatabaseScope scope) const override;
  void for_each_package(DatabaseScope scope, const PackageVisitor &visit) const override;
  std::optional<PackageRecord> find_satisfier(const Dependency &dep, DatabaseScope scope) const override;

private:
  struct DatabaseNode {
    std::string name;
    std::vector<PackageId> package_ids;
    StringMap<PackageId> name_to_package_id;
  };

  std::vector<DatabaseNode> database_nodes_;
  std::vector<PackageRecord> package_nodes_;
  StringMap<DatabaseId> name_to_database_id_;

  std::vector<DatabaseId> scope_databases(DatabaseScope scope) const;
};
