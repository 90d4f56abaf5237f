#include "memory_database.hpp"
#include <limits>
#include <string>
#include <utility>
#include <vector>
#include "error.hpp"

DatabaseId MemoryDatabase::add_database(std::string_view name) {
  auto it = name_to_database_id_.find(name);
  if (it != name_to_database_id_.end()) return it->second;
  if (database_count() > std::numeric_limits<DatabaseId>::max())
    throw QueryError(kDatabaseRegistrationFailure, "too many databases, cannot register '" + std::string(name) + "'");
  DatabaseId dbid = database_count();
  database_nodes_.push_back({
    .name = std::string(name)
  });
  name_to_database_id_.emplace(name, dbid);
  return dbid;
}

std::pair<PackageId, bool> MemoryDatabase::add_package(DatabaseId dbid, PackageRecord record) {
  auto &dbnode = database_nodes_[dbid];
  auto it = dbnode.name_to_package_id.find(record.name);
  if (it != dbnode.name_to_package_id.end()) return {it->second, false};
  PackageId pid = package_count();
  record.repository = dbnode.name;
  record.companion.reset();
  dbnode.name_to_package_id.emplace(record.name, pid);
  dbnode.package_ids.push_back(pid);
  package_nodes_.push_back(std::move(record));
  return {pid, true};
}

std::vector<DatabaseId> MemoryDatabase::scope_databases(DatabaseScope scope) const {
  std::vector<DatabaseId> dbids;
  for (DatabaseId dbid = 0; dbid < database_count(); ++dbid)
    if ((database_nodes_[dbid].name == kLocalDatabaseName) == (scope == kLocal)) dbids.push_back(dbid);
  return dbids;
}

std::vector<std::string> MemoryDatabase::repositories(DatabaseScope scope) const {
  std::vector<std::string> names;
  for (auto dbid : scope_databases(scope)) names.push_back(database_nodes_[dbid].name);
  return names;
}

std::optional<PackageRecord> MemoryDatabase::get_package(std::string_view name, DatabaseScope scope) const {
  for (auto dbid : scope_databases(scope)) {
    const auto &dbnode = database_nodes_[dbid];
    if (auto it = dbnode.name_to_package_id.find(name); it != dbnode.name_to_package_id.end())
      return package_nodes_[it->second];
  }
  return std::nullopt;
}

void MemoryDatabase::for_each_package(DatabaseScope scope, const PackageVisitor &visit) const {
  for (auto dbid : scope_databases(scope))
    for (auto pid : database_nodes_[dbid].package_ids) visit(package_nodes_[pid]);
}

std::optional<PackageRecord> MemoryDatabase::find_satisfier(const Dependency &dep, DatabaseScope scope) const {
  auto dbids = scope_databases(scope);
  for (auto dbid : dbids) {
    const auto &dbnode = database_nodes_[dbid];
    auto it = dbnode.name_to_package_id.find(dep.name);
    if (it == dbnode.name_to_package_id.end()) continue;
    const auto &pnode = package_nodes_[it->second];
    if (dep.satisfied_by_version(pnode.version)) return pnode;
  }
  for (auto dbid : dbids)
    for (auto pid : database_nodes_[dbid].package_ids) {
      const auto &pnode = package_nodes_[pid];
      if (pnode.name != dep.name && dep.satisfied_by(pnode.name, pnode.version, pnode.provides)) return pnode;
    }
  return std::nullopt;
}
