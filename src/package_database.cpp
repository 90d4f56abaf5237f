#include "package_database.hpp"
#include <vector>

std::vector<PackageRecord> PackageDatabase::packages(DatabaseScope scope) const {
  std::vector<PackageRecord> result;
  for_each_package(scope, [&result](const PackageRecord &record) { result.emplace_back(record); });
  return result;
}
