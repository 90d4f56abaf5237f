#include "query_driver.hpp"
#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include "error.hpp"
#include "reconcile.hpp"
#include "util.hpp"

QueryDriver::QueryDriver(const PackageDatabase &database, const SignatureDecoder *decoder, QueryOptions options)
  : database_(database), decoder_(decoder), options_(std::move(options)) {
  if (options_.recurse) options_.all = true;
  auto time = measure_time<std::chrono::milliseconds>([this] { reverse_deps_ = ReverseDepsDatabase{database_}; });
  if (options_.verbose) eprintln("Built reverse dependencies of the sync databases. (", time.count(), " ms)");
}

PackageRecord QueryDriver::find_in_databases(std::string_view name, DatabaseScope scope) const {
  if (auto pkg = database_.get_package(name, scope)) return std::move(*pkg);
  throw QueryError(kNotFound, "'" + std::string(name) + "' not found in the " + (scope == kSync ? "sync" : "local")
    + " databases");
}

PackageRecord QueryDriver::generate_pkg_info(const PackageRecord &pkg) const {
  if (!options_.all && pkg.install_reason != kExplicit)
    throw QueryError(kNotExplicit, "'" + pkg.name + "' not explicitly installed, skipped");
  auto pkg_info = pkg;
  if (!options_.plain) pkg_info = enrich_pkg_info(std::move(pkg_info));
  if (decoder_) pkg_info = decode_keyid(std::move(pkg_info), *decoder_);
  return reverse_deps_.add_reverse_deps(std::move(pkg_info));
}

PackageRecord QueryDriver::enrich_pkg_info(PackageRecord pkg_info) const {
  std::optional<PackageRecord> complementary;
  try {
    complementary = find_in_databases(pkg_info.name, complement(options_.scope()));
  } catch (const QueryError &e) {
    if (options_.verbose) eprintln(e.what());
    return pkg_info;
  }
  return reconcile(std::move(pkg_info), std::move(complementary), {.plain = options_.plain});
}

std::vector<PackageRecord> QueryDriver::query_packages() const {
  std::vector<PackageRecord> result;
  database_.for_each_package(options_.scope(), [&](const PackageRecord &pkg) {
    try {
      result.push_back(generate_pkg_info(pkg));
    } catch (const QueryError &e) {
      if (e.kind() != kNotExplicit || options_.verbose) eprintln(e.what());
    }
  });
  return result;
}

ClosureState QueryDriver::query_closure(std::string_view root) const {
  auto pkg = find_in_databases(root, options_.scope());
  DependencyResolver resolver{database_, {
    .scope = options_.scope(),
    .include_optional = options_.optional,
    .summary_only = options_.summary,
    .verbose = options_.verbose
  }, [this](const PackageRecord &satisfier) { return generate_pkg_info(satisfier); }};
  return resolver.resolve(pkg);
}

json QueryDriver::run() const {
  if (!options_.recurse) return query_packages();
  ClosureState closure;
  try {
    closure = query_closure(*options_.recurse);
  } catch (const QueryError &e) {
    if (e.kind() != kNotFound) throw;
    eprintln(e.what());
    return json::array();
  }
  if (options_.summary) return closure.ordered_keys();
  return closure.records;
}
