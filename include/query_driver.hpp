#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"
#include "dependency_resolver.hpp"
#include "package_database.hpp"
#include "package_record.hpp"
#include "result_model.hpp"
#include "reverse_deps.hpp"
#include "signature.hpp"

// Package filters exposed through the command line.
struct QueryOptions {
  bool sync = false;
  bool all = false;
  bool plain = false;
  std::optional<std::string> recurse;
  bool optional = false;
  bool summary = false;
  bool verbose = false;

  DatabaseScope scope() const noexcept { return sync ? kSync : kLocal; }
};

class QueryDriver {
public:
  // Builds the reverse dependency index once; it is shared by every record
  // this driver produces. `decoder` may be null to skip key ID decoding.
  QueryDriver(const PackageDatabase &database, const SignatureDecoder *decoder, QueryOptions options);

  const QueryOptions &options() const noexcept { return options_; }

  // Throws QueryError(kNotExplicit) for packages filtered out.
  PackageRecord generate_pkg_info(const PackageRecord &pkg) const;
  PackageRecord enrich_pkg_info(PackageRecord pkg_info) const;

  // Throws QueryError(kNotFound).
  PackageRecord find_in_databases(std::string_view name, DatabaseScope scope) const;

  std::vector<PackageRecord> query_packages() const;
  ClosureState query_closure(std::string_view root) const;

  // A missing --recurse root is logged and yields an empty array.
  json run() const;

private:
  const PackageDatabase &database_;
  const SignatureDecoder *decoder_;
  QueryOptions options_;
  ReverseDepsDatabase reverse_deps_;
};
