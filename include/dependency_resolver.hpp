#pragma once
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "config.hpp"
#include "package_database.hpp"
#include "package_record.hpp"
#include "string_map.hpp"

// Visited `name=version` keys in discovery order plus the resolved records in
// completion order. Owned by one closure computation.
struct ClosureState {
  std::vector<std::string> visited_order;
  StringSet visited;
  std::vector<PackageRecord> records;

  bool contains(std::string_view key) const noexcept { return visited.find(key) != visited.end(); }
  bool insert(const std::string &key);

  // Visited keys, most recently discovered first.
  std::vector<std::string> ordered_keys() const;
};

struct ResolveOptions {
  DatabaseScope scope = kLocal;
  bool include_optional = false;
  bool summary_only = false;
  bool verbose = false;
};

// Turns a bare database record into the record emitted for it. May throw; the
// resolver then keeps the bare record.
using RecordEnricher = std::function<PackageRecord(const PackageRecord &)>;

class DependencyResolver {
public:
  DependencyResolver(const PackageDatabase &database, ResolveOptions options, RecordEnricher enrich = {})
    : database_(database), options_(options), enrich_(std::move(enrich)) {}

  // Visited keys are those of the bare records found in the database, so an
  // enriched record whose base moved to the other database keeps its identity.
  ClosureState resolve(const PackageRecord &root) const;
  void resolve(const PackageRecord &root, ClosureState &state, DepthType depth = 0) const;

  const ResolveOptions &options() const noexcept { return options_; }

private:
  struct Frame {
    PackageRecord record;
    DepthType depth;
    std::size_t next = 0;
  };

  const PackageDatabase &database_;
  ResolveOptions options_;
  RecordEnricher enrich_;

  std::size_t dependency_count(const PackageRecord &record) const noexcept;
  Dependency &dependency_at(PackageRecord &record, std::size_t index) const noexcept;
  PackageRecord enrich(const PackageRecord &satisfier) const;
  void enter(const PackageRecord &package, DepthType depth, std::vector<Frame> &stack, ClosureState &state) const;
};
