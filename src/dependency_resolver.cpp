#include "dependency_resolver.hpp"
#include <algorithm>
#include <exception>
#include <string>
#include <utility>
#include <vector>
#include "util.hpp"

bool ClosureState::insert(const std::string &key) {
  if (!visited.insert(key).second) return false;
  visited_order.push_back(key);
  return true;
}

std::vector<std::string> ClosureState::ordered_keys() const {
  return {visited_order.rbegin(), visited_order.rend()};
}

ClosureState DependencyResolver::resolve(const PackageRecord &root) const {
  ClosureState state;
  resolve(root, state);
  return state;
}

std::size_t DependencyResolver::dependency_count(const PackageRecord &record) const noexcept {
  return record.depends_on.size() + (options_.include_optional ? record.optional_deps.size() : 0);
}

Dependency &DependencyResolver::dependency_at(PackageRecord &record, std::size_t index) const noexcept {
  if (index < record.depends_on.size()) return record.depends_on[index];
  return record.optional_deps[index - record.depends_on.size()];
}

PackageRecord DependencyResolver::enrich(const PackageRecord &satisfier) const {
  if (!enrich_) return satisfier;
  try {
    return enrich_(satisfier);
  } catch (const std::exception &e) {
    eprintln(e.what(), "; using the unreconciled record of '", satisfier.name, "'");
    return satisfier;
  }
}

void DependencyResolver::enter(const PackageRecord &package, DepthType depth, std::vector<Frame> &stack,
                               ClosureState &state) const {
  if (options_.verbose) eprintln("# level ", depth, ": recursing into '", package.name, "'");
  state.insert(package.key());
  stack.push_back({
    .record = enrich(package),
    .depth = depth
  });
}

void DependencyResolver::resolve(const PackageRecord &root, ClosureState &state, DepthType depth) const {
  std::vector<Frame> stack;
  enter(root, depth, stack, state);
  while (!stack.empty()) {
    auto &frame = stack.back();
    if (frame.next == dependency_count(frame.record)) {
      auto record = std::move(frame.record);
      stack.pop_back();
      if (!options_.summary_only) state.records.push_back(std::move(record));
      continue;
    }

    auto &dep = dependency_at(frame.record, frame.next++);
    auto satisfier = database_.find_satisfier(dep, options_.scope);
    if (!satisfier) {
      eprintln("'", dep.dep_string(), "' required by '", frame.record.name, "' not found");
      continue;
    }
    auto key = satisfier->key();
    dep.satisfier = key;
    auto next_depth = frame.depth + 1;
    if (state.contains(key)) {
      if (options_.verbose)
        eprintln("# level ", next_depth, ": duplicated dependency: '", key, "' provides '", dep.dep_string(), "'");
      continue;
    }
    // `frame` and `dep` dangle once the stack grows.
    enter(*satisfier, next_depth, stack, state);
  }
}
