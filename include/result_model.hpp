#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "dependency.hpp"
#include "package_record.hpp"

using json = nlohmann::ordered_json;

// Package metadata is not guaranteed to be UTF-8; invalid bytes become U+FFFD.
inline std::string dump_json(const json &j, int indent = -1) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

inline void to_json(json &j, const Dependency &dep) {
  j["name"] = dep.name;
  j["depmod"] = to_string(dep.mod);
  j["version"] = dep.is_versioned() ? json(dep.version) : json(nullptr);
  j["description"] = dep.description.empty() ? json(nullptr) : json(dep.description);
  j["dep_string"] = dep.dep_string();
  j["satisfier"] = dep.satisfier ? json(*dep.satisfier) : json(nullptr);
}

inline void to_json(json &j, const PackageRecord &record) {
  j["repository"] = record.repository ? json(*record.repository) : json(nullptr);
  j["name"] = record.name;
  j["version"] = record.version;
  j["description"] = record.description;
  j["architecture"] = record.architecture;
  j["url"] = record.url;
  j["licenses"] = record.licenses;
  j["groups"] = record.groups;
  j["provides"] = record.provides;
  j["depends_on"] = record.depends_on;
  j["optional_deps"] = record.optional_deps;
  j["make_deps"] = record.make_deps;
  j["check_deps"] = record.check_deps;
  j["required_by"] = record.required_by;
  j["optional_for"] = record.optional_for;
  j["required_by_make"] = record.required_by_make;
  j["required_by_check"] = record.required_by_check;
  j["conflicts_with"] = record.conflicts_with;
  j["replaces"] = record.replaces;
  j["download_size"] = record.download_size;
  j["installed_size"] = record.installed_size;
  j["packager"] = record.packager;
  j["build_date"] = record.build_date;
  j["install_date"] = record.install_date ? json(*record.install_date) : json(nullptr);
  j["install_reason"] = to_string(record.install_reason);
  j["install_script"] = record.install_script;
  j["md5_sum"] = record.md5_sum;
  j["sha_256_sum"] = record.sha256_sum;
  j["base64_sig"] = record.base64_sig ? json(*record.base64_sig) : json(nullptr);
  j["key_ids"] = record.key_ids ? json(*record.key_ids) : json(nullptr);
  j["validated_by"] = validation_names(record.validation);
  if (record.companion) j[record.companion->is_local() ? "local_info" : "sync_info"] = *record.companion;
}
