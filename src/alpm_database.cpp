#include "alpm_database.hpp"
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>
#include "error.hpp"
#include "util.hpp"

namespace {

std::string to_string(const char *value) { return value ? value : ""; }

std::vector<std::string> to_strings(alpm_list_t *list) {
  std::vector<std::string> result;
  for (auto *it = list; it; it = alpm_list_next(it)) result.emplace_back(to_string(static_cast<const char *>(it->data)));
  return result;
}

DepMod to_dep_mod(alpm_depmod_t mod) noexcept {
  switch (mod) {
  case ALPM_DEP_MOD_EQ: return kModEq;
  case ALPM_DEP_MOD_GE: return kModGe;
  case ALPM_DEP_MOD_LE: return kModLe;
  case ALPM_DEP_MOD_GT: return kModGt;
  case ALPM_DEP_MOD_LT: return kModLt;
  default: return kModAny;
  }
}

std::vector<Dependency> to_dependencies(alpm_list_t *list) {
  std::vector<Dependency> result;
  for (auto *it = list; it; it = alpm_list_next(it)) {
    const auto *dep = static_cast<const alpm_depend_t *>(it->data);
    Dependency item;
    item.name = to_string(dep->name);
    item.mod = to_dep_mod(dep->mod);
    item.version = to_string(dep->version);
    item.description = to_string(dep->desc);
    result.push_back(std::move(item));
  }
  return result;
}

struct FreeDeleter {
  void operator()(void *ptr) const noexcept { std::free(ptr); }
};

} // namespace

AlpmDatabase::AlpmDatabase(const std::string &root_dir, const std::string &db_path) {
  alpm_errno_t err;
  handle_ = alpm_initialize(root_dir.c_str(), db_path.c_str(), &err);
  if (!handle_)
    throw QueryError(kDatabaseRegistrationFailure, "failed to initialize alpm (root " + root_dir + ", dbpath "
      + db_path + "): " + alpm_strerror(err));
}

AlpmDatabase::~AlpmDatabase() {
  if (alpm_release(handle_) != 0) eprintln("failed to release the alpm handle");
}

void AlpmDatabase::register_syncdb(const std::string &name, int siglevel) {
  if (!alpm_register_syncdb(handle_, name.c_str(), siglevel))
    throw QueryError(kDatabaseRegistrationFailure, "failed to register sync database '" + name + "': " + last_error());
}

std::vector<alpm_db_t *> AlpmDatabase::databases(DatabaseScope scope) const {
  if (scope == kLocal) return {alpm_get_localdb(handle_)};
  std::vector<alpm_db_t *> dbs;
  for (auto *it = alpm_get_syncdbs(handle_); it; it = alpm_list_next(it)) dbs.push_back(static_cast<alpm_db_t *>(it->data));
  return dbs;
}

std::vector<std::string> AlpmDatabase::repositories(DatabaseScope scope) const {
  std::vector<std::string> names;
  for (auto *db : databases(scope)) names.emplace_back(alpm_db_get_name(db));
  return names;
}

std::optional<PackageRecord> AlpmDatabase::get_package(std::string_view name, DatabaseScope scope) const {
  std::string pkg_name{name};
  for (auto *db : databases(scope))
    if (auto *pkg = alpm_db_get_pkg(db, pkg_name.c_str())) return to_record(pkg);
  return std::nullopt;
}

void AlpmDatabase::for_each_package(DatabaseScope scope, const PackageVisitor &visit) const {
  for (auto *db : databases(scope))
    for (auto *it = alpm_db_get_pkgcache(db); it; it = alpm_list_next(it))
      visit(to_record(static_cast<alpm_pkg_t *>(it->data)));
}

std::optional<PackageRecord> AlpmDatabase::find_satisfier(const Dependency &dep, DatabaseScope scope) const {
  auto depstring = dep.dep_string();
  alpm_pkg_t *pkg = nullptr;
  if (scope == kLocal) {
    pkg = alpm_find_satisfier(alpm_db_get_pkgcache(alpm_get_localdb(handle_)), depstring.c_str());
  } else {
    alpm_list_t *dbs = nullptr;
    for (auto *db : databases(kSync)) dbs = alpm_list_add(dbs, db);
    pkg = alpm_find_dbs_satisfier(handle_, dbs, depstring.c_str());
    alpm_list_free(dbs);
  }
  if (!pkg) return std::nullopt;
  return to_record(pkg);
}

SignatureBytes AlpmDatabase::decode_signature(std::string_view base64_sig) const {
  std::string encoded{base64_sig};
  unsigned char *raw_data = nullptr;
  std::size_t length = 0;
  if (alpm_decode_signature(encoded.c_str(), &raw_data, &length) != 0)
    throw QueryError(kSignatureDecodeFailure, "failed to decode the base64 signature");
  std::unique_ptr<unsigned char, FreeDeleter> data{raw_data};
  return SignatureBytes(data.get(), data.get() + length);
}

std::vector<std::string> AlpmDatabase::extract_key_ids(std::string_view name, const SignatureBytes &signature) const {
  std::string identifier{name};
  alpm_list_t *keys = nullptr;
  if (alpm_extract_keyid(handle_, identifier.c_str(), signature.data(), signature.size(), &keys) != 0) {
    alpm_list_free_inner(keys, std::free);
    alpm_list_free(keys);
    throw QueryError(kKeyExtractionFailure, "failed to extract key IDs of '" + identifier + "': " + last_error());
  }
  auto key_ids = to_strings(keys);
  alpm_list_free_inner(keys, std::free);
  alpm_list_free(keys);
  return key_ids;
}

PackageRecord AlpmDatabase::to_record(alpm_pkg_t *pkg) {
  PackageRecord record;
  if (auto *db = alpm_pkg_get_db(pkg)) record.repository = to_string(alpm_db_get_name(db));
  record.name = to_string(alpm_pkg_get_name(pkg));
  record.version = to_string(alpm_pkg_get_version(pkg));
  record.description = to_string(alpm_pkg_get_desc(pkg));
  record.architecture = to_string(alpm_pkg_get_arch(pkg));
  record.url = to_string(alpm_pkg_get_url(pkg));
  record.licenses = to_strings(alpm_pkg_get_licenses(pkg));
  record.groups = to_strings(alpm_pkg_get_groups(pkg));
  record.provides = to_dependencies(alpm_pkg_get_provides(pkg));
  record.depends_on = to_dependencies(alpm_pkg_get_depends(pkg));
  record.optional_deps = to_dependencies(alpm_pkg_get_optdepends(pkg));
  record.make_deps = to_dependencies(alpm_pkg_get_makedepends(pkg));
  record.check_deps = to_dependencies(alpm_pkg_get_checkdepends(pkg));
  record.conflicts_with = to_dependencies(alpm_pkg_get_conflicts(pkg));
  record.replaces = to_dependencies(alpm_pkg_get_replaces(pkg));
  record.download_size = alpm_pkg_get_size(pkg);
  record.installed_size = alpm_pkg_get_isize(pkg);
  record.packager = to_string(alpm_pkg_get_packager(pkg));
  record.build_date = alpm_pkg_get_builddate(pkg);
  if (auto install_date = alpm_pkg_get_installdate(pkg); install_date != 0) record.install_date = install_date;
  record.install_reason = alpm_pkg_get_reason(pkg) == ALPM_PKG_REASON_DEPEND ? kDepend : kExplicit;
  record.install_script = alpm_pkg_has_scriptlet(pkg) != 0;
  record.md5_sum = to_string(alpm_pkg_get_md5sum(pkg));
  record.sha256_sum = to_string(alpm_pkg_get_sha256sum(pkg));
  if (const char *sig = alpm_pkg_get_base64_sig(pkg)) record.base64_sig = sig;
  record.validation = static_cast<std::uint8_t>(alpm_pkg_get_validation(pkg));
  return record;
}
