#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <alpm.h>
#include "package_database.hpp"
#include "signature.hpp"

// The system's pacman databases through libalpm. The handle also decodes
// package signatures.
class AlpmDatabase : public PackageDatabase, public SignatureDecoder {
public:
  // Throws QueryError(kDatabaseRegistrationFailure) if libalpm refuses the
  // root or database path.
  AlpmDatabase(const std::string &root_dir, const std::string &db_path);
  ~AlpmDatabase() override;

  AlpmDatabase(const AlpmDatabase &) = delete;
  AlpmDatabase &operator=(const AlpmDatabase &) = delete;

  void register_syncdb(const std::string &name, int siglevel);

  std::vector<std::string> repositories(DatabaseScope scope) const override;
  std::optional<PackageRecord> get_package(std::string_view name, DatabaseScope scope) const override;
  void for_each_package(DatabaseScope scope, const PackageVisitor &visit) const override;
  std::optional<PackageRecord> find_satisfier(const Dependency &dep, DatabaseScope scope) const override;

  SignatureBytes decode_signature(std::string_view base64_sig) const override;
  std::vector<std::string> extract_key_ids(std::string_view name, const SignatureBytes &signature) const override;

  static PackageRecord to_record(alpm_pkg_t *pkg);

private:
  alpm_handle_t *handle_;

  std::vector<alpm_db_t *> databases(DatabaseScope scope) const;
  std::string last_error() const { return alpm_strerror(alpm_errno(handle_)); }
};
