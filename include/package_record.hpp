#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"
#include "dependency.hpp"

enum InstallReason : std::uint8_t { kExplicit, kDepend };

// Same bit values as alpm_pkgvalidation_t.
enum ValidationFlag : std::uint8_t {
  kValidationUnknown = 0,
  kValidationNone = 1 << 0,
  kValidationMd5Sum = 1 << 1,
  kValidationSha256Sum = 1 << 2,
  kValidationSignature = 1 << 3
};

constexpr std::string_view to_string(InstallReason reason) noexcept {
  return reason == kExplicit ? "Explicit" : "Depend";
}

std::vector<std::string_view> validation_names(std::uint8_t validation);

struct PackageRecord;

// Exclusive owner of the record found in the complementary database. Copying
// a record deep-copies its companion; a companion never carries one itself.
class Companion {
public:
  Companion() noexcept = default;
  explicit Companion(PackageRecord record);
  Companion(const Companion &other);
  Companion &operator=(const Companion &other);
  Companion(Companion &&) noexcept = default;
  Companion &operator=(Companion &&) noexcept = default;
  ~Companion();

  bool has_value() const noexcept { return record_ != nullptr; }
  explicit operator bool() const noexcept { return has_value(); }

  const PackageRecord &operator*() const noexcept { return *record_; }
  const PackageRecord *operator->() const noexcept { return record_.get(); }
  const PackageRecord *get() const noexcept { return record_.get(); }

  void reset() noexcept;

private:
  std::unique_ptr<PackageRecord> record_;
};

struct PackageRecord {
  std::optional<std::string> repository;
  std::string name;
  std::string version;
  std::string description;
  std::string architecture;
  std::string url;
  std::vector<std::string> licenses;
  std::vector<std::string> groups;
  std::vector<Dependency> provides;
  std::vector<Dependency> depends_on;
  std::vector<Dependency> optional_deps;
  std::vector<Dependency> make_deps;
  std::vector<Dependency> check_deps;
  std::vector<std::string> required_by;
  std::vector<std::string> optional_for;
  std::vector<std::string> required_by_make;
  std::vector<std::string> required_by_check;
  std::vector<Dependency> conflicts_with;
  std::vector<Dependency> replaces;
  std::int64_t download_size = 0;
  std::int64_t installed_size = 0;
  std::string packager;
  std::int64_t build_date = 0;
  std::optional<std::int64_t> install_date;
  InstallReason install_reason = kExplicit;
  bool install_script = false;
  std::string md5_sum;
  std::string sha256_sum;
  std::optional<std::string> base64_sig;
  std::uint8_t validation = kValidationUnknown;
  std::optional<std::vector<std::string>> key_ids;
  Companion companion;

  std::string key() const { return name + '=' + version; }
  bool is_local() const noexcept { return repository && *repository == kLocalDatabaseName; }
};
