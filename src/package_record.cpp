#include "package_record.hpp"
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

std::vector<std::string_view> validation_names(std::uint8_t validation) {
  if (validation == kValidationUnknown) return {"Unknown"};
  std::vector<std::string_view> names;
  if (validation & kValidationNone) names.emplace_back("None");
  if (validation & kValidationMd5Sum) names.emplace_back("Md5Sum");
  if (validation & kValidationSha256Sum) names.emplace_back("Sha256Sum");
  if (validation & kValidationSignature) names.emplace_back("Signature");
  return names;
}

Companion::Companion(PackageRecord record) : record_(std::make_unique<PackageRecord>(std::move(record))) {
  record_->companion.reset();
}

Companion::Companion(const Companion &other)
  : record_(other.record_ ? std::make_unique<PackageRecord>(*other.record_) : nullptr) {}

Companion &Companion::operator=(const Companion &other) {
  if (this != &other) record_ = other.record_ ? std::make_unique<PackageRecord>(*other.record_) : nullptr;
  return *this;
}

Companion::~Companion() = default;

void Companion::reset() noexcept { record_.reset(); }
