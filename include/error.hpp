#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

enum ErrorKind : std::uint8_t {
  kNotExplicit,
  kNotFound,
  kSignatureDecodeFailure,
  kKeyExtractionFailure,
  kDatabaseRegistrationFailure
};

constexpr std::string_view to_string(ErrorKind kind) noexcept {
  switch (kind) {
  case kNotExplicit: return "NotExplicit";
  case kNotFound: return "NotFound";
  case kSignatureDecodeFailure: return "SignatureDecodeFailure";
  case kKeyExtractionFailure: return "KeyExtractionFailure";
  case kDatabaseRegistrationFailure: return "DatabaseRegistrationFailure";
  }
  return "Unknown";
}

// Only kDatabaseRegistrationFailure is allowed to escape to main; every other
// kind is caught per package and reported on stderr.
class QueryError : public std::runtime_error {
public:
  QueryError(ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};
