#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "package_record.hpp"

using SignatureBytes = std::vector<unsigned char>;

// Decodes detached package signatures. Both operations throw QueryError
// (kSignatureDecodeFailure, kKeyExtractionFailure) on failure.
class SignatureDecoder {
public:
  virtual ~SignatureDecoder() = default;

  virtual SignatureBytes decode_signature(std::string_view base64_sig) const = 0;
  virtual std::vector<std::string> extract_key_ids(std::string_view name, const SignatureBytes &signature) const = 0;
};

// Fills record.key_ids. Never throws: a failure is stored as a one-element
// diagnostic in place of the key IDs.
PackageRecord decode_keyid(PackageRecord record, const SignatureDecoder &decoder);
