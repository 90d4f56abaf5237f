#include "signature.hpp"
#include <string>
#include <utility>
#include "error.hpp"

PackageRecord decode_keyid(PackageRecord record, const SignatureDecoder &decoder) {
  if (!record.base64_sig) return record;
  try {
    auto signature = decoder.decode_signature(*record.base64_sig);
    record.key_ids = decoder.extract_key_ids(record.name, signature);
  } catch (const QueryError &e) {
    record.key_ids = std::vector<std::string>{std::string(to_string(e.kind())) + ": " + e.what()};
  }
  return record;
}
