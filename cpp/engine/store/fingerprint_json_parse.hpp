#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

#include "engine/anchor/fingerprint_types.hpp"

namespace folio {

struct JsonParseError {
  std::string message;
  size_t offset = 0;  // byte offset in input
  int line = 1;       // 1-based
  int col = 1;        // 1-based
};

/// Parse a FingerprintCollection from JSON text.
/// - Unknown keys are ignored (forward compatible).
/// - Legacy field names are accepted here and nowhere else:
///     manuscript_sha -> documentChecksum, generated_at -> generatedAt,
///     scenes -> spans, length -> len, preContext/postContext -> pre/post,
///     rareShingles as plain strings -> token index 0.
///   The current name wins when both are present.
/// - offset/len/token must be non-negative integers.
/// - The result is not semantically validated; callers that need that run
///   Fingerprint::validate_or_throw().
bool parse_fingerprints_json(std::string_view json,
                             FingerprintCollection* out,
                             JsonParseError* err = nullptr);

/// Stream convenience (reads full stream into memory).
bool parse_fingerprints_json(std::istream& is,
                             FingerprintCollection* out,
                             JsonParseError* err = nullptr);

}  // namespace folio
