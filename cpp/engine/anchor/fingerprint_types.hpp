#pragma once
/*
================================================================================
Fragment 3.1 - Anchor: Fingerprint Types
FILE: cpp/engine/anchor/fingerprint_types.hpp

Purpose:
  - One canonical fingerprint record per tracked span. Constructed only by
    the builder or by the fingerprint store's parser (which owns all legacy
    field aliases).
  - Collections are value types: a new edit cycle builds a new collection,
    the previous one is only ever read.

Invariants:
  - offset + length <= document length at capture time.
  - content_hash is a pure function of the exact span bytes.
  - pre_context / post_context never split a UTF-8 sequence.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace folio {

// One span as handed over by the segmentation stage.
struct SpanInput {
  std::string id;
  std::string parent_id;  // e.g. chapter id; may be empty
  size_t start = 0;       // raw byte offset, inclusive
  size_t end = 0;         // raw byte offset, exclusive
  std::string text;       // must equal document[start, end)
};

// A distinctive 8-token phrase and the span token index where it begins.
struct RareShingle {
  std::string phrase;      // tokens joined by single spaces
  uint32_t token_index = 0;

  bool operator==(const RareShingle&) const = default;
};

struct Fingerprint {
  std::string id;
  std::string parent_id;
  std::string content_hash;  // lowercase hex, 64 (SHA-256) or 16 (FNV-1a) chars
  size_t offset = 0;
  size_t length = 0;
  std::string pre_context;
  std::string post_context;
  std::vector<RareShingle> rare_shingles;
  std::optional<std::string> text;  // retained span text (optional)

  // Throws ValidationError on a malformed record: empty id, zero length,
  // offset + length overflow, unsupported hash, or a cached shingle whose
  // token count differs from tokens_per_shingle.
  void validate_or_throw(int tokens_per_shingle = 8) const;

  bool operator==(const Fingerprint&) const = default;
};

struct FingerprintCollection {
  std::string document_checksum;
  std::string generated_at;  // ISO-8601 UTC
  std::map<std::string, Fingerprint> spans;

  const Fingerprint* find(const std::string& id) const {
    auto it = spans.find(id);
    return it == spans.end() ? nullptr : &it->second;
  }

  bool operator==(const FingerprintCollection&) const = default;
};

// Result of a successful relocation.
struct AnchorMatch {
  int tier = 0;             // 1..4
  double confidence = 0.0;  // [0,1], comparable only within a tier
  size_t position = 0;      // new absolute start offset

  bool operator==(const AnchorMatch&) const = default;
};

// Resolution plus the last tier that was actually attempted (0 if every
// tier was skipped for lack of inputs).
struct ResolveTrace {
  std::optional<AnchorMatch> match;
  int last_tier = 0;
  double last_confidence = 0.0;

  bool operator==(const ResolveTrace&) const = default;
};

}  // namespace folio
