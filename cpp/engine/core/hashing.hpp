#pragma once
/*
================================================================================
Fragment 1.5 - Core: Deterministic Hashing Utilities
FILE: cpp/engine/core/hashing.hpp

Purpose:
  - Content hashes for span fingerprints and document checksums.
  - SHA-256 (via OpenSSL EVP) is the default content hash.
  - FNV-1a 64 is the cheap alternative for the builder's fast mode.

Design constraints:
  - Determinism > speed.
  - No dependence on std::hash (not stable across processes/platforms).
  - Digests are lowercase hex; the algorithm is recoverable from the digest
    length (16 chars = FNV-1a 64, 64 chars = SHA-256).

Notes:
  - Hashes cover the exact bytes given. Any normalization is the caller's.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace folio {

// ----------------------------- Hash64 ----------------------------------------
struct Hash64 {
  uint64_t value = 0;

  constexpr bool operator==(const Hash64& o) const noexcept { return value == o.value; }
  constexpr bool operator!=(const Hash64& o) const noexcept { return value != o.value; }
};

// ----------------------------- FNV-1a 64 -------------------------------------
// Stable baseline hash. Not crypto.
class Fnv1a64 {
 public:
  static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr uint64_t kPrime       = 1099511628211ull;

  Fnv1a64() : h_(kOffsetBasis) {}

  uint64_t value() const { return h_; }

  void reset() { h_ = kOffsetBasis; }

  void update_bytes(const void* data, size_t n);

  // Raw bytes, no length delimiter (content hashing of a single blob).
  void update_raw(std::string_view s) { update_bytes(s.data(), s.size()); }

 private:
  uint64_t h_;
};

// ----------------------------- Content hashes --------------------------------
enum class HashAlgorithm : int {
  kSha256  = 0,
  kFnv1a64 = 1
};

constexpr size_t kSha256HexLen  = 64;
constexpr size_t kFnv1a64HexLen = 16;

// Hex encoding, most significant nibble first (16 chars).
std::string hash_to_hex(Hash64 h);

// SHA-256 of the bytes as 64 lowercase hex chars. Throws HashError if the
// OpenSSL digest context cannot be created or fails.
std::string sha256_hex(std::string_view bytes);

// FNV-1a 64 of the bytes as 16 lowercase hex chars.
std::string fnv1a64_hex(std::string_view bytes);

std::string content_hash_hex(std::string_view bytes, HashAlgorithm algo);

// True if `hex` is a lowercase hex digest of a supported length.
bool is_content_hash(std::string_view hex) noexcept;

// Recompute the digest of `bytes` with the algorithm implied by `hex` and
// compare. Unsupported digests never match.
bool hash_matches(std::string_view bytes, std::string_view hex);

}  // namespace folio
