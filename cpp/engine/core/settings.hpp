#pragma once
/*
================================================================================
Fragment 1.4 - Core: Fingerprint + Anchoring Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every knob that affects fingerprint capture and anchor
    resolution into validated objects.
  - Results are cached and diffed across runs, so the defaults are part of
    the contract: changing them changes which tier resolves a span.

Hardening:
  - validate_or_throw() catches nonsensical values early.
  - Shingle geometry is shared by the builder (which caches shingles) and
    the resolver (which recomputes them when none are cached).
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <string>

#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"

namespace folio {

// ----------------------------- Shingles --------------------------------------
struct ShingleSettings {
  // Tokens per shingle.
  int tokens_per_shingle = 8;

  // Cap on shingles kept per span.
  int max_shingles = 3;

  // Only shingles starting within the first N span tokens are candidates.
  // Bounds the tier-4 full document scan.
  int seed_token_limit = 64;

  // Chosen shingles must start at least this many tokens apart.
  int min_start_gap = 8;

  void validate_or_throw() const {
    if (tokens_per_shingle < 2 || tokens_per_shingle > 64) {
      throw ValidationError("ShingleSettings", "tokens_per_shingle outside sane bounds");
    }
    if (max_shingles < 1 || max_shingles > 16) {
      throw ValidationError("ShingleSettings", "max_shingles outside sane bounds");
    }
    if (seed_token_limit < 1 || seed_token_limit > 4096) {
      throw ValidationError("ShingleSettings", "seed_token_limit outside sane bounds");
    }
    if (min_start_gap < 0 || min_start_gap > 1024) {
      throw ValidationError("ShingleSettings", "min_start_gap outside sane bounds");
    }
  }
};

// ----------------------------- Builder ---------------------------------------
struct BuilderSettings {
  // Bytes of context captured on each side of a span.
  size_t context_chars = 64;

  // Content hash for spans (documentChecksum uses the same algorithm).
  HashAlgorithm hash = HashAlgorithm::kSha256;

  // Cache rare shingles in each fingerprint.
  bool compute_rare_shingles = true;

  // Keep the exact span text in the fingerprint. Enables the verbatim and
  // normalized tier-1 checks and tier 3; costs one copy of the document.
  bool retain_text = false;

  ShingleSettings shingles;

  void validate_or_throw() const {
    if (context_chars < 1 || context_chars > 1024) {
      throw ValidationError("BuilderSettings", "context_chars outside sane bounds");
    }
    shingles.validate_or_throw();
  }

  // FNV-1a content hashes, no shingles. For large documents in interactive
  // loops where SHA-256 plus shingle scoring is too slow.
  static BuilderSettings fast() {
    BuilderSettings s;
    s.hash = HashAlgorithm::kFnv1a64;
    s.compute_rare_shingles = false;
    return s;
  }
};

// ----------------------------- Anchoring -------------------------------------
struct AnchorSettings {
  // Bytes searched on each side of the prior span for tiers 2 and 3.
  size_t corridor_chars = 1500;

  // Minimum normalized length for a stored context to be usable.
  size_t context_min_chars = 8;

  // Longest stored context considered (matches BuilderSettings::context_chars).
  size_t context_max_chars = 64;

  // Tier 3: seed length and acceptance.
  int fuzzy_seed_tokens = 5;
  double fuzzy_slice_factor = 1.1;
  double fuzzy_min_overlap = 0.55;

  // Tier 4: acceptance.
  double shingle_min_hit_ratio = 0.34;

  ShingleSettings shingles;

  void validate_or_throw() const {
    if (corridor_chars > 10000000) {
      throw ValidationError("AnchorSettings", "corridor_chars outside sane bounds");
    }
    if (context_min_chars < 1 || context_min_chars > context_max_chars) {
      throw ValidationError("AnchorSettings", "context_min_chars must be in [1, context_max_chars]");
    }
    if (context_max_chars > 1024) {
      throw ValidationError("AnchorSettings", "context_max_chars outside sane bounds");
    }
    if (fuzzy_seed_tokens < 1 || fuzzy_seed_tokens > 64) {
      throw ValidationError("AnchorSettings", "fuzzy_seed_tokens outside sane bounds");
    }
    if (fuzzy_slice_factor < 1.0 || fuzzy_slice_factor > 4.0) {
      throw ValidationError("AnchorSettings", "fuzzy_slice_factor must be [1,4]");
    }
    if (fuzzy_min_overlap <= 0.0 || fuzzy_min_overlap >= 1.0) {
      throw ValidationError("AnchorSettings", "fuzzy_min_overlap must be (0,1)");
    }
    if (shingle_min_hit_ratio <= 0.0 || shingle_min_hit_ratio > 1.0) {
      throw ValidationError("AnchorSettings", "shingle_min_hit_ratio must be (0,1]");
    }
    shingles.validate_or_throw();
  }
};

// ----------------------------- Delta -----------------------------------------
struct DeltaSettings {
  AnchorSettings anchor;

  // Threads resolving spans when diff_collections gets no pool:
  // 1 = the calling thread only, 0 = hardware concurrency.
  int resolver_threads = 1;

  void validate_or_throw() const {
    anchor.validate_or_throw();
    if (resolver_threads < 0 || resolver_threads > 1024) {
      throw ValidationError("DeltaSettings", "resolver_threads outside sane bounds");
    }
  }
};

// ----------------------------- EngineSettings --------------------------------
struct EngineSettings {
  BuilderSettings builder;
  DeltaSettings delta;

  // Fingerprint file used by the EngineSettings overloads of
  // load_fingerprints/save_fingerprints; relative to the working directory.
  std::string store_path = ".folio/fingerprints.json";

  void validate_or_throw() const {
    builder.validate_or_throw();
    delta.validate_or_throw();
    if (store_path.empty()) {
      throw ValidationError("EngineSettings", "store_path must not be empty");
    }
  }

  static EngineSettings defaults() {
    EngineSettings s;
    return s;
  }
};

}  // namespace folio
