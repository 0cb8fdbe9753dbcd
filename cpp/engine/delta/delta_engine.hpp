#pragma once
/*
================================================================================
Fragment 4.1 - Delta: Fingerprint Delta Engine
FILE: cpp/engine/delta/delta_engine.hpp

Purpose:
  - Classify every tracked span across two fingerprint collections as
    added, removed, modified, moved or unresolved.
  - Unchanged spans (same hash, same offset) appear in no category.

Classification (per id in the union of both collections):
  current only .................... added
  previous only ................... removed
  same hash, same offset .......... (omitted)
  same hash, different offset ..... moved       (resolver on the previous fp)
  different hash .................. modified    (resolver on the previous fp)
  resolver finds nothing .......... unresolved  "anchor-resolution-failed"
  resolver throws ................. unresolved  "anchor-exception"

Without the current full text the resolver is not consulted: moved/modified
entries carry tier 0, confidence 0 and the current offset.

Hardening:
  - Per-span failures never propagate; the report is always complete.
  - Entries within each category are ordered by id.
  - Invalid DeltaSettings throw ValidationError before any work.
================================================================================
*/

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/anchor/fingerprint_types.hpp"
#include "engine/core/settings.hpp"

namespace folio {

class ParallelResolver;

inline constexpr const char* kReasonResolutionFailed = "anchor-resolution-failed";
inline constexpr const char* kReasonException = "anchor-exception";

struct ModifiedEntry {
  std::string id;
  size_t position = 0;
  int tier = 0;
  double confidence = 0.0;

  bool operator==(const ModifiedEntry&) const = default;
};

struct MovedEntry {
  std::string id;
  size_t from = 0;
  size_t to = 0;
  int tier = 0;
  double confidence = 0.0;

  bool operator==(const MovedEntry&) const = default;
};

struct UnresolvedEntry {
  std::string id;
  size_t prior_offset = 0;
  std::string reason;
  int last_tier = 0;          // last tier attempted before giving up
  double last_confidence = 0.0;
  std::string detail;         // exception text for kReasonException

  bool operator==(const UnresolvedEntry&) const = default;
};

struct DeltaReport {
  std::vector<std::string> added;
  std::vector<std::string> removed;
  std::vector<ModifiedEntry> modified;
  std::vector<MovedEntry> moved;
  std::vector<UnresolvedEntry> unresolved;

  bool operator==(const DeltaReport&) const = default;
};

// previous == nullptr means "no prior snapshot": every current id is added.
// pool == nullptr uses settings.resolver_threads (1 = the calling thread).
DeltaReport diff_collections(const FingerprintCollection* previous,
                             const FingerprintCollection& current,
                             std::optional<std::string_view> current_text = std::nullopt,
                             const DeltaSettings& settings = {},
                             const ParallelResolver* pool = nullptr);

// Ids whose content or position changed (added, modified, moved), sorted.
std::vector<std::string> needs_reprocessing(const DeltaReport& report);

// True when no span changed and none is unresolved.
bool is_clean(const DeltaReport& report) noexcept;

}  // namespace folio
