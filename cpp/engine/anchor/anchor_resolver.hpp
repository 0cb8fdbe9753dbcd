#pragma once
/*
================================================================================
Fragment 3.4 - Anchor: Multi-Tier Anchor Resolver
FILE: cpp/engine/anchor/anchor_resolver.hpp

Purpose:
  - Relocate one fingerprinted span inside the current document text.

Tiers (tried strictly in order, first success wins):
  1) Exact / hash at the prior offset ............ confidence 1.0 (0.98 churn)
  2) Context window inside the corridor .......... 0.95 both, 0.90 pre, 0.85 post
  3) Fuzzy token overlap inside the corridor ..... 0.60 .. 0.80
  4) Rare shingle search over the whole document . 0.736 .. 0.76

Confidence bands belong to their tier; never compare across tiers.

Hardening:
  - "No match" is never an exception: every tier clamps its own offsets and
    falls through when inputs are missing or out of bounds.
  - The only exception is ValidationError for a malformed fingerprint
    (see Fingerprint::validate_or_throw), raised before any tier runs.
  - Pure: identical inputs give identical results; no shared state, so
    distinct fingerprints can be resolved on distinct threads.
================================================================================
*/

#include <optional>
#include <string_view>

#include "engine/anchor/fingerprint_types.hpp"
#include "engine/core/settings.hpp"

namespace folio {

// Tier confidences.
inline constexpr double kTier1ExactConfidence      = 1.0;
inline constexpr double kTier1ChurnConfidence      = 0.98;
inline constexpr double kTier2BothConfidence       = 0.95;
inline constexpr double kTier2PreOnlyConfidence    = 0.90;
inline constexpr double kTier2PostOnlyConfidence   = 0.85;
inline constexpr double kTier3MinConfidence        = 0.6;
inline constexpr double kTier3MaxConfidence        = 0.8;
inline constexpr double kTier4BaseConfidence       = 0.6;

std::optional<AnchorMatch> resolve(const Fingerprint& fp,
                                   std::string_view current_text,
                                   const AnchorSettings& settings = {});

// Same as resolve(), plus the last tier attempted. Used by the delta engine
// so unresolved spans can report how far resolution got.
ResolveTrace resolve_trace(const Fingerprint& fp,
                           std::string_view current_text,
                           const AnchorSettings& settings = {});

// Single tier entry point. Returns nothing when the tier is skipped or does
// not match. Validates the fingerprint like resolve(); a tier outside 1..4
// throws folio::Error (kUnknownTier).
std::optional<AnchorMatch> resolve_tier(int tier,
                                        const Fingerprint& fp,
                                        std::string_view current_text,
                                        const AnchorSettings& settings = {});

}  // namespace folio
