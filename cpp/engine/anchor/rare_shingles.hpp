#pragma once
/*
================================================================================
Fragment 3.2 - Anchor: Rare Shingle Selection
FILE: cpp/engine/anchor/rare_shingles.hpp

Purpose:
  - Pick up to N distinctive k-token phrases of a span. They let the tier-4
    search find a span anywhere in the document after a large move.

Selection:
  - Candidates: every k-token window starting within the first
    seed_token_limit tokens.
  - Score: sum over the window of 1 / (token frequency within the span).
  - Order: score descending, then earlier start.
  - Greedy pick, starts at least min_start_gap tokens apart.
  - Fewer than k tokens -> no shingles.
================================================================================
*/

#include <string_view>
#include <vector>

#include "engine/anchor/fingerprint_types.hpp"
#include "engine/core/settings.hpp"
#include "engine/text/tokenize.hpp"

namespace folio {

std::vector<RareShingle> select_rare_shingles(const std::vector<text::Token>& tokens,
                                              const ShingleSettings& s = {});

std::vector<RareShingle> select_rare_shingles(std::string_view span_text,
                                              const ShingleSettings& s = {});

}  // namespace folio
