#pragma once
/*
================================================================================
Fragment 3.3 - Anchor: Fingerprint Builder
FILE: cpp/engine/anchor/fingerprint_builder.hpp

Purpose:
  - Produce one fingerprint per span from the full document plus the span
    list of the segmentation stage, in one pass over one snapshot.

Contract:
  - content_hash = hash(exact span bytes), never normalized: any byte level
    change breaks hash equality and pushes resolution to the later tiers.
  - pre/post contexts are stored verbatim (normalization happens only when
    comparing), shrunk to UTF-8 boundaries, bounded at document edges.
  - document_checksum = hash(churn-normalized full text), so pure quote or
    whitespace churn does not change the checksum.
  - Pure and deterministic apart from generated_at when it is not supplied.

Errors (folio::Error):
  - kInvalidArgument: empty id.
  - kSpanOutOfRange: start >= end (empty spans are not tracked) or
    end > document length.
  - kTextMismatch: span text != document slice.
  - kDuplicateSpan: two inputs share an id.
================================================================================
*/

#include <string>
#include <string_view>
#include <vector>

#include "engine/anchor/fingerprint_types.hpp"
#include "engine/core/settings.hpp"

namespace folio {

Fingerprint build_fingerprint(std::string_view document,
                              const SpanInput& span,
                              const BuilderSettings& settings = {});

// generated_at empty -> current UTC time.
FingerprintCollection build_collection(std::string_view document,
                                       const std::vector<SpanInput>& spans,
                                       const BuilderSettings& settings = {},
                                       std::string generated_at = {});

std::string document_checksum(std::string_view document,
                              HashAlgorithm algo = HashAlgorithm::kSha256);

}  // namespace folio
