#pragma once
/*
================================================================================
Fragment 5.3 - Store: Fingerprint File
FILE: cpp/engine/store/fingerprint_store.hpp

Purpose:
  - Load/save the fingerprint collection of the last analysis pass.
  - A missing, unreadable or malformed file means "no prior snapshot": the
    caller diffs against nothing and every span comes out as added.

Hardening:
  - load never throws for file or content problems; it logs and returns
    nothing. Only JSON syntax and schema errors reject the file: a record
    that parses but fails Fingerprint::validate_or_throw() is kept, and the
    delta engine reports it as an anchor exception.
  - save writes a sibling temp file and renames it over the target, so a
    collection is always replaced wholesale.
================================================================================
*/

#include <optional>
#include <string>

#include "engine/anchor/fingerprint_types.hpp"
#include "engine/core/settings.hpp"

namespace folio {

std::optional<FingerprintCollection> load_fingerprints(const std::string& path);

// Creates the parent directory when needed. Returns false on any failure.
bool save_fingerprints(const FingerprintCollection& collection, const std::string& path);

// Same, at settings.store_path.
std::optional<FingerprintCollection> load_fingerprints(const EngineSettings& settings);
bool save_fingerprints(const FingerprintCollection& collection, const EngineSettings& settings);

} // namespace folio
