#pragma once
/*
================================================================================
Fragment 5.1 - Store: Fingerprint JSON Serializer (Header)
FILE: cpp/engine/store/fingerprint_json.hpp

Purpose:
  - Deterministic JSON export of a FingerprintCollection.
  - Stable key ordering (documentChecksum, generatedAt, spans by id) so two
    snapshots of the same document serialize byte-identically.

Hardening:
  - No third-party JSON dependency (simple, controlled emitter).
  - Control bytes escaped as \u00XX; all other bytes (UTF-8) pass through.
================================================================================
*/

#include <string>

#include "engine/anchor/fingerprint_types.hpp"

namespace folio {

// Serialize a collection. pretty == false emits a single line.
std::string fingerprints_to_json(const FingerprintCollection& c, bool pretty = true);

} // namespace folio
