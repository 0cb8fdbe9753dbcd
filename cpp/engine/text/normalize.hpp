#pragma once
/*
================================================================================
Fragment 2.1 - Text: Churn Normalization + Position Map
FILE: cpp/engine/text/normalize.hpp

Purpose:
  - "Churn" is incidental noise an editor introduces without changing the
    prose: line ending style, curly vs straight quotes, whitespace runs.
  - normalize_churn() removes it; normalize_churn_mapped() additionally
    records where every normalized byte came from, so a match found in
    normalized text can be translated back to raw document offsets.

Rules (applied in one left-to-right pass, no trimming):
  - Any run of whitespace (space, \t, \n, \r, \f, \v, U+00A0) -> one ' '.
    CRLF/CR line endings are whitespace, so they unify with LF here.
  - U+2018 / U+2019 -> '\''   (3 UTF-8 bytes -> 1)
  - U+201C / U+201D -> '"'    (3 UTF-8 bytes -> 1)
  - Everything else is copied byte for byte.

Position map:
  - raw_index[i] is the raw offset of the first byte that produced
    normalized byte i. A collapsed run maps to the start of the run.
  - raw_index[text.size()] is a sentinel: the raw end offset.
  - Offsets are absolute when a base is passed (corridor slices).
================================================================================
*/

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace folio::text {

struct NormalizedText {
  std::string text;
  std::vector<size_t> raw_index;  // size() == text.size() + 1

  // Raw offset for a normalized position (clamped to the sentinel).
  size_t to_raw(size_t norm_pos) const noexcept;

  // First normalized position whose raw offset is >= raw_pos.
  size_t from_raw(size_t raw_pos) const noexcept;
};

NormalizedText normalize_churn_mapped(std::string_view raw, size_t raw_base = 0);

std::string normalize_churn(std::string_view raw);

// ----------------------------- byte helpers ----------------------------------

inline bool is_space_byte(unsigned char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool is_utf8_continuation(unsigned char c) noexcept {
  return (c & 0xC0u) == 0x80u;
}

// Length in bytes of a whitespace sequence starting at s[i] (0 if none).
// Recognizes ASCII whitespace and U+00A0.
size_t space_seq_len(std::string_view s, size_t i) noexcept;

// Raw bytes of whitespace at the start / end of s.
size_t leading_space_bytes(std::string_view s) noexcept;
size_t trailing_space_bytes(std::string_view s) noexcept;

// True if s has at least one byte that is not whitespace.
bool has_visible_text(std::string_view s) noexcept;

// Move pos forward / backward until it is not inside a UTF-8 sequence.
size_t utf8_ceil(std::string_view s, size_t pos) noexcept;
size_t utf8_floor(std::string_view s, size_t pos) noexcept;

}  // namespace folio::text
