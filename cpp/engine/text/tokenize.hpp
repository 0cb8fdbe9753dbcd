#pragma once
/*
================================================================================
Fragment 2.2 - Text: Word Tokenizer
FILE: cpp/engine/text/tokenize.hpp

Purpose:
  - Lowercase word tokens with raw byte ranges, shared by the rare shingle
    selector, the fuzzy corridor tier and the full document shingle search.

Rules:
  - Token bytes: ASCII [a-z0-9] (A-Z folded to lowercase).
  - An apostrophe (' or U+2019 / U+2018) between two token bytes stays in the
    token as '\''; anywhere else it separates.
  - Every other byte (punctuation, whitespace, non-ASCII) separates tokens.
================================================================================
*/

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace folio::text {

struct Token {
  std::string text;
  size_t begin = 0;  // raw offset, inclusive
  size_t end = 0;    // raw offset, exclusive
};

// Tokenize `s`; offsets are shifted by `base` (for corridor slices).
std::vector<Token> tokenize(std::string_view s, size_t base = 0);

// Token texts only.
std::vector<std::string> token_strings(std::string_view s);

// Split a space-joined phrase (as produced by join_tokens) back into tokens.
std::vector<std::string> split_phrase(std::string_view phrase);

std::string join_tokens(const std::vector<Token>& tokens, size_t first, size_t count);

}  // namespace folio::text
