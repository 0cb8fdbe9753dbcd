#include "engine/text/tokenize.hpp"

namespace folio::text {

namespace {

inline bool is_word_byte(unsigned char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

inline char fold(unsigned char c) noexcept {
  if (c >= 'A' && c <= 'Z') return static_cast<char>(c + ('a' - 'A'));
  return static_cast<char>(c);
}

// Byte length of an apostrophe at s[i], 0 if none.
size_t apostrophe_len(std::string_view s, size_t i) noexcept {
  if (i >= s.size()) return 0;
  if (s[i] == '\'') return 1;
  if (i + 2 < s.size() &&
      static_cast<unsigned char>(s[i]) == 0xE2 &&
      static_cast<unsigned char>(s[i + 1]) == 0x80 &&
      (static_cast<unsigned char>(s[i + 2]) == 0x98 ||
       static_cast<unsigned char>(s[i + 2]) == 0x99)) {
    return 3;
  }
  return 0;
}

} // namespace

std::vector<Token> tokenize(std::string_view s, size_t base) {
  std::vector<Token> out;
  out.reserve(s.size() / 5 + 1);

  size_t i = 0;
  while (i < s.size()) {
    if (!is_word_byte(static_cast<unsigned char>(s[i]))) {
      ++i;
      continue;
    }

    Token t;
    t.begin = base + i;
    while (i < s.size()) {
      const auto c = static_cast<unsigned char>(s[i]);
      if (is_word_byte(c)) {
        t.text.push_back(fold(c));
        ++i;
        continue;
      }
      const size_t ap = apostrophe_len(s, i);
      if (ap > 0 && i + ap < s.size() && is_word_byte(static_cast<unsigned char>(s[i + ap]))) {
        t.text.push_back('\'');
        i += ap;
        continue;
      }
      break;
    }
    t.end = base + i;
    out.push_back(std::move(t));
  }
  return out;
}

std::vector<std::string> token_strings(std::string_view s) {
  std::vector<std::string> out;
  for (auto& t : tokenize(s)) out.push_back(std::move(t.text));
  return out;
}

std::vector<std::string> split_phrase(std::string_view phrase) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < phrase.size()) {
    while (i < phrase.size() && phrase[i] == ' ') ++i;
    size_t j = i;
    while (j < phrase.size() && phrase[j] != ' ') ++j;
    if (j > i) out.emplace_back(phrase.substr(i, j - i));
    i = j;
  }
  return out;
}

std::string join_tokens(const std::vector<Token>& tokens, size_t first, size_t count) {
  std::string out;
  for (size_t k = 0; k < count && first + k < tokens.size(); ++k) {
    if (k > 0) out.push_back(' ');
    out += tokens[first + k].text;
  }
  return out;
}

}  // namespace folio::text
