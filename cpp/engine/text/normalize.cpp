#include "engine/text/normalize.hpp"

#include <algorithm>

namespace folio::text {

namespace {

// 0 if s[i] does not start a curly quote, else the ASCII replacement.
char curly_quote_at(std::string_view s, size_t i) noexcept {
  if (i + 2 >= s.size()) return 0;
  const auto b0 = static_cast<unsigned char>(s[i]);
  const auto b1 = static_cast<unsigned char>(s[i + 1]);
  if (b0 != 0xE2 || b1 != 0x80) return 0;
  switch (static_cast<unsigned char>(s[i + 2])) {
    case 0x98:
    case 0x99: return '\'';
    case 0x9C:
    case 0x9D: return '"';
    default:   return 0;
  }
}

template <class Emit>
void walk_churn(std::string_view raw, Emit&& emit) {
  size_t i = 0;
  while (i < raw.size()) {
    size_t ws = space_seq_len(raw, i);
    if (ws > 0) {
      const size_t run_start = i;
      while (ws > 0) {
        i += ws;
        ws = space_seq_len(raw, i);
      }
      emit(' ', run_start);
      continue;
    }
    const char q = curly_quote_at(raw, i);
    if (q != 0) {
      emit(q, i);
      i += 3;
      continue;
    }
    emit(raw[i], i);
    ++i;
  }
}

} // namespace

size_t NormalizedText::to_raw(size_t norm_pos) const noexcept {
  if (raw_index.empty()) return 0;
  return raw_index[std::min(norm_pos, raw_index.size() - 1)];
}

size_t NormalizedText::from_raw(size_t raw_pos) const noexcept {
  auto it = std::lower_bound(raw_index.begin(), raw_index.end(), raw_pos);
  if (it == raw_index.end()) return text.size();
  return static_cast<size_t>(it - raw_index.begin());
}

NormalizedText normalize_churn_mapped(std::string_view raw, size_t raw_base) {
  NormalizedText out;
  out.text.reserve(raw.size());
  out.raw_index.reserve(raw.size() + 1);
  walk_churn(raw, [&](char c, size_t at) {
    out.text.push_back(c);
    out.raw_index.push_back(raw_base + at);
  });
  out.raw_index.push_back(raw_base + raw.size());
  return out;
}

std::string normalize_churn(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  walk_churn(raw, [&](char c, size_t) { out.push_back(c); });
  return out;
}

size_t space_seq_len(std::string_view s, size_t i) noexcept {
  if (i >= s.size()) return 0;
  const auto c = static_cast<unsigned char>(s[i]);
  if (is_space_byte(c)) return 1;
  if (c == 0xC2 && i + 1 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0xA0) return 2;
  return 0;
}

size_t leading_space_bytes(std::string_view s) noexcept {
  size_t i = 0;
  size_t ws = space_seq_len(s, i);
  while (ws > 0) {
    i += ws;
    ws = space_seq_len(s, i);
  }
  return i;
}

size_t trailing_space_bytes(std::string_view s) noexcept {
  size_t n = 0;
  size_t e = s.size();
  while (e > 0) {
    if (is_space_byte(static_cast<unsigned char>(s[e - 1]))) {
      --e;
      ++n;
    } else if (e >= 2 && static_cast<unsigned char>(s[e - 2]) == 0xC2 &&
               static_cast<unsigned char>(s[e - 1]) == 0xA0) {
      e -= 2;
      n += 2;
    } else {
      break;
    }
  }
  return n;
}

bool has_visible_text(std::string_view s) noexcept {
  size_t i = 0;
  while (i < s.size()) {
    const size_t ws = space_seq_len(s, i);
    if (ws == 0) return true;
    i += ws;
  }
  return false;
}

size_t utf8_ceil(std::string_view s, size_t pos) noexcept {
  while (pos < s.size() && is_utf8_continuation(static_cast<unsigned char>(s[pos]))) ++pos;
  return std::min(pos, s.size());
}

size_t utf8_floor(std::string_view s, size_t pos) noexcept {
  if (pos >= s.size()) return s.size();
  while (pos > 0 && is_utf8_continuation(static_cast<unsigned char>(s[pos]))) --pos;
  return pos;
}

}  // namespace folio::text
