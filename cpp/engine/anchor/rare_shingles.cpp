#include "engine/anchor/rare_shingles.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

namespace folio {

namespace {

struct Candidate {
  size_t start = 0;
  double score = 0.0;
};

} // namespace

std::vector<RareShingle> select_rare_shingles(const std::vector<text::Token>& tokens,
                                              const ShingleSettings& s) {
  std::vector<RareShingle> out;
  const size_t k = static_cast<size_t>(s.tokens_per_shingle);
  if (tokens.size() < k) return out;

  std::unordered_map<std::string, int> freq;
  for (const auto& t : tokens) ++freq[t.text];

  const size_t last_start = tokens.size() - k;
  const size_t start_cap = std::min(last_start + 1, static_cast<size_t>(s.seed_token_limit));

  std::vector<Candidate> cands;
  cands.reserve(start_cap);
  for (size_t i = 0; i < start_cap; ++i) {
    double score = 0.0;
    for (size_t j = 0; j < k; ++j) {
      score += 1.0 / static_cast<double>(freq[tokens[i + j].text]);
    }
    cands.push_back({i, score});
  }

  // Stable: equal scores keep ascending start order.
  std::stable_sort(cands.begin(), cands.end(),
                   [](const Candidate& a, const Candidate& b) { return a.score > b.score; });

  std::vector<size_t> picked;
  for (const auto& c : cands) {
    if (static_cast<int>(picked.size()) >= s.max_shingles) break;
    const bool too_close = std::any_of(picked.begin(), picked.end(), [&](size_t p) {
      const size_t gap = (p > c.start) ? p - c.start : c.start - p;
      return gap < static_cast<size_t>(s.min_start_gap);
    });
    if (too_close) continue;
    picked.push_back(c.start);
  }

  out.reserve(picked.size());
  for (size_t p : picked) {
    RareShingle sh;
    sh.phrase = text::join_tokens(tokens, p, k);
    sh.token_index = static_cast<uint32_t>(p);
    out.push_back(std::move(sh));
  }
  return out;
}

std::vector<RareShingle> select_rare_shingles(std::string_view span_text,
                                              const ShingleSettings& s) {
  return select_rare_shingles(text::tokenize(span_text), s);
}

}  // namespace folio
