#include "engine/anchor/anchor_resolver.hpp"

#include "engine/anchor/rare_shingles.hpp"
#include "engine/core/error.hpp"
#include "engine/core/hashing.hpp"
#include "engine/text/normalize.hpp"
#include "engine/text/tokenize.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_set>
#include <vector>

namespace folio {

namespace {

struct TierResult {
  bool attempted = false;
  std::optional<AnchorMatch> match;
};

// Search window around the prior position, clamped to the document and to
// UTF-8 boundaries.
struct Corridor {
  size_t lo = 0;
  size_t hi = 0;
  size_t prior = 0;
  size_t prior_end = 0;
};

Corridor make_corridor(const Fingerprint& fp, std::string_view text, size_t width) {
  const size_t n = text.size();
  Corridor c;
  c.prior = std::min(fp.offset, n);
  c.prior_end = (fp.length <= n - c.prior) ? c.prior + fp.length : n;
  c.lo = text::utf8_ceil(text, c.prior > width ? c.prior - width : 0);
  c.hi = text::utf8_floor(text, (width <= n - c.prior_end) ? c.prior_end + width : n);
  if (c.hi < c.lo) c.hi = c.lo;
  return c;
}

inline size_t abs_diff(size_t a, size_t b) noexcept { return a > b ? a - b : b - a; }

std::string_view tail_bytes(std::string_view s, size_t max) {
  if (s.size() <= max) return s;
  return s.substr(text::utf8_ceil(s, s.size() - max));
}

std::string_view head_bytes(std::string_view s, size_t max) {
  if (s.size() <= max) return s;
  return s.substr(0, text::utf8_floor(s, max));
}

// Occurrence of needle in hay (at or after `from`) whose anchor is nearest to
// target. The anchor is the match start, or its end when by_end is set.
// Ties go to the earlier occurrence.
std::optional<size_t> find_nearest(std::string_view hay, std::string_view needle,
                                   size_t from, size_t target, bool by_end) {
  std::optional<size_t> best;
  size_t best_d = 0;
  size_t p = hay.find(needle, from);
  while (p != std::string_view::npos) {
    const size_t anchor = by_end ? p + needle.size() : p;
    const size_t d = abs_diff(anchor, target);
    if (!best || d < best_d) {
      best = p;
      best_d = d;
    } else if (anchor >= target) {
      break;  // only moving further away from here on
    }
    p = hay.find(needle, p + 1);
  }
  return best;
}

// Raw offset just past a preceding context whose normalized match ends at pe.
// A trailing collapsed run is split using the stored context's own
// whitespace byte count, so the span starts inside the run.
size_t start_after_pre(const text::NormalizedText& nc, size_t pe,
                       std::string_view pre_raw, const std::string& npre) {
  if (!npre.empty() && npre.back() == ' ' && pe > 0) {
    const size_t run_begin = nc.to_raw(pe - 1);
    const size_t run_end = nc.to_raw(pe);
    return std::min(run_begin + text::trailing_space_bytes(pre_raw), run_end);
  }
  return nc.to_raw(pe);
}

// Raw offset where a following context matched at normalized ps begins.
size_t end_before_post(const text::NormalizedText& nc, size_t ps,
                       std::string_view post_raw, const std::string& npost) {
  if (!npost.empty() && npost.front() == ' ') {
    const size_t run_begin = nc.to_raw(ps);
    const size_t run_end = nc.to_raw(ps + 1);
    const size_t lead = text::leading_space_bytes(post_raw);
    return (run_end > run_begin + lead) ? run_end - lead : run_begin;
  }
  return nc.to_raw(ps);
}

// Both contexts matched. If the gap between them is not the span length,
// something was inserted next to the span; prefer the end-anchored start
// when the span bytes verify there.
size_t pick_bracketed_start(const Fingerprint& fp, std::string_view text,
                            size_t start, size_t end) {
  if (end - start == fp.length || end < fp.length) return start;
  const size_t cand = end - fp.length;
  if (cand > start && hash_matches(text.substr(cand, fp.length), fp.content_hash)) {
    return cand;
  }
  return start;
}

// ----------------------------- Tier 1 ----------------------------------------
TierResult tier1_exact(const Fingerprint& fp, std::string_view text) {
  TierResult r;
  const size_t n = text.size();
  if (fp.offset >= n) return r;
  r.attempted = true;

  const size_t avail = n - fp.offset;
  if (fp.length <= avail) {
    const std::string_view slice = text.substr(fp.offset, fp.length);
    if ((fp.text && slice == *fp.text) || hash_matches(slice, fp.content_hash)) {
      r.match = AnchorMatch{1, kTier1ExactConfidence, fp.offset};
      return r;
    }
  }

  // Churn inside the span can change its byte length, so compare the
  // normalized text as a prefix of the normalized document at the offset.
  if (fp.text) {
    const std::string want = text::normalize_churn(*fp.text);
    const size_t window = (fp.length <= avail / 4) ? std::min(avail, fp.length * 4 + 64) : avail;
    const std::string have = text::normalize_churn(text.substr(fp.offset, window));
    if (!want.empty() && have.size() >= want.size() &&
        have.compare(0, want.size(), want) == 0) {
      r.match = AnchorMatch{1, kTier1ChurnConfidence, fp.offset};
    }
  }
  return r;
}

// ----------------------------- Tier 2 ----------------------------------------
TierResult tier2_context(const Fingerprint& fp, std::string_view text, const AnchorSettings& s) {
  TierResult r;
  const size_t n = text.size();

  const std::string_view pre_raw = tail_bytes(fp.pre_context, s.context_max_chars);
  const std::string_view post_raw = head_bytes(fp.post_context, s.context_max_chars);
  const std::string npre = text::normalize_churn(pre_raw);
  const std::string npost = text::normalize_churn(post_raw);
  const bool pre_ok = npre.size() >= s.context_min_chars;
  const bool post_ok = npost.size() >= s.context_min_chars;
  if (!pre_ok && !post_ok) return r;
  r.attempted = true;

  const Corridor c = make_corridor(fp, text, s.corridor_chars);
  const text::NormalizedText nc =
      text::normalize_churn_mapped(text.substr(c.lo, c.hi - c.lo), c.lo);

  if (pre_ok) {
    const auto p = find_nearest(nc.text, npre, 0, nc.from_raw(c.prior), true);
    if (p) {
      const size_t pe = *p + npre.size();
      const size_t start = start_after_pre(nc, pe, pre_raw, npre);

      if (post_ok) {
        // A collapsed run at the junction belongs to both contexts.
        const bool shared_space = npre.back() == ' ' && npost.front() == ' ';
        const size_t q = nc.text.find(npost, shared_space ? pe - 1 : pe);
        if (q != std::string::npos) {
          const size_t end = std::max(start, end_before_post(nc, q, post_raw, npost));
          if (!text::has_visible_text(text.substr(start, end - start))) {
            // Contexts intact with nothing between them: the span is gone.
            return r;
          }
          r.match = AnchorMatch{2, kTier2BothConfidence, pick_bracketed_start(fp, text, start, end)};
          return r;
        }
      }

      if (start < n && text::has_visible_text(text.substr(start))) {
        r.match = AnchorMatch{2, kTier2PreOnlyConfidence, start};
      }
      return r;
    }
  }

  if (post_ok) {
    const auto q = find_nearest(nc.text, npost, 0, nc.from_raw(c.prior_end), false);
    if (q) {
      const size_t end = end_before_post(nc, *q, post_raw, npost);
      r.match = AnchorMatch{2, kTier2PostOnlyConfidence, end > fp.length ? end - fp.length : 0};
    }
  }
  return r;
}

// ----------------------------- Tier 3 ----------------------------------------

// Characters of punctuation glued to the front of the first token
// ("“Well," -> 1), counted after the last whitespace of the prefix.
size_t lead_chars(std::string_view span_text, size_t first_token_begin) {
  std::string_view prefix = span_text.substr(0, first_token_begin);
  size_t cut = prefix.size() - text::trailing_space_bytes(prefix);
  while (cut > 0 && text::space_seq_len(prefix, text::utf8_floor(prefix, cut - 1)) == 0) {
    cut = text::utf8_floor(prefix, cut - 1);
  }
  size_t chars = 0;
  for (size_t i = cut; i < prefix.size(); ++i) {
    if (!text::is_utf8_continuation(static_cast<unsigned char>(prefix[i]))) ++chars;
  }
  return chars;
}

// Step back over up to `chars` non-whitespace characters before pos.
size_t back_over_lead(std::string_view text, size_t pos, size_t chars) {
  while (chars > 0 && pos > 0) {
    const size_t prev = text::utf8_floor(text, pos - 1);
    if (text::space_seq_len(text, prev) > 0) break;
    pos = prev;
    --chars;
  }
  return pos;
}

TierResult tier3_fuzzy(const Fingerprint& fp, std::string_view text, const AnchorSettings& s) {
  TierResult r;
  if (!fp.text) return r;
  const auto stored = text::tokenize(*fp.text);
  if (stored.empty()) return r;
  r.attempted = true;

  const size_t n = text.size();
  const size_t seed = std::min(stored.size(), static_cast<size_t>(s.fuzzy_seed_tokens));
  const Corridor c = make_corridor(fp, text, s.corridor_chars);
  const auto toks = text::tokenize(text.substr(c.lo, c.hi - c.lo), c.lo);
  if (toks.size() < seed) return r;

  std::optional<size_t> best;
  size_t best_d = 0;
  for (size_t j = 0; j + seed <= toks.size(); ++j) {
    bool same = true;
    for (size_t k = 0; k < seed && same; ++k) same = (toks[j + k].text == stored[k].text);
    if (!same) continue;
    const size_t d = abs_diff(toks[j].begin, c.prior);
    if (!best || d < best_d) {
      best = j;
      best_d = d;
    }
  }
  if (!best) return r;

  const size_t start = back_over_lead(text, toks[*best].begin, lead_chars(*fp.text, stored.front().begin));
  const double want = std::ceil(static_cast<double>(fp.length) * s.fuzzy_slice_factor);
  const size_t avail = n - start;
  const size_t slice_len = (want < static_cast<double>(avail)) ? static_cast<size_t>(want) : avail;

  std::unordered_set<std::string> stored_set;
  for (const auto& t : stored) stored_set.insert(t.text);
  std::unordered_set<std::string> cand_set;
  for (auto& t : text::tokenize(text.substr(start, slice_len))) cand_set.insert(std::move(t.text));

  size_t common = 0;
  for (const auto& t : stored_set) {
    if (cand_set.count(t) != 0) ++common;
  }
  const double ratio = static_cast<double>(common) / static_cast<double>(stored_set.size());
  if (ratio < s.fuzzy_min_overlap) return r;

  const double span = std::max(1e-9, 1.0 - s.fuzzy_min_overlap);
  double conf = kTier3MinConfidence +
                (ratio - s.fuzzy_min_overlap) / span * (kTier3MaxConfidence - kTier3MinConfidence);
  conf = std::clamp(conf, kTier3MinConfidence, kTier3MaxConfidence);
  r.match = AnchorMatch{3, conf, start};
  return r;
}

// ----------------------------- Tier 4 ----------------------------------------
struct ShinglePhrase {
  std::vector<std::string> toks;
  size_t token_index = 0;
  std::vector<size_t> full_hits;  // document token indices, ascending
};

TierResult tier4_shingles(const Fingerprint& fp, std::string_view text, const AnchorSettings& s) {
  TierResult r;
  std::vector<RareShingle> shingles = fp.rare_shingles;
  if (shingles.empty() && fp.text) shingles = select_rare_shingles(*fp.text, s.shingles);
  if (shingles.empty()) return r;
  r.attempted = true;

  const auto doc = text::tokenize(text);

  // Punctuation opening the span precedes its first token in the document too.
  size_t lead = 0;
  if (fp.text) {
    const auto stored = text::tokenize(*fp.text);
    if (!stored.empty()) lead = lead_chars(*fp.text, stored.front().begin);
  }

  std::vector<ShinglePhrase> phrases;
  phrases.reserve(shingles.size());
  for (const auto& sh : shingles) {
    ShinglePhrase p;
    p.toks = text::split_phrase(sh.phrase);
    p.token_index = sh.token_index;
    if (p.toks.empty() || p.toks.size() > doc.size()) {
      phrases.push_back(std::move(p));
      continue;
    }
    for (size_t j = 0; j + p.toks.size() <= doc.size(); ++j) {
      if (doc[j].text != p.toks[0]) continue;
      bool full = true;
      for (size_t k = 1; k < p.toks.size() && full; ++k) full = (doc[j + k].text == p.toks[k]);
      if (full) p.full_hits.push_back(j);
    }
    phrases.push_back(std::move(p));
  }

  // Does phrase q match completely inside [lo, hi)?
  auto inside = [&](const ShinglePhrase& q, size_t lo, size_t hi) {
    auto it = std::lower_bound(q.full_hits.begin(), q.full_hits.end(), lo,
                               [&](size_t j, size_t v) { return doc[j].begin < v; });
    if (it == q.full_hits.end()) return false;
    return doc[*it + q.toks.size() - 1].end <= hi;
  };

  size_t best_hits = 0;
  size_t best_pos = 0;
  for (const auto& p : phrases) {
    if (p.toks.empty()) continue;
    for (size_t j = 0; j < doc.size(); ++j) {
      if (doc[j].text != p.toks[0]) continue;
      const size_t j0 = (j >= p.token_index) ? j - p.token_index : 0;
      const size_t est = back_over_lead(text, doc[j0].begin, lead);
      const size_t hi = (fp.length <= text.size() - est) ? est + fp.length : text.size();

      size_t hits = 0;
      for (const auto& q : phrases) {
        if (!q.toks.empty() && inside(q, est, hi)) ++hits;
      }
      if (hits > best_hits || (hits == best_hits && hits > 0 && est < best_pos)) {
        best_hits = hits;
        best_pos = est;
      }
    }
  }
  if (best_hits == 0) return r;

  const double ratio = static_cast<double>(best_hits) / static_cast<double>(phrases.size());
  if (ratio < s.shingle_min_hit_ratio) return r;

  r.match = AnchorMatch{4, kTier4BaseConfidence + std::min(0.4, ratio) * 0.4, best_pos};
  return r;
}

TierResult run_tier(int tier, const Fingerprint& fp, std::string_view text, const AnchorSettings& s) {
  switch (tier) {
    case 1: return tier1_exact(fp, text);
    case 2: return tier2_context(fp, text, s);
    case 3: return tier3_fuzzy(fp, text, s);
    case 4: return tier4_shingles(fp, text, s);
    default: return TierResult{};
  }
}

} // namespace

ResolveTrace resolve_trace(const Fingerprint& fp,
                           std::string_view current_text,
                           const AnchorSettings& settings) {
  fp.validate_or_throw(settings.shingles.tokens_per_shingle);

  ResolveTrace trace;
  if (current_text.empty()) return trace;

  for (int tier = 1; tier <= 4; ++tier) {
    TierResult tr = run_tier(tier, fp, current_text, settings);
    if (tr.attempted) trace.last_tier = tier;
    if (tr.match) {
      trace.last_confidence = tr.match->confidence;
      trace.match = tr.match;
      return trace;
    }
  }
  return trace;
}

std::optional<AnchorMatch> resolve(const Fingerprint& fp,
                                   std::string_view current_text,
                                   const AnchorSettings& settings) {
  return resolve_trace(fp, current_text, settings).match;
}

std::optional<AnchorMatch> resolve_tier(int tier,
                                        const Fingerprint& fp,
                                        std::string_view current_text,
                                        const AnchorSettings& settings) {
  if (tier < 1 || tier > 4) {
    FOLIO_THROW(ErrorCode::kUnknownTier, "resolve_tier: tier " + std::to_string(tier) + " not in 1..4");
  }
  fp.validate_or_throw(settings.shingles.tokens_per_shingle);
  if (current_text.empty()) return std::nullopt;
  return run_tier(tier, fp, current_text, settings).match;
}

}  // namespace folio
