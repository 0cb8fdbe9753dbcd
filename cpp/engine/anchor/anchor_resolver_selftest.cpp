/*
  Fragment 3.7 - Anchor Resolver Selftest

  Objective
  ---------
  Framework-free selftest pinning which tier relocates a span for each kind
  of edit, and with what confidence:
    1) Untouched document ........................ tier 1, 1.0
    2) Quote / line-ending churn inside the span .. tier 1, 0.98
    3) Unrelated text inserted far before ......... tier 2, exact new offset
    4) Following (or preceding) context replaced .. tier 2, 0.90 (0.85)
    5) Contexts lost, ~5% of words changed ........ tier 3, [0.6, 0.8]
    6) Span moved across a 50,000-word document ... tier 4, [0.6, 0.76]
    7) Span deleted, contexts intact .............. no match, no throw

  Filler text uses unique generated words ("a17", "b203", ...) so contexts
  and shingles occur exactly once.

  Expected use
  ------------
      ./anchor_resolver_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/anchor/anchor_resolver.hpp"
#include "engine/anchor/fingerprint_builder.hpp"
#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"

namespace folio {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

bool near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

// Report a match as "tier/confidence/position" on failure.
void expect_match(const std::optional<AnchorMatch>& m, int tier, double conf, size_t pos,
                  std::string_view msg) {
  if (m && m->tier == tier && near(m->confidence, conf) && m->position == pos) {
    pass(msg);
    return;
  }
  fail(msg);
  if (m) {
    std::cerr << "  got tier " << m->tier << " conf " << m->confidence << " pos " << m->position << "\n";
  } else {
    std::cerr << "  got no match\n";
  }
  std::cerr << "  want tier " << tier << " conf " << conf << " pos " << pos << "\n";
}

// "p0 p1 p2 ..." with a trailing space.
std::string words(const std::string& prefix, int from, int count) {
  std::string out;
  for (int i = from; i < from + count; ++i) {
    out += prefix + std::to_string(i) + " ";
  }
  return out;
}

// Same words without the trailing space.
std::string phrase(const std::string& prefix, int count) {
  std::string s = words(prefix, 0, count);
  s.pop_back();
  return s;
}

Fingerprint capture(const std::string& doc, size_t start, size_t len, bool retain_text) {
  SpanInput s;
  s.id = "s1";
  s.start = start;
  s.end = start + len;
  s.text = doc.substr(start, len);
  BuilderSettings bs;
  bs.retain_text = retain_text;
  return build_fingerprint(doc, s, bs);
}

// Shared layout: A + span + " " + B.
struct Layout {
  std::string a = words("a", 0, 200);
  std::string span = phrase("s", 40);
  std::string b = words("b", 0, 200);
  std::string doc = a + span + " " + b;
  size_t start = a.size();
};

void test_identity_and_idempotence() {
  const Layout L;
  const Fingerprint kept = capture(L.doc, L.start, L.span.size(), true);
  const Fingerprint hashed = capture(L.doc, L.start, L.span.size(), false);

  expect_match(resolve(kept, L.doc), 1, 1.0, L.start, "unchanged document, text retained");
  expect_match(resolve(hashed, L.doc), 1, 1.0, L.start, "unchanged document, hash only");

  const ResolveTrace t1 = resolve_trace(hashed, L.doc);
  const ResolveTrace t2 = resolve_trace(hashed, L.doc);
  expect_true(t1 == t2, "resolve is idempotent");
  expect_true(t1.last_tier == 1 && near(t1.last_confidence, 1.0), "trace records the winning tier");
}

void test_churn_tolerance() {
  const std::string a = words("a", 0, 200);
  const std::string curly = "\xE2\x80\x9CHold on,\xE2\x80\x9D she said.\nThe tide was turning fast.";
  const std::string straight = "\"Hold on,\" she said.\r\nThe tide was turning fast.";
  const std::string b = words("b", 0, 200);

  const std::string before = a + curly + " " + b;
  const Fingerprint fp = capture(before, a.size(), curly.size(), true);

  expect_match(resolve(fp, a + straight + " " + b), 1, kTier1ChurnConfidence, a.size(),
               "quote and line-ending churn inside the span");
  expect_match(resolve(fp, a + curly + "\r\n\r\n  " + b), 1, kTier1ExactConfidence, a.size(),
               "churn only after the span keeps the exact match");
}

void test_local_drift() {
  const Layout L;
  const Fingerprint fp = capture(L.doc, L.start, L.span.size(), false);
  const std::string inserted = std::string(499, 'z') + " ";

  const std::string drifted = inserted + L.doc;
  const auto m = resolve(fp, drifted);
  expect_match(m, 2, kTier2BothConfidence, L.start + 500, "500 chars inserted far before the span");
  expect_true(m && m->tier <= 2 && m->confidence >= 0.85, "drift resolves by tier 2 or better");

  expect_true(!resolve_tier(1, fp, drifted), "tier 1 alone misses the drifted span");
  expect_match(resolve_tier(2, fp, drifted), 2, kTier2BothConfidence, L.start + 500,
               "tier 2 alone finds it");
}

void test_single_context() {
  const Layout L;
  const Fingerprint fp = capture(L.doc, L.start, L.span.size(), false);
  const std::string inserted = std::string(99, 'z') + " ";

  const std::string new_tail = inserted + L.a + L.span + " " + words("c", 0, 200);
  expect_match(resolve(fp, new_tail), 2, kTier2PreOnlyConfidence, L.start + 100,
               "following context replaced: preceding context only");

  const std::string d = words("d", 0, 150);
  const std::string new_head = d + L.span + " " + L.b;
  expect_match(resolve(fp, new_head), 2, kTier2PostOnlyConfidence, d.size(),
               "preceding context replaced: following context only");
}

void test_fuzzy_tolerance() {
  const Layout L;
  const Fingerprint fp = capture(L.doc, L.start, L.span.size(), true);

  // 2 of 40 words changed past the 5-token seed; both contexts replaced.
  std::string edited = L.span;
  edited.replace(edited.find("s20 "), 3, "x20");
  edited.replace(edited.find("s30 "), 3, "x30");
  const std::string c = words("c", 0, 200);
  const std::string doc = c + edited + " " + words("e", 0, 200);

  const auto m = resolve(fp, doc);
  const double want = kTier3MinConfidence + (38.0 / 40.0 - 0.55) / 0.45 * 0.2;
  expect_match(m, 3, want, c.size(), "contexts lost and 5% of words changed");
  expect_true(m && m->confidence >= 0.6 && m->confidence <= 0.8, "tier 3 confidence band");

  const Fingerprint hashed = capture(L.doc, L.start, L.span.size(), false);
  const auto h = resolve(hashed, doc);
  expect_true(!h || h->tier != 3, "tier 3 needs the retained span text");
}

void test_global_relocation() {
  const std::string a = words("a", 0, 100);
  const std::string span = phrase("q", 40);
  const std::string rest = words("r", 0, 49800);
  const std::string before = a + span + " " + rest;
  const Fingerprint fp = capture(before, a.size(), span.size(), true);
  expect_true(fp.rare_shingles.size() == 3, "relocated span carries three shingles");

  const std::string after = a + rest + span;
  const auto m = resolve(fp, after);
  expect_match(m, 4, kTier4BaseConfidence + 0.4 * 0.4, a.size() + rest.size(),
               "span moved to the far end of a 50,000-word document");
  expect_true(m && m->confidence >= 0.6 && m->confidence <= 0.76 + 1e-9, "tier 4 confidence band");

  Fingerprint uncached = fp;
  uncached.rare_shingles.clear();
  expect_match(resolve(uncached, after), 4, kTier4BaseConfidence + 0.4 * 0.4, a.size() + rest.size(),
               "shingles recomputed from retained text when not cached");
}

void test_relocated_dialogue() {
  const std::string a = words("a", 0, 100);
  const std::string span = "\xE2\x80\x9C" + phrase("q", 40);
  const std::string rest = words("r", 0, 5000);
  const std::string before = a + span + " " + rest;
  const Fingerprint fp = capture(before, a.size(), span.size(), true);

  const std::string after = a + rest + span;
  expect_match(resolve(fp, after), 4, kTier4BaseConfidence + 0.4 * 0.4, a.size() + rest.size(),
               "tier 4 start includes the opening quote");

  Fingerprint hashed = capture(before, a.size(), span.size(), false);
  expect_match(resolve(hashed, after), 4, kTier4BaseConfidence + 0.4 * 0.4,
               a.size() + rest.size() + 3, "without retained text tier 4 starts at the first word");
}

void test_total_removal() {
  const Layout L;
  const Fingerprint fp = capture(L.doc, L.start, L.span.size(), true);

  const ResolveTrace t = resolve_trace(fp, L.a + L.b);
  expect_true(!t.match, "deleted span is not resolved");
  expect_true(t.last_tier == 4 && near(t.last_confidence, 0.0), "every tier was attempted");
}

void test_degenerate_inputs() {
  const Layout L;
  const Fingerprint fp = capture(L.doc, L.start, L.span.size(), true);

  bool threw = false;
  std::optional<AnchorMatch> m;
  try {
    m = resolve(fp, "");
  } catch (...) {
    threw = true;
  }
  expect_true(!threw && !m, "empty document: no match, no throw");

  expect_match(resolve(fp, L.span), 3, kTier3MaxConfidence, 0,
               "offset past the end skips tier 1 and falls through");

  Fingerprint bad = fp;
  bad.length = 0;
  threw = false;
  try {
    (void)resolve(bad, L.doc);
  } catch (const ValidationError& e) {
    threw = e.subject() == "Fingerprint '" + bad.id + "'";
  }
  expect_true(threw, "malformed fingerprint raises ValidationError naming the span");

  ErrorCode code = ErrorCode::kInvalidArgument;
  try {
    (void)resolve_tier(5, fp, L.doc);
  } catch (const Error& e) {
    code = e.code();
  }
  expect_true(code == ErrorCode::kUnknownTier, "tier 5 is rejected as unknown");
}

}  // namespace
}  // namespace folio

int main() {
  using namespace folio;

  test_identity_and_idempotence();
  test_churn_tolerance();
  test_local_drift();
  test_single_context();
  test_fuzzy_tolerance();
  test_global_relocation();
  test_relocated_dialogue();
  test_total_removal();
  test_degenerate_inputs();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
