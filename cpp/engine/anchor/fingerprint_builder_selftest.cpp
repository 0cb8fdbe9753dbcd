/*
  Fragment 3.6 - Fingerprint Builder Selftest

  Objective
  ---------
  Framework-free selftest for fingerprint capture:
    1) Content hashes are SHA-256 (or FNV-1a in fast mode) of the exact span
       bytes; known digests are pinned.
    2) Contexts are the 64 bytes just outside the span, bounded at document
       edges and never splitting a UTF-8 sequence.
    3) Rare shingles prefer rare tokens and respect the start gap.
    4) Invalid spans raise folio::Error with the right ErrorCode.

  Expected use
  ------------
      ./fingerprint_builder_selftest
  Non-zero return code indicates failure.
*/

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/anchor/fingerprint_builder.hpp"
#include "engine/anchor/rare_shingles.hpp"
#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"

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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

// "p0 p1 p2 ..." with a trailing space.
std::string words(const std::string& prefix, int from, int count) {
  std::string out;
  for (int i = from; i < from + count; ++i) {
    out += prefix + std::to_string(i) + " ";
  }
  return out;
}

SpanInput span_at(const std::string& doc, const std::string& id, size_t start, size_t len) {
  SpanInput s;
  s.id = id;
  s.start = start;
  s.end = start + len;
  s.text = doc.substr(start, len);
  return s;
}

template <class Fn>
void expect_error_code(Fn&& fn, ErrorCode want, std::string_view msg) {
  try {
    fn();
    fail(msg);
    std::cerr << "  no exception\n";
  } catch (const Error& e) {
    if (e.code() == want) pass(msg);
    else {
      fail(msg);
      std::cerr << "  got: " << e.what() << "\n";
    }
  }
}

void test_known_digests() {
  expect_eq_str(sha256_hex("abc"),
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                "SHA-256 of 'abc'");
  expect_eq_str(fnv1a64_hex(""), "cbf29ce484222325", "FNV-1a 64 of empty input");
  expect_eq_str(fnv1a64_hex("a"), "af63dc4c8601ec8c", "FNV-1a 64 of 'a'");
  expect_true(is_content_hash(sha256_hex("x")) && is_content_hash(fnv1a64_hex("x")),
              "both digest lengths are content hashes");
  expect_true(!is_content_hash("ABCDEF0123456789"), "uppercase hex rejected");
  expect_true(hash_matches("abc", sha256_hex("abc")) && !hash_matches("abd", sha256_hex("abc")),
              "hash_matches picks the algorithm from the digest length");
}

void test_contexts_and_hash() {
  const std::string before = words("a", 0, 40);
  const std::string span = "The storm broke over the harbour at dawn.";
  const std::string doc = before + span + " " + words("b", 0, 40);
  const size_t start = before.size();

  BuilderSettings bs;
  bs.retain_text = true;
  const Fingerprint fp = build_fingerprint(doc, span_at(doc, "s1", start, span.size()), bs);

  expect_eq_str(fp.content_hash, sha256_hex(span), "content hash is SHA-256 of the exact span");
  expect_true(fp.offset == start && fp.length == span.size(), "offset and length recorded");
  expect_eq_str(fp.pre_context, doc.substr(start - 64, 64), "pre context is the 64 bytes before");
  expect_eq_str(fp.post_context, doc.substr(start + span.size(), 64), "post context is the 64 bytes after");
  expect_true(fp.text && *fp.text == span, "text retained on request");
  expect_true(fp.rare_shingles.size() == 1 && fp.rare_shingles[0].token_index == 0,
              "an 8-token span yields a single shingle");

  const Fingerprint head = build_fingerprint(doc, span_at(doc, "h", 0, 10));
  expect_true(head.pre_context.empty(), "pre context empty at document start");
  expect_true(!head.text, "text not retained by default");

  const Fingerprint tail = build_fingerprint(doc, span_at(doc, "t", doc.size() - 10, 10));
  expect_true(tail.post_context.empty(), "post context empty at document end");

  const Fingerprint fast = build_fingerprint(doc, span_at(doc, "f", start, span.size()),
                                             BuilderSettings::fast());
  expect_eq_str(fast.content_hash, fnv1a64_hex(span), "fast mode uses FNV-1a");
}

void test_context_utf8_boundary() {
  // Left quote (3 bytes) then 62 x's: 64 bytes before the span would start
  // inside the quote, so the context begins after it.
  const std::string doc = "\xE2\x80\x9C" + std::string(62, 'x') + "hello world";
  const size_t start = doc.find("hello");
  const Fingerprint fp = build_fingerprint(doc, span_at(doc, "u", start, 5));
  expect_eq_str(fp.pre_context, std::string(62, 'x'), "pre context never splits a UTF-8 sequence");
}

void test_rare_shingles() {
  const std::string span = words("u", 0, 40);
  const auto sh = select_rare_shingles(span, ShingleSettings{});
  expect_true(sh.size() == 3, "three shingles from 40 distinct tokens");
  if (sh.size() == 3) {
    expect_true(sh[0].token_index == 0 && sh[1].token_index == 8 && sh[2].token_index == 16,
                "equal scores keep ascending starts 8 tokens apart");
    expect_eq_str(sh[1].phrase, "u8 u9 u10 u11 u12 u13 u14 u15", "phrase is 8 tokens");
  }

  const std::string skewed = "the the the the the the the the " + words("v", 0, 8);
  const auto sk = select_rare_shingles(skewed, ShingleSettings{});
  expect_true(sk.size() == 2, "only two starts are far enough apart");
  if (sk.size() == 2) {
    expect_true(sk[0].token_index == 8, "rarest phrase chosen first");
    expect_eq_str(sk[0].phrase, "v0 v1 v2 v3 v4 v5 v6 v7", "rarest phrase text");
    expect_true(sk[1].token_index == 0, "second pick honours the start gap");
  }

  expect_true(select_rare_shingles("too few tokens here", ShingleSettings{}).empty(),
              "no shingles below 8 tokens");

  const std::string doc = words("a", 0, 20) + span + words("b", 0, 20);
  const Fingerprint fp = build_fingerprint(doc, span_at(doc, "s", words("a", 0, 20).size(), span.size()));
  expect_true(fp.rare_shingles.size() == 3, "builder caches shingles by default");
  expect_true(build_fingerprint(doc, span_at(doc, "s", 0, span.size()),
                                BuilderSettings::fast()).rare_shingles.empty(),
              "fast mode skips shingles");
}

void test_invalid_spans() {
  const std::string doc = "one two three four five";

  expect_error_code([&] {
    SpanInput s = span_at(doc, "x", 4, 3);
    s.id.clear();
    (void)build_fingerprint(doc, s);
  }, ErrorCode::kInvalidArgument, "empty id rejected");

  expect_error_code([&] {
    SpanInput s;
    s.id = "x";
    s.start = 8;
    s.end = 4;
    (void)build_fingerprint(doc, s);
  }, ErrorCode::kSpanOutOfRange, "start > end rejected");

  expect_error_code([&] {
    SpanInput s;
    s.id = "x";
    s.start = 4;
    s.end = 4;
    (void)build_fingerprint(doc, s);
  }, ErrorCode::kSpanOutOfRange, "empty span rejected");

  expect_error_code([&] {
    SpanInput s;
    s.id = "x";
    s.start = 4;
    s.end = doc.size() + 1;
    (void)build_fingerprint(doc, s);
  }, ErrorCode::kSpanOutOfRange, "end past the document rejected");

  expect_error_code([&] {
    SpanInput s = span_at(doc, "x", 4, 3);
    s.text = "TWO";
    (void)build_fingerprint(doc, s);
  }, ErrorCode::kTextMismatch, "text mismatch rejected");

  expect_error_code([&] {
    (void)build_collection(doc, {span_at(doc, "d", 0, 3), span_at(doc, "d", 4, 3)});
  }, ErrorCode::kDuplicateSpan, "duplicate id rejected");
}

void test_collection() {
  const std::string doc = "one two three four five";
  const auto col = build_collection(doc, {span_at(doc, "b", 4, 3), span_at(doc, "a", 0, 3)},
                                    BuilderSettings{}, "2024-05-01T12:00:00Z");
  expect_true(col.spans.size() == 2 && col.find("a") && col.find("b"), "one fingerprint per id");
  expect_eq_str(col.generated_at, "2024-05-01T12:00:00Z", "explicit timestamp kept");
  expect_eq_str(col.document_checksum, document_checksum(doc), "checksum recorded");
  expect_true(!build_collection(doc, {}).generated_at.empty(), "timestamp filled when absent");

  expect_eq_str(document_checksum("a  b\n\xE2\x80\x9Cx\xE2\x80\x9D"), document_checksum("a b \"x\""),
                "document checksum ignores whitespace and quote churn");
  expect_true(document_checksum("a b") != document_checksum("a c"), "document checksum tracks content");

  bool threw = false;
  try {
    BuilderSettings bad;
    bad.context_chars = 0;
    (void)build_collection(doc, {}, bad);
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "invalid builder settings rejected");

  Fingerprint fp = col.spans.at("a");
  fp.content_hash = "not-a-hash";
  threw = false;
  try {
    fp.validate_or_throw();
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "fingerprint with a bad digest fails validation");
}

}  // namespace
}  // namespace folio

int main() {
  using namespace folio;

  test_known_digests();
  test_contexts_and_hash();
  test_context_utf8_boundary();
  test_rare_shingles();
  test_invalid_spans();
  test_collection();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
