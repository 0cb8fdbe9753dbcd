/*
  Fragment 2.3 - Text Primitives Selftest

  Objective
  ---------
  Framework-free selftest for the comparison-time text primitives:
    1) Churn normalization collapses whitespace runs (CRLF, tabs, NBSP) and
       straightens curly quotes, without trimming.
    2) The normalized -> raw table maps every normalized character back to
       the first raw byte it came from, plus a sentinel.
    3) Tokens are lowercase alphanumeric runs with inner apostrophes kept,
       and carry raw byte offsets.
    4) UTF-8 boundary helpers never split a multi-byte sequence.

  Expected use
  ------------
      ./text_selftest
  Non-zero return code indicates failure.
*/

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/text/normalize.hpp"
#include "engine/text/tokenize.hpp"

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

void test_normalize_whitespace() {
  expect_eq_str(text::normalize_churn("a  \r\n b"), "a b", "whitespace run collapses to one space");
  expect_eq_str(text::normalize_churn("a\tb\nc"), "a b c", "tab and newline become spaces");
  expect_eq_str(text::normalize_churn("a\xC2\xA0\xC2\xA0z"), "a z", "NBSP counts as whitespace");
  expect_eq_str(text::normalize_churn("  x  "), " x ", "no trimming at the edges");
  expect_eq_str(text::normalize_churn(""), "", "empty input");
}

void test_normalize_quotes() {
  expect_eq_str(text::normalize_churn("\xE2\x80\x9CHi,\xE2\x80\x9D she said."),
                "\"Hi,\" she said.", "curly double quotes straightened");
  expect_eq_str(text::normalize_churn("it\xE2\x80\x99s \xE2\x80\x98ok\xE2\x80\x99"),
                "it's 'ok'", "curly single quotes straightened");
  expect_eq_str(text::normalize_churn("\xE2\x80\x94"), "\xE2\x80\x94", "em dash untouched");
}

void test_mapping_table() {
  const auto nt = text::normalize_churn_mapped("a  \r\n b");
  expect_eq_str(nt.text, "a b", "mapped text equals normalize_churn");
  const std::vector<size_t> want = {0, 1, 6, 7};
  expect_true(nt.raw_index == want, "run maps to its first byte, sentinel is raw size");
  expect_true(nt.to_raw(2) == 6, "to_raw after a run");
  expect_true(nt.to_raw(99) == 7, "to_raw clamps to the sentinel");
  expect_true(nt.from_raw(3) == 2, "from_raw inside a run rounds up to the next char");
  expect_true(nt.from_raw(6) == 2, "from_raw exact");

  const auto q = text::normalize_churn_mapped("\xE2\x80\x9CHi\xE2\x80\x9D", 100);
  const std::vector<size_t> qwant = {100, 103, 104, 105, 108};
  expect_true(q.raw_index == qwant, "quote maps one-to-one with raw base applied");
}

void test_tokenize() {
  const auto toks = text::tokenize("Don\xE2\x80\x99t STOP, 2x! 'quoted'", 10);
  expect_true(toks.size() == 4, "four tokens");
  if (toks.size() == 4) {
    expect_eq_str(toks[0].text, "don't", "curly apostrophe kept inside a word");
    expect_true(toks[0].begin == 10 && toks[0].end == 17, "token offsets are raw bytes + base");
    expect_eq_str(toks[1].text, "stop", "lowercased");
    expect_eq_str(toks[2].text, "2x", "digits are word bytes");
    expect_eq_str(toks[3].text, "quoted", "edge apostrophes dropped");
  }

  const auto parts = text::split_phrase("  alpha beta  gamma ");
  expect_true(parts.size() == 3 && parts[2] == "gamma", "split_phrase ignores extra spaces");

  const auto t2 = text::tokenize("one two three four");
  expect_eq_str(text::join_tokens(t2, 1, 2), "two three", "join_tokens");
  expect_eq_str(text::join_tokens(t2, 3, 5), "four", "join_tokens clamps at the end");
}

void test_utf8_helpers() {
  const std::string s = "a\xE2\x80\x9C" "b";  // a, left quote (3 bytes), b
  expect_true(text::utf8_ceil(s, 2) == 4, "utf8_ceil moves past continuation bytes");
  expect_true(text::utf8_floor(s, 3) == 1, "utf8_floor moves back to the lead byte");
  expect_true(text::utf8_floor(s, 99) == s.size(), "utf8_floor clamps to size");
  expect_true(text::leading_space_bytes(" \xC2\xA0x") == 3, "leading whitespace bytes");
  expect_true(text::trailing_space_bytes("x \r\n") == 3, "trailing whitespace bytes");
  expect_true(!text::has_visible_text(" \n\t "), "whitespace only is not visible");
  expect_true(text::has_visible_text("  .  "), "punctuation is visible");
}

}  // namespace
}  // namespace folio

int main() {
  using namespace folio;

  test_normalize_whitespace();
  test_normalize_quotes();
  test_mapping_table();
  test_tokenize();
  test_utf8_helpers();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
