/*
  Fragment 5.4 - Fingerprint Store Selftest

  Objective
  ---------
  Framework-free selftest for the persisted fingerprint file:
    1) Writer output is deterministic and parses back to an equal collection
       (escapes, UTF-8, optional fields).
    2) Legacy field names are accepted by the parser.
    3) Malformed input reports line/column; bad integers are rejected.
    4) load_fingerprints treats missing or corrupt files as "no snapshot";
       save_fingerprints creates the parent directory. A rejected file is
       reported through the log with its position. A record that parses
       but cannot be resolved against stays in the snapshot and shows up
       in the next diff as an anchor exception.
    5) Log level names parse; records under the threshold are dropped;
       a sink may log or uninstall itself from inside its callback.
    6) The EngineSettings overloads use store_path.

  Expected use
  ------------
      ./fingerprint_store_selftest
  Non-zero return code indicates failure. Uses a scratch directory under
  the system temp path.
*/

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/anchor/fingerprint_builder.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/store/fingerprint_json.hpp"
#include "engine/store/fingerprint_json_parse.hpp"
#include "engine/delta/delta_engine.hpp"
#include "engine/store/fingerprint_store.hpp"

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

FingerprintCollection sample() {
  FingerprintCollection c;
  c.document_checksum = sha256_hex("document");
  c.generated_at = "2024-05-01T12:00:00Z";

  Fingerprint a;
  a.id = "ch1-sc1";
  a.parent_id = "ch1";
  a.content_hash = sha256_hex("The cat sat.");
  a.offset = 120;
  a.length = 12;
  a.pre_context = "\xE2\x80\x9CQuoted\xE2\x80\x9D line\r\n\tand \"escapes\" \\ \x01";
  a.post_context = " after";
  a.rare_shingles = {{"one two three four five six seven eight", 0},
                     {"nine ten eleven twelve thirteen fourteen fifteen sixteen", 8}};
  a.text = std::string("The cat sat.");
  c.spans.emplace(a.id, a);

  Fingerprint b;
  b.id = "ch1-sc2";
  b.content_hash = fnv1a64_hex("x");
  b.offset = 0;
  b.length = 1;
  c.spans.emplace(b.id, b);
  return c;
}

void test_round_trip() {
  const FingerprintCollection c = sample();
  const std::string pretty = fingerprints_to_json(c, true);
  const std::string compact = fingerprints_to_json(c, false);

  expect_eq_str(pretty, fingerprints_to_json(c, true), "writer is deterministic");
  expect_true(compact.find('\n') == std::string::npos, "compact output is one line");
  expect_true(pretty.find("\"documentChecksum\"") < pretty.find("\"generatedAt\"") &&
              pretty.find("\"generatedAt\"") < pretty.find("\"spans\""),
              "top-level key order is stable");
  expect_true(pretty.find("\\u0001") != std::string::npos, "control bytes escaped as \\u00XX");
  expect_true(pretty.find("\"parentId\"") != std::string::npos &&
              pretty.find("\"len\": 12") != std::string::npos, "span fields use their short names");

  FingerprintCollection back;
  JsonParseError err;
  expect_true(parse_fingerprints_json(pretty, &back, &err), "pretty output parses");
  expect_true(back == c, "pretty output parses back to an equal collection");

  FingerprintCollection back2;
  expect_true(parse_fingerprints_json(compact, &back2, &err) && back2 == c,
              "compact output parses back to an equal collection");

  std::istringstream is(compact);
  FingerprintCollection back3;
  expect_true(parse_fingerprints_json(is, &back3, &err) && back3 == c, "stream overload");

  FingerprintCollection empty;
  FingerprintCollection empty_back;
  expect_true(parse_fingerprints_json(fingerprints_to_json(empty), &empty_back, &err) &&
              empty_back == empty, "empty collection round-trips");
}

void test_legacy_aliases() {
  const std::string hash = sha256_hex("x");
  const std::string legacy =
      "{\"manuscript_sha\": \"abc\", \"generated_at\": \"2023-01-01T00:00:00Z\","
      " \"ui_state\": {\"ignored\": [1, 2.5, true, null]},"
      " \"scenes\": {\"s1\": {\"id\": \"s1\", \"sha\": \"" + hash + "\", \"offset\": 5,"
      " \"length\": 7, \"preContext\": \"before\", \"postContext\": \"after\","
      " \"rareShingles\": [\"a b c d e f g h\"]}}}";

  FingerprintCollection c;
  JsonParseError err;
  expect_true(parse_fingerprints_json(legacy, &c, &err), "legacy document parses");
  expect_eq_str(c.document_checksum, "abc", "manuscript_sha -> documentChecksum");
  expect_eq_str(c.generated_at, "2023-01-01T00:00:00Z", "generated_at -> generatedAt");
  const Fingerprint* fp = c.find("s1");
  expect_true(fp != nullptr, "scenes -> spans");
  if (fp) {
    expect_true(fp->offset == 5 && fp->length == 7, "length -> len");
    expect_true(fp->pre_context == "before" && fp->post_context == "after",
                "preContext/postContext -> pre/post");
    expect_true(fp->rare_shingles.size() == 1 && fp->rare_shingles[0].token_index == 0 &&
                fp->rare_shingles[0].phrase == "a b c d e f g h",
                "plain-string shingle gets token index 0");
  }

  const std::string both =
      "{\"documentChecksum\": \"new\", \"manuscript_sha\": \"old\", \"spans\": {}}";
  FingerprintCollection d;
  expect_true(parse_fingerprints_json(both, &d, &err) && d.document_checksum == "new",
              "current name wins over its alias");
}

void test_parse_errors() {
  FingerprintCollection c;
  JsonParseError err;

  expect_true(!parse_fingerprints_json("{\n  \"spans\": {,}\n}", &c, &err) && err.line == 2,
              "syntax error reports its line");
  expect_true(!parse_fingerprints_json("{\"spans\": {}} x", &c, &err), "trailing characters rejected");
  expect_true(!parse_fingerprints_json("[]", &c, &err), "root must be an object");
  expect_true(!parse_fingerprints_json("{\"documentChecksum\": \"x\"}", &c, &err), "spans required");

  const std::string hash = sha256_hex("x");
  auto with_offset = [&](const std::string& off) {
    return "{\"spans\": {\"s\": {\"sha\": \"" + hash + "\", \"offset\": " + off + ", \"len\": 3}}}";
  };
  expect_true(parse_fingerprints_json(with_offset("0"), &c, &err) && c.find("s"), "id defaults to the key");
  expect_true(!parse_fingerprints_json(with_offset("-1"), &c, &err), "negative offset rejected");
  expect_true(!parse_fingerprints_json(with_offset("1.5"), &c, &err), "fractional offset rejected");
  expect_true(!parse_fingerprints_json(with_offset("\"7\""), &c, &err), "string offset rejected");
  expect_true(!parse_fingerprints_json(
                  "{\"spans\": {\"s\": {\"id\": \"t\", \"sha\": \"" + hash + "\", \"offset\": 0, \"len\": 3}}}",
                  &c, &err),
              "id must match its key");
}

void test_store_files() {
  namespace fs = std::filesystem;
  const fs::path root = fs::temp_directory_path() / "folio_store_selftest";
  std::error_code ec;
  fs::remove_all(root, ec);

  const std::string path = (root / "nested" / "fingerprints.json").string();
  expect_true(!load_fingerprints(path), "missing file loads as no snapshot");

  const FingerprintCollection c = sample();
  expect_true(save_fingerprints(c, path), "save creates the parent directory");
  expect_true(!fs::exists(path + ".tmp"), "temp file replaced");
  const auto loaded = load_fingerprints(path);
  expect_true(loaded && *loaded == c, "saved collection loads back equal");

  FingerprintCollection smaller;
  smaller.generated_at = "2024-06-01T00:00:00Z";
  expect_true(save_fingerprints(smaller, path), "second save succeeds");
  const auto replaced = load_fingerprints(path);
  expect_true(replaced && replaced->spans.empty(), "save replaces the collection wholesale");

  {
    std::ofstream f(path, std::ios::trunc);
    f << "{ \"spans\": { \"s\": ";
  }
  std::string warning;
  set_log_level(LogLevel::WARN);
  set_log_sink([&warning](const LogRecord& rec) {
    if (rec.component == "store") warning = std::string(rec.message);
  });
  expect_true(!load_fingerprints(path), "truncated file loads as no snapshot");
  set_log_sink(nullptr);
  set_log_level(LogLevel::ERROR);
  expect_true(warning.find("malformed") != std::string::npos &&
                  warning.find("line 1") != std::string::npos,
              "malformed file is reported with its line");

  fs::remove_all(root, ec);
}

SpanInput span_of(const std::string& doc, const std::string& id, const std::string& text) {
  SpanInput s;
  s.id = id;
  s.start = doc.find(text);
  s.end = s.start + text.size();
  s.text = text;
  return s;
}

void test_bad_record_keeps_snapshot() {
  namespace fs = std::filesystem;
  const fs::path root = fs::temp_directory_path() / "folio_store_selftest_records";
  std::error_code ec;
  fs::remove_all(root, ec);
  const std::string path = (root / "fingerprints.json").string();

  const std::string before = "Opening line here.\n\nThe cat sat.\n\nClosing line here.";
  const std::string after =
      "Opening line here.\n\nA new paragraph arrives first.\n\nThe cat sat.\n\nClosing line here.";

  FingerprintCollection prev = build_collection(before, {span_of(before, "s1", "The cat sat.")});
  Fingerprint broken = prev.spans.at("s1");
  broken.id = "broken";
  broken.content_hash = "abc";
  prev.spans.emplace(broken.id, broken);
  expect_true(save_fingerprints(prev, path), "snapshot with a bad record is written");

  const auto loaded = load_fingerprints(path);
  expect_true(loaded && loaded->spans.size() == 2, "a bad record does not discard the snapshot");
  if (!loaded) return;

  const FingerprintCollection cur = build_collection(
      after, {span_of(after, "s1", "The cat sat."), span_of(after, "broken", "Closing line")});
  const DeltaReport r = diff_collections(&*loaded, cur, std::string_view(after));

  expect_true(r.added.empty() && r.removed.empty(), "both ids carried over");
  expect_true(r.moved.size() == 1 && r.moved[0].id == "s1" &&
                  r.moved[0].from == before.find("The cat sat.") &&
                  r.moved[0].to == after.find("The cat sat."),
              "intact record still resolves to its new position");
  expect_true(r.unresolved.size() == 1 && r.unresolved[0].id == "broken" &&
                  r.unresolved[0].reason == kReasonException,
              "bad record surfaces as an anchor exception");

  fs::remove_all(root, ec);
}

void test_log_levels() {
  LogLevel lvl = LogLevel::INFO;
  expect_true(parse_log_level("DEBUG", lvl) && lvl == LogLevel::DEBUG, "level names ignore case");
  expect_true(parse_log_level("warning", lvl) && lvl == LogLevel::WARN, "warning is an alias of warn");
  expect_true(!parse_log_level("verbose", lvl) && lvl == LogLevel::WARN,
              "unknown level leaves the output untouched");

  int seen = 0;
  set_log_sink([&seen](const LogRecord&) { ++seen; });
  log(LogLevel::INFO, "store", "below threshold");
  log(LogLevel::ERROR, "store", "at threshold");
  set_log_sink(nullptr);
  expect_true(seen == 1, "records below the threshold never reach the sink");
}

void test_reentrant_sink() {
  std::vector<std::string> components;
  set_log_sink([&components](const LogRecord& rec) {
    components.emplace_back(rec.component);
    if (rec.component == "store") log(LogLevel::ERROR, "delta", "nested");
  });
  log(LogLevel::ERROR, "store", "outer");
  set_log_sink(nullptr);
  expect_true(components.size() == 2 && components[0] == "store" && components[1] == "delta",
              "a sink may log from inside its callback");

  int calls = 0;
  set_log_sink([&calls](const LogRecord&) {
    ++calls;
    set_log_sink(nullptr);
  });
  log(LogLevel::ERROR, "store", "once");
  expect_true(calls == 1, "a sink may uninstall itself");
}

void test_default_location() {
  const EngineSettings s = EngineSettings::defaults();
  bool ok = true;
  try {
    s.validate_or_throw();
  } catch (const ValidationError&) {
    ok = false;
  }
  expect_true(ok, "default engine settings validate");
  expect_eq_str(s.store_path, ".folio/fingerprints.json", "default store location");

  namespace fs = std::filesystem;
  const fs::path root = fs::temp_directory_path() / "folio_store_selftest_settings";
  std::error_code ec;
  fs::remove_all(root, ec);

  EngineSettings custom = s;
  custom.store_path = (root / "cache" / "fp.json").string();
  const FingerprintCollection c = sample();
  expect_true(save_fingerprints(c, custom), "save goes to store_path");
  expect_true(fs::exists(custom.store_path), "file created at store_path");
  const auto loaded = load_fingerprints(custom);
  expect_true(loaded && *loaded == c, "load reads store_path");

  fs::remove_all(root, ec);
}

}  // namespace
}  // namespace folio

int main() {
  using namespace folio;

  set_log_level(LogLevel::ERROR);

  test_round_trip();
  test_legacy_aliases();
  test_parse_errors();
  test_store_files();
  test_bad_record_keeps_snapshot();
  test_log_levels();
  test_reentrant_sink();
  test_default_location();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
