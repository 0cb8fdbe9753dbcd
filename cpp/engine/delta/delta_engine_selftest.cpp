/*
  Fragment 4.2 - Delta Engine Selftest

  Objective
  ---------
  Framework-free selftest for span classification across two snapshots:
    1) Every id in either collection lands in exactly one category, or in
       none when hash and offset are unchanged.
    2) A span pushed down by an inserted paragraph is reported as moved with
       the resolver's tier and the exact new offset.
    3) A span whose text was deleted is unresolved, never guessed; a span
       whose resolution throws is unresolved with "anchor-exception" and
       leaves one warning in the log.
    4) Parallel and sequential resolution produce identical reports, whether
       the pool is passed in, sized from resolver_threads, or short of
       threads because one could not be started.

  Expected use
  ------------
      ./delta_engine_selftest
  Non-zero return code indicates failure.
*/

#include <algorithm>
#include <iostream>
#include <map>
#include <string>
#include <functional>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "engine/anchor/fingerprint_builder.hpp"
#include "engine/anchor/parallel_resolver.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/delta/delta_engine.hpp"

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

Fingerprint make_fp(const std::string& id, const std::string& text, size_t offset) {
  Fingerprint fp;
  fp.id = id;
  fp.content_hash = sha256_hex(text);
  fp.offset = offset;
  fp.length = text.size();
  return fp;
}

FingerprintCollection collection_of(std::vector<Fingerprint> fps) {
  FingerprintCollection c;
  c.generated_at = "2024-05-01T12:00:00Z";
  for (auto& fp : fps) {
    const std::string id = fp.id;
    c.spans.emplace(id, std::move(fp));
  }
  return c;
}

void test_classification_without_text() {
  const auto prev = collection_of({make_fp("a", "alpha", 0), make_fp("b", "beta", 10),
                                   make_fp("c", "gamma", 20), make_fp("d", "delta", 30)});
  const auto cur = collection_of({make_fp("b", "beta", 10), make_fp("c", "gamma", 25),
                                  make_fp("d", "DELTA", 30), make_fp("e", "epsilon", 40)});

  const DeltaReport r = diff_collections(&prev, cur);
  expect_true(r.added == std::vector<std::string>{"e"}, "new id is added");
  expect_true(r.removed == std::vector<std::string>{"a"}, "missing id is removed");
  expect_true(r.moved.size() == 1 && r.moved[0] == MovedEntry{"c", 20, 25, 0, 0.0},
              "same hash, new offset: moved with tier 0 when no text is given");
  expect_true(r.modified.size() == 1 && r.modified[0] == ModifiedEntry{"d", 30, 0, 0.0},
              "different hash: modified at the current offset");
  expect_true(r.unresolved.empty(), "nothing unresolved without resolution");

  // Union completeness: each id at most once, b (unchanged) nowhere.
  std::map<std::string, int> seen;
  for (const auto& id : r.added) ++seen[id];
  for (const auto& id : r.removed) ++seen[id];
  for (const auto& m : r.moved) ++seen[m.id];
  for (const auto& m : r.modified) ++seen[m.id];
  for (const auto& u : r.unresolved) ++seen[u.id];
  const bool once = std::all_of(seen.begin(), seen.end(), [](const auto& kv) { return kv.second == 1; });
  expect_true(once && seen.size() == 4 && seen.count("b") == 0, "every changed id in exactly one category");

  expect_true(needs_reprocessing(r) == std::vector<std::string>({"c", "d", "e"}),
              "reprocessing covers added, modified and moved");
  expect_true(!is_clean(r) && is_clean(diff_collections(&cur, cur)), "is_clean");

  const DeltaReport first = diff_collections(nullptr, cur);
  expect_true(first.added == std::vector<std::string>({"b", "c", "d", "e"}) && first.removed.empty(),
              "no prior snapshot: everything added, in id order");
}

void test_moved_by_inserted_paragraph() {
  std::string prefix = words("p", 0, 40);
  prefix.resize(119);
  prefix += ' ';
  const std::string span = "The cat sat.";
  const std::string before = prefix + span + " " + words("x", 0, 40);

  std::string para = words("n", 0, 80);
  para.resize(219);
  para += '\n';
  const std::string after = para + before;

  const auto prev = build_collection(before, {span_at(before, "s1", 120, span.size())});
  const auto cur = build_collection(after, {span_at(after, "s1", 340, span.size())});

  const DeltaReport r = diff_collections(&prev, cur, std::string_view(after));
  expect_true(r.moved.size() == 1, "one moved span");
  if (r.moved.size() == 1) {
    const MovedEntry& m = r.moved[0];
    expect_true(m.id == "s1" && m.from == 120 && m.to == 340, "moved from 120 to 340");
    expect_true((m.tier == 1 || m.tier == 2) && m.confidence >= 0.85, "resolved by tier 1 or 2");
  }
  expect_true(r.added.empty() && r.removed.empty() && r.modified.empty() && r.unresolved.empty(),
              "no other categories");
}

void test_unresolved() {
  const std::string a = words("a", 0, 200);
  std::string span = words("s", 0, 40);
  span.pop_back();
  const std::string b = words("b", 0, 200);
  const std::string before = a + span + " " + b;
  const std::string after = a + b;

  const auto prev = build_collection(before, {span_at(before, "s2", a.size(), span.size())});
  const auto cur = build_collection(after, {span_at(after, "s2", a.size(), 10)});

  const DeltaReport r = diff_collections(&prev, cur, std::string_view(after));
  expect_true(r.unresolved.size() == 1 && r.modified.empty(), "deleted span is unresolved");
  if (r.unresolved.size() == 1) {
    const UnresolvedEntry& u = r.unresolved[0];
    expect_true(u.id == "s2" && u.prior_offset == a.size(), "prior offset reported");
    expect_true(u.reason == kReasonResolutionFailed, "reason anchor-resolution-failed");
    expect_true(u.last_tier == 4 && u.last_confidence == 0.0, "last tier attempted is propagated");
  }

  // A malformed prior fingerprint makes the resolver throw.
  auto broken = collection_of({make_fp("z", "zeta", 0)});
  broken.spans.at("z").content_hash = "zz";
  const auto now = collection_of({make_fp("z", "ZETA", 0)});
  std::vector<std::string> warnings;
  set_log_sink([&warnings](const LogRecord& rec) {
    if (rec.level == LogLevel::WARN && rec.component == "delta") warnings.emplace_back(rec.message);
  });
  const DeltaReport e = diff_collections(&broken, now, std::string_view("ZETA and more"));
  set_log_sink(nullptr);
  expect_true(warnings.size() == 1 && warnings[0].find("'z'") != std::string::npos,
              "contained exception is logged once as a delta warning");
  expect_true(e.unresolved.size() == 1 && e.unresolved[0].reason == kReasonException &&
              !e.unresolved[0].detail.empty(),
              "resolver exception is contained as anchor-exception");
  expect_true(e.modified.empty(), "failed span is not also reported modified");
}

void test_parallel_matches_sequential() {
  std::vector<std::string> segs;
  for (int i = 0; i < 30; ++i) segs.push_back(words("g" + std::to_string(i) + "w", 0, 12));

  auto assemble = [](const std::string& head, const std::vector<std::string>& parts,
                     std::vector<SpanInput>& spans) {
    std::string doc = head;
    std::vector<std::pair<size_t, size_t>> at;
    for (const auto& p : parts) {
      at.emplace_back(doc.size(), p.size());
      doc += p + "\n\n";
    }
    for (size_t i = 0; i < parts.size(); ++i) {
      spans.push_back(span_at(doc, "sc" + std::to_string(100 + i), at[i].first, at[i].second));
    }
    return doc;
  };

  std::vector<SpanInput> old_spans;
  const std::string before = assemble("", segs, old_spans);

  std::vector<std::string> edited = segs;
  edited[5].replace(0, 2, "G5");
  edited[17] += "added words here ";
  std::vector<SpanInput> new_spans;
  const std::string after = assemble("A new opening paragraph arrives.\n\n", edited, new_spans);

  const auto prev = build_collection(before, old_spans);
  const auto cur = build_collection(after, new_spans);

  const DeltaReport seq = diff_collections(&prev, cur, std::string_view(after));
  const ParallelResolver pool(4);
  const DeltaReport par = diff_collections(&prev, cur, std::string_view(after), DeltaSettings{}, &pool);

  expect_true(pool.thread_count() == 4, "pool honours the thread cap");
  expect_true(seq == par, "parallel and sequential reports are identical");
  expect_true(seq.moved.size() + seq.modified.size() == 30 && seq.unresolved.empty(),
              "every shifted span resolved");
  expect_true(seq.modified.size() == 2, "two spans modified");

  // No pool: resolver_threads decides.
  DeltaSettings threaded;
  threaded.resolver_threads = 4;
  std::string summary;
  set_log_level(LogLevel::DEBUG);
  set_log_sink([&summary](const LogRecord& rec) {
    if (rec.component == "resolver") summary = std::string(rec.message);
  });
  const DeltaReport own = diff_collections(&prev, cur, std::string_view(after), threaded);
  set_log_sink(nullptr);
  set_log_level(LogLevel::INFO);
  expect_true(own == seq, "resolver_threads alone gives the sequential report");
  expect_true(summary.find("on 4 threads") != std::string::npos, "resolver_threads sizes the pool");

  // Only one worker thread can be started; the batch still completes.
  int started = 0;
  const ParallelResolver starved(4, [&started](std::function<void()> fn) {
    if (started == 1) {
      throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    }
    ++started;
    return std::thread(std::move(fn));
  });
  set_log_level(LogLevel::ERROR);
  const DeltaReport partial =
      diff_collections(&prev, cur, std::string_view(after), DeltaSettings{}, &starved);
  set_log_level(LogLevel::INFO);
  expect_true(started == 1 && partial == seq, "failed thread start falls back to running threads");
}

void test_invalid_settings() {
  DeltaSettings bad;
  bad.resolver_threads = -1;
  bool threw = false;
  try {
    (void)diff_collections(nullptr, FingerprintCollection{}, std::nullopt, bad);
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "invalid delta settings rejected up front");
}

}  // namespace
}  // namespace folio

int main() {
  using namespace folio;

  test_classification_without_text();
  test_moved_by_inserted_paragraph();
  test_unresolved();
  test_parallel_matches_sequential();
  test_invalid_settings();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
