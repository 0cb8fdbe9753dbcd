#include "engine/delta/delta_engine.hpp"

#include "engine/anchor/parallel_resolver.hpp"
#include "engine/core/logging.hpp"

#include <algorithm>
#include <utility>

namespace folio {

namespace {

enum class ChangeKind { kMoved, kModified };

struct PendingResolve {
  const Fingerprint* previous = nullptr;
  ChangeKind kind = ChangeKind::kMoved;
};

void record(DeltaReport& report, const PendingResolve& job, const ResolveOutcome& outcome) {
  const Fingerprint& prev = *job.previous;

  if (outcome.exception) {
    log(LogLevel::WARN, "delta", "resolving span '" + prev.id + "' threw: " + outcome.error);
    report.unresolved.push_back(UnresolvedEntry{prev.id, prev.offset, kReasonException,
                                                outcome.trace.last_tier,
                                                outcome.trace.last_confidence, outcome.error});
    return;
  }
  if (!outcome.trace.match) {
    report.unresolved.push_back(UnresolvedEntry{prev.id, prev.offset, kReasonResolutionFailed,
                                                outcome.trace.last_tier,
                                                outcome.trace.last_confidence, {}});
    return;
  }

  const AnchorMatch& m = *outcome.trace.match;
  if (job.kind == ChangeKind::kMoved) {
    report.moved.push_back(MovedEntry{prev.id, prev.offset, m.position, m.tier, m.confidence});
  } else {
    report.modified.push_back(ModifiedEntry{prev.id, m.position, m.tier, m.confidence});
  }
}

} // namespace

DeltaReport diff_collections(const FingerprintCollection* previous,
                             const FingerprintCollection& current,
                             std::optional<std::string_view> current_text,
                             const DeltaSettings& settings,
                             const ParallelResolver* pool) {
  settings.validate_or_throw();

  DeltaReport report;
  std::vector<PendingResolve> pending;

  // Both maps are ordered by id, so every category comes out sorted.
  for (const auto& [id, cur] : current.spans) {
    const Fingerprint* prev = previous ? previous->find(id) : nullptr;
    if (prev == nullptr) {
      report.added.push_back(id);
      continue;
    }
    const bool same_hash = prev->content_hash == cur.content_hash;
    if (same_hash && prev->offset == cur.offset) continue;

    const ChangeKind kind = same_hash ? ChangeKind::kMoved : ChangeKind::kModified;
    if (!current_text) {
      if (kind == ChangeKind::kMoved) {
        report.moved.push_back(MovedEntry{id, prev->offset, cur.offset, 0, 0.0});
      } else {
        report.modified.push_back(ModifiedEntry{id, cur.offset, 0, 0.0});
      }
      continue;
    }
    pending.push_back(PendingResolve{prev, kind});
  }

  if (previous) {
    for (const auto& [id, prev] : previous->spans) {
      if (current.find(id) == nullptr) report.removed.push_back(id);
    }
  }

  if (!pending.empty()) {
    std::optional<ParallelResolver> owned;
    if (!pool && settings.resolver_threads != 1) pool = &owned.emplace(settings.resolver_threads);

    std::vector<ResolveOutcome> outcomes;
    if (pool) {
      std::vector<const Fingerprint*> fps;
      fps.reserve(pending.size());
      for (const auto& job : pending) fps.push_back(job.previous);
      outcomes = pool->resolve_all(fps, *current_text, settings.anchor);
    } else {
      outcomes.reserve(pending.size());
      for (const auto& job : pending) {
        outcomes.push_back(resolve_guarded(*job.previous, *current_text, settings.anchor));
      }
    }
    for (size_t i = 0; i < pending.size(); ++i) {
      record(report, pending[i], outcomes[i]);
    }
  }

  log(LogLevel::DEBUG, "delta", "added=" + std::to_string(report.added.size()) +
                       " removed=" + std::to_string(report.removed.size()) +
                       " modified=" + std::to_string(report.modified.size()) +
                       " moved=" + std::to_string(report.moved.size()) +
                       " unresolved=" + std::to_string(report.unresolved.size()));
  return report;
}

std::vector<std::string> needs_reprocessing(const DeltaReport& report) {
  std::vector<std::string> ids = report.added;
  for (const auto& m : report.modified) ids.push_back(m.id);
  for (const auto& m : report.moved) ids.push_back(m.id);
  std::sort(ids.begin(), ids.end());
  return ids;
}

bool is_clean(const DeltaReport& report) noexcept {
  return report.added.empty() && report.removed.empty() && report.modified.empty() &&
         report.moved.empty() && report.unresolved.empty();
}

}  // namespace folio
