#pragma once
/*
================================================================================
Fragment 3.5 - Anchor: Parallel Resolver
FILE: cpp/engine/anchor/parallel_resolver.hpp

Purpose:
  - Resolve many fingerprints against one document concurrently.
  - Output order equals input order, so reports built from it are identical
    to a sequential run.

Hardening:
  - A failure while resolving one fingerprint is captured in its outcome and
    never aborts the batch.
  - Workers share only the (read-only) document and an atomic work index;
    each outcome slot is written by exactly one worker.
  - The calling thread is one of the workers. When a thread cannot be
    started, the threads already running and the caller finish the batch.
================================================================================
*/

#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "engine/anchor/fingerprint_types.hpp"
#include "engine/core/settings.hpp"

namespace folio {

struct ResolveOutcome {
  ResolveTrace trace;
  bool exception = false;
  std::string error;  // what() of the captured exception
};

// resolve_trace() with any exception captured into the outcome.
ResolveOutcome resolve_guarded(const Fingerprint& fp,
                               std::string_view current_text,
                               const AnchorSettings& settings);

class ParallelResolver {
 public:
  // Starts one worker; throws std::system_error when it cannot.
  using ThreadStarter = std::function<std::thread(std::function<void()>)>;

  // max_threads == 0 selects hardware concurrency. An empty starter
  // constructs std::thread directly.
  explicit ParallelResolver(int max_threads = 0, ThreadStarter starter = {});

  int thread_count() const noexcept { return threads_; }

  std::vector<ResolveOutcome> resolve_all(const std::vector<const Fingerprint*>& fps,
                                          std::string_view current_text,
                                          const AnchorSettings& settings) const;

 private:
  int threads_ = 1;
  ThreadStarter starter_;
};

}  // namespace folio
