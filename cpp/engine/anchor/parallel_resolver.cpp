#include "engine/anchor/parallel_resolver.hpp"

#include "engine/anchor/anchor_resolver.hpp"
#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"

#include <atomic>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

namespace folio {

ResolveOutcome resolve_guarded(const Fingerprint& fp,
                               std::string_view current_text,
                               const AnchorSettings& settings) {
  ResolveOutcome out;
  try {
    out.trace = resolve_trace(fp, current_text, settings);
  } catch (const std::exception& e) {
    out.exception = true;
    out.error = e.what();
  } catch (...) {
    out.exception = true;
    out.error = "unknown exception";
  }
  return out;
}

ParallelResolver::ParallelResolver(int max_threads, ThreadStarter starter)
    : starter_(std::move(starter)) {
  FOLIO_ENSURE(max_threads >= 0, ErrorCode::kInvalidArgument,
               "ParallelResolver: max_threads must be >= 0");
  if (max_threads == 0) {
    max_threads = static_cast<int>(std::thread::hardware_concurrency());
    if (max_threads == 0) max_threads = 4;
  }
  threads_ = max_threads;
}

std::vector<ResolveOutcome> ParallelResolver::resolve_all(const std::vector<const Fingerprint*>& fps,
                                                          std::string_view current_text,
                                                          const AnchorSettings& settings) const {
  std::vector<ResolveOutcome> results(fps.size());
  if (fps.empty()) return results;

  for (const Fingerprint* fp : fps) {
    FOLIO_ENSURE(fp != nullptr, ErrorCode::kInvalidArgument, "resolve_all: null fingerprint");
  }

  size_t num_threads = static_cast<size_t>(threads_);
  if (fps.size() < num_threads) num_threads = fps.size();

  if (num_threads <= 1) {
    for (size_t i = 0; i < fps.size(); ++i) {
      results[i] = resolve_guarded(*fps[i], current_text, settings);
    }
    return results;
  }

  std::atomic<size_t> current_index{0};

  std::function<void()> worker = [&]() {
    while (true) {
      const size_t index = current_index.fetch_add(1);
      if (index >= fps.size()) break;
      results[index] = resolve_guarded(*fps[index], current_text, settings);
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(num_threads - 1);
  try {
    while (workers.size() + 1 < num_threads) {
      workers.push_back(starter_ ? starter_(worker) : std::thread(worker));
    }
  } catch (const std::system_error& e) {
    log(LogLevel::WARN, "resolver", "started " + std::to_string(workers.size()) + " of " +
                        std::to_string(num_threads - 1) + " worker threads: " + e.what());
  }
  worker();
  for (auto& t : workers) {
    t.join();
  }

  log(LogLevel::DEBUG, "resolver", std::to_string(fps.size()) + " fingerprints on " +
                       std::to_string(workers.size() + 1) + " threads");
  return results;
}

}  // namespace folio
