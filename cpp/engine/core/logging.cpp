/*
===========================================================
Fragment 1.1 - Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
Line format on the console:
  [2024-05-01T12:00:00Z][WARN][store] cannot replace ...
DEBUG/INFO go to stdout, WARN/ERROR to stderr.
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <mutex>
#include <system_error>
#include <utility>

namespace folio {
namespace {

std::atomic<int> g_threshold{static_cast<int>(LogLevel::INFO)};
std::once_flag g_env_once;
std::mutex g_out_mu;
std::shared_ptr<const LogSink> g_sink;  // guarded by g_out_mu

const char* level_name(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
  }
  return "INFO";
}

void apply_env_level() noexcept {
  try {
    std::call_once(g_env_once, [] {
      const char* raw = std::getenv("FOLIO_LOG_LEVEL");
      LogLevel lvl{};
      if (raw && parse_log_level(raw, lvl)) {
        g_threshold.store(static_cast<int>(lvl), std::memory_order_relaxed);
      }
    });
  } catch (const std::system_error&) {
    // The INFO default stands.
  }
}

} // namespace

bool parse_log_level(std::string_view text, LogLevel& out) noexcept {
  auto is = [text](std::string_view word) {
    if (text.size() != word.size()) return false;
    for (size_t i = 0; i < word.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(text[i])) != word[i]) return false;
    }
    return true;
  };
  if (is("debug")) { out = LogLevel::DEBUG; return true; }
  if (is("info")) { out = LogLevel::INFO; return true; }
  if (is("warn") || is("warning")) { out = LogLevel::WARN; return true; }
  if (is("error")) { out = LogLevel::ERROR; return true; }
  return false;
}

void set_log_level(LogLevel lvl) noexcept {
  apply_env_level();
  g_threshold.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  apply_env_level();
  return static_cast<LogLevel>(g_threshold.load(std::memory_order_relaxed));
}

void set_log_sink(LogSink sink) {
  std::shared_ptr<const LogSink> next;
  if (sink) next = std::make_shared<const LogSink>(std::move(sink));
  std::lock_guard<std::mutex> lk(g_out_mu);
  g_sink.swap(next);
}

std::string utc_timestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm parts{};
#if defined(_WIN32)
  gmtime_s(&parts, &now);
#else
  gmtime_r(&now, &parts);
#endif
  char buf[32];
  const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &parts);
  return std::string(buf, n);
}

void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept {
  if (static_cast<int>(lvl) < static_cast<int>(get_log_level())) return;
  try {
    std::shared_ptr<const LogSink> sink;
    {
      std::lock_guard<std::mutex> lk(g_out_mu);
      sink = g_sink;
      if (!sink) {
        std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
        out << '[' << utc_timestamp() << "][" << level_name(lvl) << "][" << component << "] "
            << msg << '\n';
        out.flush();
        return;
      }
    }
    // Called unlocked: a sink may log or replace itself.
    (*sink)(LogRecord{lvl, component, msg});
  } catch (...) {
    // Logging never propagates; a failing sink or stream loses the line.
  }
}

} // namespace folio
