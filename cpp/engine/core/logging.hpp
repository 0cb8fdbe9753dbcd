#pragma once
/*
===========================================================
Fragment 1.1 - Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - One logging entry point for builder, resolver, delta and store.
  - Every line carries the emitting component ("delta", "store", ...).

Configuration:
  - Threshold defaults to INFO. FOLIO_LOG_LEVEL (debug|info|warn|error)
    overrides it the first time the level is consulted; set_log_level()
    always wins over the environment.
  - A sink may replace console output (selftests capture warnings this way).
    Sinks run outside the output mutex and may be called concurrently.

Hardening:
  - log() is noexcept; sink exceptions are dropped.
  - Console output is serialized by one mutex. The parallel resolver calls
    in from worker threads.
===========================================================
*/

#include <functional>
#include <string>
#include <string_view>

namespace folio {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

struct LogRecord {
  LogLevel level = LogLevel::INFO;
  std::string_view component;
  std::string_view message;
};

using LogSink = std::function<void(const LogRecord&)>;

void set_log_level(LogLevel lvl) noexcept;
LogLevel get_log_level() noexcept;

// Case-insensitive "debug", "info", "warn"/"warning", "error".
bool parse_log_level(std::string_view text, LogLevel& out) noexcept;

// An empty sink restores stdout/stderr output.
void set_log_sink(LogSink sink);

void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept;

// UTC, second resolution: "2024-05-01T12:00:00Z". Also stamps generatedAt.
std::string utc_timestamp();

} // namespace folio
