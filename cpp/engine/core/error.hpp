#pragma once
/*
================================================================================
Fragment 1.8 - Core: Caller Errors
FILE: cpp/engine/core/error.hpp

Purpose:
  - Coded exception for misuse of the engine API: span inputs that do not
    describe the document, duplicate span ids, tier numbers outside 1..4,
    bad resolver arguments.
  - FOLIO_THROW / FOLIO_ENSURE record the raising site.

what() format:
  folio: SpanOutOfRange: span 's1' ends at 900 past document size 512 [fingerprint_builder.cpp:21 check_span]

Data problems (bad settings, bad records on disk) use errors.hpp instead.
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace folio {

enum class ErrorCode : int {
  kInvalidArgument = 1,
  kSpanOutOfRange  = 2,
  kTextMismatch    = 3,
  kDuplicateSpan   = 4,
  kUnknownTier     = 5,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    case ErrorCode::kSpanOutOfRange:  return "SpanOutOfRange";
    case ErrorCode::kTextMismatch:    return "TextMismatch";
    case ErrorCode::kDuplicateSpan:   return "DuplicateSpan";
    case ErrorCode::kUnknownTier:     return "UnknownTier";
  }
  return "Unknown";
}

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code, std::string message, const char* file, int line, const char* function)
      : std::runtime_error(compose(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        site_(site_of(file, line, function)) {}

  ErrorCode code() const noexcept { return code_; }

  // Message without the code prefix or raising site.
  const std::string& message() const noexcept { return message_; }

  // "file.cpp:42 function", basename only; empty when unknown.
  const std::string& site() const noexcept { return site_; }

 private:
  static std::string site_of(const char* file, int line, const char* function) {
    if (!file || !*file) return {};
    std::string path(file);
    const auto slash = path.find_last_of("/\\");
    std::string s = (slash == std::string::npos) ? path : path.substr(slash + 1);
    s += ":" + std::to_string(line);
    if (function && *function) {
      s += " ";
      s += function;
    }
    return s;
  }

  static std::string compose(ErrorCode code, const std::string& message, const char* file,
                             int line, const char* function) {
    std::string out = "folio: ";
    out += to_string(code);
    out += ": ";
    out += message;
    const std::string site = site_of(file, line, function);
    if (!site.empty()) out += " [" + site + "]";
    return out;
  }

  ErrorCode code_;
  std::string message_;
  std::string site_;
};

[[noreturn]] inline void raise_error(ErrorCode code, std::string message, const char* file,
                                     int line, const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

}  // namespace folio

#define FOLIO_THROW(CODE, MSG) ::folio::raise_error((CODE), (MSG), __FILE__, __LINE__, __func__)

// MSG is only evaluated when EXPR fails.
#define FOLIO_ENSURE(EXPR, CODE, MSG)                                       \
  do {                                                                      \
    if (!(EXPR)) ::folio::raise_error((CODE), (MSG), __FILE__, __LINE__, __func__); \
  } while (0)
