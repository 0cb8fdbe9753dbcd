#pragma once
/*
================================================================================
Fragment 1.9 - Core: Data Errors
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Exceptions for bad data rather than bad calls: settings out of range,
    fingerprint records that cannot be resolved against, unreadable
    snapshot files, digest failures inside OpenSSL.
  - Each carries what it is about (subject or path) so the delta engine and
    the store can report it without re-parsing what().

what() is always "<subject>: <problem>".
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace folio {

class FolioError : public std::runtime_error {
 public:
  FolioError(std::string subject, const std::string& problem)
      : std::runtime_error(subject + ": " + problem), subject_(std::move(subject)) {}

  // "AnchorSettings", "Fingerprint 's12'", a file path, "SHA-256".
  const std::string& subject() const noexcept { return subject_; }

 private:
  std::string subject_;
};

// Settings or a fingerprint record failed validate_or_throw().
class ValidationError : public FolioError {
 public:
  using FolioError::FolioError;
};

// Snapshot file could not be opened or read.
class IOError : public FolioError {
 public:
  IOError(std::string path, const std::string& problem) : FolioError(std::move(path), problem) {}

  const std::string& path() const noexcept { return subject(); }
};

// The content hash could not be computed.
class HashError : public FolioError {
 public:
  explicit HashError(const std::string& problem) : FolioError("SHA-256", problem) {}
};

} // namespace folio
