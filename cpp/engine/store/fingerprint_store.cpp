#include "engine/store/fingerprint_store.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/store/fingerprint_json.hpp"
#include "engine/store/fingerprint_json_parse.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace folio {

namespace fs = std::filesystem;

namespace {

std::string read_file_or_throw(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) throw IOError(path, "cannot open");
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) throw IOError(path, "read failed");
  return ss.str();
}

} // namespace

std::optional<FingerprintCollection> load_fingerprints(const std::string& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    log(LogLevel::INFO, "store", "no snapshot at " + path);
    return std::nullopt;
  }

  std::string buf;
  try {
    buf = read_file_or_throw(path);
  } catch (const IOError& e) {
    log(LogLevel::WARN, "store", e.what());
    return std::nullopt;
  }

  FingerprintCollection col;
  JsonParseError err;
  if (!parse_fingerprints_json(buf, &col, &err)) {
    log(LogLevel::WARN, "store", "malformed " + path + " (line " +
                        std::to_string(err.line) + ", col " + std::to_string(err.col) +
                        "): " + err.message);
    return std::nullopt;
  }

  log(LogLevel::DEBUG, "store", "loaded " + std::to_string(col.spans.size()) +
                       " spans from " + path);
  return col;
}

bool save_fingerprints(const FingerprintCollection& collection, const std::string& path) {
  std::error_code ec;
  const fs::path target(path);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      log(LogLevel::WARN, "store", "cannot create " +
                          target.parent_path().string() + ": " + ec.message());
      return false;
    }
  }

  const fs::path tmp = fs::path(path + ".tmp");
  {
    std::ofstream f(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
      log(LogLevel::WARN, "store", "cannot write " + tmp.string());
      return false;
    }
    f << fingerprints_to_json(collection);
    f.flush();
    if (!f) {
      log(LogLevel::WARN, "store", "write failed for " + tmp.string());
      f.close();
      fs::remove(tmp, ec);
      return false;
    }
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    log(LogLevel::WARN, "store", "cannot replace " + path + ": " + ec.message());
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return false;
  }
  return true;
}

std::optional<FingerprintCollection> load_fingerprints(const EngineSettings& settings) {
  return load_fingerprints(settings.store_path);
}

bool save_fingerprints(const FingerprintCollection& collection, const EngineSettings& settings) {
  return save_fingerprints(collection, settings.store_path);
}

} // namespace folio
