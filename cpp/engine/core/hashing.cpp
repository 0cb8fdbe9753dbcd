#include "engine/core/hashing.hpp"

#include "engine/core/errors.hpp"

#include <openssl/evp.h>

#include <array>

namespace folio {

namespace {

constexpr const char* kHex = "0123456789abcdef";

std::string bytes_to_hex(const unsigned char* p, size_t n) {
  std::string out;
  out.resize(n * 2);
  for (size_t i = 0; i < n; ++i) {
    out[2 * i]     = kHex[(p[i] >> 4) & 0xF];
    out[2 * i + 1] = kHex[p[i] & 0xF];
  }
  return out;
}

} // namespace

void Fnv1a64::update_bytes(const void* data, size_t n) {
  const auto* p = static_cast<const uint8_t*>(data);
  if (p == nullptr || n == 0) return;

  for (size_t i = 0; i < n; ++i) {
    h_ ^= static_cast<uint64_t>(p[i]);
    h_ *= kPrime;
  }
}

std::string hash_to_hex(Hash64 h) {
  std::string out;
  out.resize(16);
  uint64_t v = h.value;

  // Big-endian human string (most significant nibble first).
  for (int i = 15; i >= 0; --i) {
    out[15 - i] = kHex[(v >> (4ull * i)) & 0xFull];
  }
  return out;
}

std::string sha256_hex(std::string_view bytes) {
  std::array<unsigned char, 32> out{};

  // OpenSSL 3.x deprecates the low-level SHA256_* APIs; use EVP.
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) throw HashError("EVP_MD_CTX_new failed");

  unsigned int out_len = 0;
  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx, bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx, out.data(), &out_len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw HashError("EVP digest failed");
  }

  EVP_MD_CTX_free(ctx);
  if (out_len != out.size()) {
    throw HashError("unexpected digest length");
  }
  return bytes_to_hex(out.data(), out.size());
}

std::string fnv1a64_hex(std::string_view bytes) {
  Fnv1a64 h;
  h.update_raw(bytes);
  return hash_to_hex(Hash64{h.value()});
}

std::string content_hash_hex(std::string_view bytes, HashAlgorithm algo) {
  switch (algo) {
    case HashAlgorithm::kFnv1a64: return fnv1a64_hex(bytes);
    case HashAlgorithm::kSha256:
    default:                      return sha256_hex(bytes);
  }
}

bool is_content_hash(std::string_view hex) noexcept {
  if (hex.size() != kSha256HexLen && hex.size() != kFnv1a64HexLen) return false;
  for (char c : hex) {
    const bool digit = (c >= '0' && c <= '9');
    const bool lower = (c >= 'a' && c <= 'f');
    if (!digit && !lower) return false;
  }
  return true;
}

bool hash_matches(std::string_view bytes, std::string_view hex) {
  if (!is_content_hash(hex)) return false;
  const HashAlgorithm algo =
      (hex.size() == kFnv1a64HexLen) ? HashAlgorithm::kFnv1a64 : HashAlgorithm::kSha256;
  return content_hash_hex(bytes, algo) == hex;
}

}  // namespace folio
