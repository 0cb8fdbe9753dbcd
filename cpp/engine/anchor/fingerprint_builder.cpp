#include "engine/anchor/fingerprint_builder.hpp"

#include "engine/anchor/rare_shingles.hpp"
#include "engine/core/error.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/text/normalize.hpp"

#include <algorithm>
#include <utility>

namespace folio {

namespace {

void check_span(std::string_view document, const SpanInput& span) {
  FOLIO_ENSURE(!span.id.empty(), ErrorCode::kInvalidArgument, "span id must not be empty");
  FOLIO_ENSURE(span.start < span.end, ErrorCode::kSpanOutOfRange,
               "span '" + span.id + "': start " + std::to_string(span.start) +
               " must be before end " + std::to_string(span.end));
  FOLIO_ENSURE(span.end <= document.size(), ErrorCode::kSpanOutOfRange,
               "span '" + span.id + "': end " + std::to_string(span.end) +
               " exceeds document length " + std::to_string(document.size()));
  FOLIO_ENSURE(document.substr(span.start, span.end - span.start) == span.text,
               ErrorCode::kTextMismatch,
               "span '" + span.id + "': text does not match the document slice");
}

} // namespace

Fingerprint build_fingerprint(std::string_view document,
                              const SpanInput& span,
                              const BuilderSettings& settings) {
  check_span(document, span);

  Fingerprint fp;
  fp.id = span.id;
  fp.parent_id = span.parent_id;
  fp.content_hash = content_hash_hex(span.text, settings.hash);
  fp.offset = span.start;
  fp.length = span.end - span.start;

  const size_t ctx = settings.context_chars;
  const size_t pre_begin = text::utf8_ceil(document, span.start > ctx ? span.start - ctx : 0);
  const size_t post_end = text::utf8_floor(document, std::min(document.size(), span.end + ctx));
  fp.pre_context = std::string(document.substr(pre_begin, span.start - std::min(pre_begin, span.start)));
  fp.post_context = std::string(document.substr(span.end, post_end > span.end ? post_end - span.end : 0));

  if (settings.compute_rare_shingles) {
    fp.rare_shingles = select_rare_shingles(span.text, settings.shingles);
  }
  if (settings.retain_text) {
    fp.text = span.text;
  }
  return fp;
}

FingerprintCollection build_collection(std::string_view document,
                                       const std::vector<SpanInput>& spans,
                                       const BuilderSettings& settings,
                                       std::string generated_at) {
  settings.validate_or_throw();

  FingerprintCollection out;
  out.document_checksum = document_checksum(document, settings.hash);
  out.generated_at = generated_at.empty() ? utc_timestamp() : std::move(generated_at);

  for (const auto& span : spans) {
    FOLIO_ENSURE(out.spans.find(span.id) == out.spans.end(), ErrorCode::kDuplicateSpan,
                 "duplicate span id '" + span.id + "'");
    out.spans.emplace(span.id, build_fingerprint(document, span, settings));
  }

  log(LogLevel::DEBUG, "builder", std::to_string(out.spans.size()) +
                       " spans, checksum " + out.document_checksum);
  return out;
}

std::string document_checksum(std::string_view document, HashAlgorithm algo) {
  return content_hash_hex(text::normalize_churn(document), algo);
}

}  // namespace folio
