#include "engine/anchor/fingerprint_types.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"
#include "engine/text/tokenize.hpp"

#include <limits>
#include <string>

namespace folio {

void Fingerprint::validate_or_throw(int tokens_per_shingle) const {
  if (id.empty()) throw ValidationError("Fingerprint", "id must not be empty");

  const std::string subject = "Fingerprint '" + id + "'";
  if (length == 0) throw ValidationError(subject, "length must be > 0");
  if (offset > std::numeric_limits<size_t>::max() - length) {
    throw ValidationError(subject, "offset + length overflows");
  }
  if (!is_content_hash(content_hash)) {
    throw ValidationError(subject, "sha is not a supported hex digest");
  }
  if (text && text->size() != length) {
    throw ValidationError(subject, "retained text length != len");
  }
  for (const auto& sh : rare_shingles) {
    if (static_cast<int>(text::split_phrase(sh.phrase).size()) != tokens_per_shingle) {
      throw ValidationError(subject, "rare shingle '" + sh.phrase + "' does not have " +
                                         std::to_string(tokens_per_shingle) + " tokens");
    }
  }
}

}  // namespace folio
