#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace phrase::validation {

struct ValidationPolicy {
  uint32_t min_words       = 2;
  uint32_t max_words       = 6;
  uint32_t max_word_length = 7;
  uint32_t max_hint_length = 300;

  // Zero fields keep the defaults above.
  static ValidationPolicy FromConfig(const phrase::runtime::config::ValidationConfig& config);
};

struct ValidatedPhrase {
  std::string content;
  std::string hint;
};

/*
  Shape rules applied before a phrase is scored or stored.

  Validate() returns the trimmed content and hint, or throws
  util::ValidationFailed listing every violation found.
*/
class PhraseValidator {
 public:
  explicit PhraseValidator(ValidationPolicy policy = {});

  ValidatedPhrase Validate(std::string_view content, std::string_view hint) const;

  const ValidationPolicy& Policy() const {
    return policy_;
  }

 private:
  ValidationPolicy policy_;
};

} // namespace phrase::validation
