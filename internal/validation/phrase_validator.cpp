#include "phrase_validator.hpp"

#include <set>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace phrase::validation {

namespace {

bool IsWordChar(char32_t c) {
  return util::IsLetterOrDigit(c) || c == U'-' || c == U'\'';
}

// Splits on anything that cannot appear inside a content word.
std::vector<std::u32string> HintTokens(const std::u32string& hint) {
  std::vector<std::u32string> tokens;
  std::u32string              current;
  for (char32_t c : hint) {
    if (IsWordChar(c)) {
      current.push_back(util::ToLower(c));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

std::u32string Lower(std::u32string word) {
  for (auto& c : word)
    c = util::ToLower(c);
  return word;
}

} // namespace

ValidationPolicy ValidationPolicy::FromConfig(const phrase::runtime::config::ValidationConfig& config) {
  ValidationPolicy policy;
  if (config.min_words() > 0) policy.min_words = config.min_words();
  if (config.max_words() > 0) policy.max_words = config.max_words();
  if (config.max_word_length() > 0) policy.max_word_length = config.max_word_length();
  if (config.max_hint_length() > 0) policy.max_hint_length = config.max_hint_length();
  return policy;
}

PhraseValidator::PhraseValidator(ValidationPolicy policy) : policy_(policy) {
}

ValidatedPhrase PhraseValidator::Validate(std::string_view content, std::string_view hint) const {
  std::vector<std::string> errors;

  ValidatedPhrase out;
  out.content = util::Trim(content);
  out.hint    = util::Trim(hint);

  std::set<std::u32string> content_words;

  if (out.content.empty()) {
    errors.push_back("content must not be empty");
  } else {
    const auto words = util::SplitWhitespace(out.content);
    if (words.size() < policy_.min_words || words.size() > policy_.max_words) {
      errors.push_back("content must have between " + std::to_string(policy_.min_words) + " and " + std::to_string(policy_.max_words) +
                       " words, got " + std::to_string(words.size()));
    }

    for (const auto& word : words) {
      const auto decoded = util::DecodeUtf8(word);

      bool clean = true;
      for (char32_t c : decoded) {
        if (!IsWordChar(c)) {
          clean = false;
          break;
        }
      }
      if (!clean) errors.push_back("word '" + word + "' may only contain letters, digits, hyphens and apostrophes");

      if (decoded.size() > policy_.max_word_length) {
        errors.push_back("word '" + word + "' exceeds " + std::to_string(policy_.max_word_length) + " characters");
      }

      content_words.insert(Lower(decoded));
    }
  }

  if (!out.hint.empty()) {
    const auto decoded = util::DecodeUtf8(out.hint);
    if (decoded.size() > policy_.max_hint_length) {
      errors.push_back("hint exceeds " + std::to_string(policy_.max_hint_length) + " characters");
    }

    std::set<std::u32string> reported;
    for (const auto& token : HintTokens(decoded)) {
      if (content_words.count(token) && reported.insert(token).second) {
        errors.push_back("hint must not contain the word '" + util::EncodeUtf8(token) + "' from the phrase");
      }
    }
  }

  if (!errors.empty()) throw util::ValidationFailed(std::move(errors));
  return out;
}

} // namespace phrase::validation
