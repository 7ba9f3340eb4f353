#include "internal/validation/phrase_validator.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using phrase::util::ValidationFailed;
using phrase::validation::PhraseValidator;
using phrase::validation::ValidationPolicy;

// Returns the number of violations reported, 0 when the phrase passes.
size_t CountErrors(const PhraseValidator& validator, const std::string& content, const std::string& hint = {}) {
  try {
    (void)validator.Validate(content, hint);
    return 0;
  } catch (const ValidationFailed& e) {
    assert(!e.Errors().empty());
    return e.Errors().size();
  }
}

void TestAcceptsAndTrims() {
  PhraseValidator validator;

  const auto out = validator.Validate("  hello world \n", "  a friendly greeting ");
  assert(out.content == "hello world");
  assert(out.hint == "a friendly greeting");
}

void TestWordCountBounds() {
  PhraseValidator validator;

  assert(CountErrors(validator, "hello") == 1);
  assert(CountErrors(validator, "one two") == 0);
  assert(CountErrors(validator, "a b c d e f") == 0);
  assert(CountErrors(validator, "a b c d e f g") == 1);
  assert(CountErrors(validator, "   ") == 1);
}

void TestWordShape() {
  PhraseValidator validator;

  assert(CountErrors(validator, "don't stop") == 0);
  assert(CountErrors(validator, "well-to do") == 0);
  assert(CountErrors(validator, "hi there!") == 1);
  assert(CountErrors(validator, "hello extralong") == 1);

  // Seven code points, nine bytes.
  assert(CountErrors(validator, "smörgås bord") == 0);
}

void TestScriptPunctuationAndCase() {
  PhraseValidator validator;

  assert(CountErrors(validator, "नमस्ते दुनिया") == 0);
  // The danda ends a sentence; it is not part of a word.
  assert(CountErrors(validator, "नमस्ते दुनिया।") == 1);
  assert(CountErrors(validator, "नमस्ते ॥ दुनिया") == 1);

  // Armenian folds case, so the upper-case hint still leaks a content word.
  assert(CountErrors(validator, "բարեւ աշխարհ", "ԲԱՐԵՒ friend") == 1);
}

void TestCollectsEveryViolation() {
  PhraseValidator validator;

  // One word, too long, and a forbidden character.
  assert(CountErrors(validator, "toolongword!") == 3);
}

void TestHintRules() {
  PhraseValidator validator;

  assert(CountErrors(validator, "hello world", "say it to the World") == 1);
  assert(CountErrors(validator, "hello world", "hello, World!") == 2);
  assert(CountErrors(validator, "hello world", "hello hello hello") == 1);
  assert(CountErrors(validator, "hello world", "worldwide greeting") == 0);
  assert(CountErrors(validator, "hello world", std::string(301, 'x')) == 1);
  assert(CountErrors(validator, "hello world", std::string(300, 'x')) == 0);
}

void TestPolicyFromConfig() {
  phrase::runtime::config::ValidationConfig config;
  config.set_min_words(1);
  config.set_max_word_length(12);

  const auto policy = ValidationPolicy::FromConfig(config);
  assert(policy.min_words == 1);
  assert(policy.max_words == 6);
  assert(policy.max_word_length == 12);
  assert(policy.max_hint_length == 300);

  PhraseValidator validator(policy);
  assert(CountErrors(validator, "extralong") == 0);
}

} // namespace

int main() {
  TestAcceptsAndTrims();
  TestWordCountBounds();
  TestWordShape();
  TestScriptPunctuationAndCase();
  TestCollectsEveryViolation();
  TestHintRules();
  TestPolicyFromConfig();

  std::cout << "phrase_manager_unit_phrase_validator: pass\n";
  return 0;
}
