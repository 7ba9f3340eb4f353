#include "internal/scoring/difficulty_scorer.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using namespace phrase::manager::v1;
using phrase::scoring::FrequencyDifficultyScorer;
using phrase::scoring::LabelFor;
using phrase::scoring::PreviewFor;
using phrase::scoring::ScoreForHints;

void TestScoresStayInRange() {
  FrequencyDifficultyScorer scorer;

  for (const char* text : {"hello world", "jazz quiz", "the cat", "xylophone zebra", "a", "zzzz zzzz"}) {
    const int32_t score = scorer.Score(text, LANGUAGE_ENGLISH);
    assert(score >= phrase::scoring::kMinScore);
    assert(score <= phrase::scoring::kMaxScore);
  }
}

void TestKnownValues() {
  FrequencyDifficultyScorer scorer;

  // rarity 1000/82 * 0.7 + one unique bigram of three * 100 * 0.3
  assert(scorer.Score("aaaa", LANGUAGE_ENGLISH) == 19);

  // Rarest letters clamp to the maximum.
  assert(scorer.Score("zzzz", LANGUAGE_ENGLISH) == 100);

  // No scorable letters.
  assert(scorer.Score("", LANGUAGE_ENGLISH) == 1);
  assert(scorer.Score("123 !?", LANGUAGE_ENGLISH) == 1);
}

void TestCaseAndSeparatorsIgnored() {
  FrequencyDifficultyScorer scorer;

  assert(scorer.Score("Hello World", LANGUAGE_ENGLISH) == scorer.Score("helloworld", LANGUAGE_ENGLISH));
  assert(scorer.Score("JAZZ", LANGUAGE_ENGLISH) == scorer.Score("jazz", LANGUAGE_ENGLISH));
}

void TestRareLettersScoreHigher() {
  FrequencyDifficultyScorer scorer;

  assert(scorer.Score("jazz quiz", LANGUAGE_ENGLISH) > scorer.Score("the tea", LANGUAGE_ENGLISH));
}

void TestSwedishAlphabet() {
  FrequencyDifficultyScorer scorer;

  // 1000/18 * 0.7 + 100 * 0.3
  assert(scorer.Score("åå", LANGUAGE_SWEDISH) == 69);

  // Outside the English alphabet the letters are dropped.
  assert(scorer.Score("åå", LANGUAGE_ENGLISH) == 1);

  // Unknown languages fall back to English.
  assert(scorer.Score("aaaa", LANGUAGE_UNSPECIFIED) == 19);
}

void TestDeterministic() {
  FrequencyDifficultyScorer scorer;

  const int32_t first = scorer.Score("smörgås bord", LANGUAGE_SWEDISH);
  for (int i = 0; i < 10; ++i)
    assert(scorer.Score("smörgås bord", LANGUAGE_SWEDISH) == first);
}

void TestLabels() {
  assert(LabelFor(1) == DIFFICULTY_LABEL_VERY_EASY);
  assert(LabelFor(20) == DIFFICULTY_LABEL_VERY_EASY);
  assert(LabelFor(21) == DIFFICULTY_LABEL_EASY);
  assert(LabelFor(40) == DIFFICULTY_LABEL_EASY);
  assert(LabelFor(60) == DIFFICULTY_LABEL_MEDIUM);
  assert(LabelFor(80) == DIFFICULTY_LABEL_HARD);
  assert(LabelFor(81) == DIFFICULTY_LABEL_VERY_HARD);
  assert(std::string(phrase::scoring::LabelName(DIFFICULTY_LABEL_MEDIUM)) == "Medium");
}

void TestHintLadder() {
  const auto preview = PreviewFor(100);
  assert(preview.no_hints() == 100);
  assert(preview.level1() == 90);
  assert(preview.level2() == 70);
  assert(preview.level3() == 50);

  assert(ScoreForHints(15, 1) == 14);
  assert(ScoreForHints(10, 7) == 5);

  const auto floor = PreviewFor(1);
  assert(floor.no_hints() == 1);
  assert(floor.level3() == 1);
}

} // namespace

int main() {
  TestScoresStayInRange();
  TestKnownValues();
  TestCaseAndSeparatorsIgnored();
  TestRareLettersScoreHigher();
  TestSwedishAlphabet();
  TestDeterministic();
  TestLabels();
  TestHintLadder();

  std::cout << "phrase_manager_unit_difficulty_scorer: pass\n";
  return 0;
}
