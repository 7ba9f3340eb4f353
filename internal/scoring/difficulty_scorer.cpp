#include "difficulty_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

#include "internal/util/text.hpp"

namespace phrase::scoring {

using namespace phrase::manager::v1;

namespace {

// Occurrences per 1000 letters.
constexpr int kEnglishFrequencies[26] = {82, 15, 28, 43, 127, 22, 20, 61, 70, 2, 8, 40, 24,
                                         67, 75, 19, 1,  60, 63,  91, 28, 10, 24, 2, 20, 1};

constexpr int kSwedishFrequencies[26] = {94, 13, 15, 45, 101, 20, 28, 21, 58, 6, 32, 52, 35,
                                         89, 44, 18, 0,  84, 68,  77, 18, 24, 1,  1, 7,  1};

constexpr char32_t kARing      = 0xE5;
constexpr char32_t kADiaeresis = 0xE4;
constexpr char32_t kODiaeresis = 0xF6;

int Frequency(char32_t c, Language language) {
  const bool swedish = language == LANGUAGE_SWEDISH;
  if (c >= U'a' && c <= U'z') {
    return swedish ? kSwedishFrequencies[c - U'a'] : kEnglishFrequencies[c - U'a'];
  }
  if (swedish) {
    if (c == kARing || c == kADiaeresis) return 18;
    if (c == kODiaeresis) return 13;
  }
  return 0;
}

std::u32string Normalize(std::string_view content, Language language) {
  std::u32string out;
  for (char32_t c : util::DecodeUtf8(util::ToLowerUtf8(content))) {
    const bool latin   = c >= U'a' && c <= U'z';
    const bool swedish = language == LANGUAGE_SWEDISH && (c == kARing || c == kADiaeresis || c == kODiaeresis);
    if (latin || swedish) out.push_back(c);
  }
  return out;
}

double Rarity(const std::u32string& text, Language language) {
  double total = 0.0;
  for (char32_t c : text) {
    int freq = Frequency(c, language);
    if (freq <= 0) freq = 1;
    total += 1000.0 / freq;
  }
  return total / static_cast<double>(text.size());
}

double Complexity(const std::u32string& text) {
  if (text.size() < 2) return 0.0;

  std::set<std::pair<char32_t, char32_t>> unique;
  for (size_t i = 0; i + 1 < text.size(); ++i)
    unique.emplace(text[i], text[i + 1]);

  return static_cast<double>(unique.size()) / static_cast<double>(text.size() - 1) * 100.0;
}

int32_t Clamp(long value) {
  return static_cast<int32_t>(std::clamp<long>(value, kMinScore, kMaxScore));
}

} // namespace

int32_t FrequencyDifficultyScorer::Score(std::string_view content, Language language) const {
  if (language != LANGUAGE_SWEDISH) language = LANGUAGE_ENGLISH;

  const auto text = Normalize(content, language);
  if (text.empty()) return kMinScore;

  const double combined = Rarity(text, language) * 0.7 + Complexity(text) * 0.3;
  return Clamp(std::lround(combined));
}

DifficultyLabel LabelFor(int32_t score) {
  if (score <= 20) return DIFFICULTY_LABEL_VERY_EASY;
  if (score <= 40) return DIFFICULTY_LABEL_EASY;
  if (score <= 60) return DIFFICULTY_LABEL_MEDIUM;
  if (score <= 80) return DIFFICULTY_LABEL_HARD;
  return DIFFICULTY_LABEL_VERY_HARD;
}

const char* LabelName(DifficultyLabel label) {
  switch (label) {
    case DIFFICULTY_LABEL_VERY_EASY:
      return "Very Easy";
    case DIFFICULTY_LABEL_EASY:
      return "Easy";
    case DIFFICULTY_LABEL_MEDIUM:
      return "Medium";
    case DIFFICULTY_LABEL_HARD:
      return "Hard";
    case DIFFICULTY_LABEL_VERY_HARD:
      return "Very Hard";
    default:
      return "Unknown";
  }
}

int32_t ScoreForHints(int32_t base_score, uint32_t hints_used) {
  double factor = 1.0;
  if (hints_used >= 3) {
    factor = 0.5;
  } else if (hints_used == 2) {
    factor = 0.7;
  } else if (hints_used == 1) {
    factor = 0.9;
  }
  return std::max<int32_t>(kMinScore, static_cast<int32_t>(std::lround(base_score * factor)));
}

ScorePreview PreviewFor(int32_t base_score) {
  ScorePreview preview;
  preview.set_no_hints(ScoreForHints(base_score, 0));
  preview.set_level1(ScoreForHints(base_score, 1));
  preview.set_level2(ScoreForHints(base_score, 2));
  preview.set_level3(ScoreForHints(base_score, 3));
  return preview;
}

} // namespace phrase::scoring
