#pragma once

#include <cstdint>
#include <string_view>

#include "phrase/manager/v1.hpp"

namespace phrase::scoring {

constexpr int32_t kMinScore = 1;
constexpr int32_t kMaxScore = 100;

/*
  Pure difficulty function: Score(text, language) in [1, 100].
  Implementations must be deterministic; callers treat a throw as score 1.
*/
class DifficultyScorer {
 public:
  virtual ~DifficultyScorer() = default;

  virtual int32_t Score(std::string_view content, phrase::manager::v1::Language language) const = 0;
};

/*
  Letter rarity (70%) plus bigram variety (30%).

  Rarity is the mean of 1000 / frequency-per-1000 over the letters of the
  language alphabet. Variety is unique bigrams over total bigrams, scaled
  to 100.
*/
class FrequencyDifficultyScorer final : public DifficultyScorer {
 public:
  int32_t Score(std::string_view content, phrase::manager::v1::Language language) const override;
};

phrase::manager::v1::DifficultyLabel LabelFor(int32_t score);
const char*                          LabelName(phrase::manager::v1::DifficultyLabel label);

// Points for 0..3 hints used: 100%, 90%, 70%, 50% of the base, each at least 1.
phrase::manager::v1::ScorePreview PreviewFor(int32_t base_score);
int32_t                           ScoreForHints(int32_t base_score, uint32_t hints_used);

} // namespace phrase::scoring
