#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "phrase/manager/v1.hpp"

namespace phrase::core {

struct HintStatus {
  // Ordered by level.
  std::vector<db::model::HintUsageRecord> used;

  // Highest level revealed so far, 0 when none.
  uint32_t max_level = 0;

  // 0 once every level is revealed.
  uint32_t next_level      = 1;
  uint32_t hints_remaining = db::model::kMaxHintLevel;

  int32_t current_score = 0;
  // Score if the next level is revealed, 0 when there is none.
  int32_t                           next_hint_score = 0;
  phrase::manager::v1::ScorePreview score_preview;

  bool CanUseNextHint() const {
    return next_level != 0;
  }
};

struct HintReveal {
  uint32_t    level = 0;
  std::string content;

  // True when the level had already been revealed; nothing was written.
  bool       no_op = false;
  HintStatus status;
};

/*
  Level 1: "This phrase has N word(s)"
  Level 2: the hint stored with the phrase
  Level 3: "First letters: " and the upper-cased initial of each word
*/
std::string HintContent(const std::string& content, const std::string& hint, uint32_t level);

/*
  Progressive hints per (player, phrase).

  Levels are revealed in order 1, 2, 3. Asking again for a revealed level
  returns it without writing. Completion reads the highest revealed level
  to derive the score, so hints are refused once the pair is completed.
*/
class HintTracker {
 public:
  explicit HintTracker(std::shared_ptr<db::Repository> repository);

  HintReveal UseHint(const std::string& player_id, const std::string& phrase_id, uint32_t level);
  HintStatus Status(const std::string& player_id, const std::string& phrase_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

// Status of the pair computed from its recorded hints.
HintStatus BuildHintStatus(std::vector<db::model::HintUsageRecord> used, int32_t difficulty_score);

} // namespace phrase::core
