#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace phrase::notify {
class PhraseNotifier;
}

namespace phrase::core {

struct CompletionInput {
  std::string player_id;
  std::string phrase_id;

  // 0 derives the score from the phrase difficulty and the highest hint
  // level the player revealed.
  int32_t  score              = 0;
  uint64_t completion_time_ms = 0;
};

struct RecordOutcome {
  // True when the pair was already recorded; nothing was written.
  bool no_op = false;

  // Score stored by this call, 0 for a no-op or a skip.
  int32_t score = 0;

  // Hint levels revealed before completion, 0 for a no-op or a skip.
  uint32_t hints_used = 0;
};

/*
  Per (player, phrase) history:

    UNSEEN -> SKIPPED -> COMPLETED
    UNSEEN -> COMPLETED

  COMPLETED is terminal. Duplicate reports are no-op successes and never
  bump usage_count twice.
*/
class CompletionTracker {
 public:
  CompletionTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::PhraseNotifier> notifier);

  RecordOutcome Complete(const CompletionInput& input);
  RecordOutcome Skip(const std::string& player_id, const std::string& phrase_id);

 private:
  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<notify::PhraseNotifier> notifier_;
};

} // namespace phrase::core
