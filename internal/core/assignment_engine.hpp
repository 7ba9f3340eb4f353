#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/validation/phrase_validator.hpp"
#include "phrase/manager/v1.hpp"

namespace phrase::scoring {
class DifficultyScorer;
}
namespace phrase::notify {
class PhraseNotifier;
}

namespace phrase::core {

struct SelectionPolicy {
  // Players whose ceiling is below the threshold see the global pool up
  // to beginner_ceiling instead.
  int32_t beginner_threshold = 50;
  int32_t beginner_ceiling   = 75;

  uint32_t default_batch_size = 1;
  uint32_t max_batch_size     = 25;

  // Priority given to new assignments. Lower is delivered sooner.
  int32_t default_priority = 1;

  // Zero fields keep the defaults above.
  static SelectionPolicy FromConfig(const phrase::runtime::config::SelectionConfig& config);

  int32_t  EffectiveCeiling(int32_t max_difficulty) const;
  uint32_t BatchSize(uint32_t requested) const;
};

struct NewPhrase {
  std::string                   content;
  std::string                   hint;
  phrase::manager::v1::Language language = phrase::manager::v1::LANGUAGE_ENGLISH;

  // Empty for external contributions.
  std::string              sender_id;
  std::vector<std::string> target_ids;
  bool                     is_global = false;

  phrase::manager::v1::PhraseType phrase_type = phrase::manager::v1::PHRASE_TYPE_UNSPECIFIED;
  std::string                     contributor_name;
};

struct CreatedPhrase {
  db::model::PhraseRecord phrase;
  std::string             sender_name;
  uint32_t                target_count = 0;
};

struct SelectedPhrase {
  db::model::PhraseRecord phrase;
  std::string             sender_name;
};

struct Selection {
  phrase::manager::v1::SelectionTier tier = phrase::manager::v1::SELECTION_TIER_UNSPECIFIED;
  std::vector<SelectedPhrase>        phrases;

  bool Available() const {
    return !phrases.empty();
  }
};

// contributor_name, else the author's player name, else "System".
std::string ResolveSenderName(db::Repository& repository, db::Transaction& tx, const db::model::PhraseRecord& phrase);

/*
  Owns phrase and assignment creation, and picks what a player sees next.

  Selection order:
    1. oldest undelivered targeted assignment (no difficulty gate)
    2. random approved global phrases under the player's ceiling
    3. random phrases from the player's own skip bucket
*/
class AssignmentEngine {
 public:
  AssignmentEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<scoring::DifficultyScorer> scorer,
                   std::shared_ptr<notify::PhraseNotifier> notifier, validation::PhraseValidator validator = validation::PhraseValidator(),
                   SelectionPolicy policy = {});

  // Validates, scores and stores the phrase with all its assignments in a
  // single transaction. Notifications go out after commit.
  CreatedPhrase Create(const NewPhrase& request);

  // max_difficulty > 0 overrides the stored player ceiling; max_results == 0
  // selects the default batch size.
  Selection SelectNext(const std::string& player_id, uint32_t max_results = 0, int32_t max_difficulty = 0);

  const SelectionPolicy& Policy() const {
    return policy_;
  }

 private:
  int32_t ScoreOrDefault(const std::string& content, phrase::manager::v1::Language language) const;

  std::optional<Selection> SelectTargeted(const std::string& player_id);

  void Notify(const CreatedPhrase& created, const std::vector<std::string>& targets);

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<scoring::DifficultyScorer> scorer_;
  std::shared_ptr<notify::PhraseNotifier>    notifier_;
  validation::PhraseValidator                validator_;
  SelectionPolicy                            policy_;
};

} // namespace phrase::core
