#include "hint_tracker.hpp"

#include <algorithm>

#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scoring/difficulty_scorer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace phrase::core {

using observability::IntField;
using observability::StringField;

namespace {

db::model::PhraseRecord LoadPhrase(db::Repository& repository, db::Transaction& tx, const std::string& player_id, const std::string& phrase_id) {
  auto phrase = repository.GetPhrase(tx, phrase_id);
  if (!phrase) throw util::NotFound("phrase not found: " + phrase_id);
  if (!repository.GetPlayer(tx, player_id)) throw util::NotFound("player not found: " + player_id);
  return std::move(*phrase);
}

bool HasLevel(const std::vector<db::model::HintUsageRecord>& used, uint32_t level) {
  return std::any_of(used.begin(), used.end(), [&](const auto& r) { return r.hint_level == level; });
}

} // namespace

std::string HintContent(const std::string& content, const std::string& hint, uint32_t level) {
  const auto words = util::SplitWhitespace(content);

  switch (level) {
    case 1:
      return "This phrase has " + std::to_string(words.size()) + (words.size() == 1 ? " word" : " words");
    case 2:
      return hint;
    case 3: {
      std::u32string initials;
      for (const auto& word : words) {
        const auto decoded = util::DecodeUtf8(word);
        if (decoded.empty()) continue;
        if (!initials.empty()) initials.push_back(U' ');
        initials.push_back(util::ToUpper(decoded.front()));
      }
      return "First letters: " + util::EncodeUtf8(initials);
    }
    default:
      throw util::InvalidArgument("hint level must be 1, 2 or 3, got " + std::to_string(level));
  }
}

HintStatus BuildHintStatus(std::vector<db::model::HintUsageRecord> used, int32_t difficulty_score) {
  HintStatus status;
  for (const auto& record : used)
    status.max_level = std::max(status.max_level, record.hint_level);
  status.used = std::move(used);

  status.next_level      = status.max_level < db::model::kMaxHintLevel ? status.max_level + 1 : 0;
  status.hints_remaining = db::model::kMaxHintLevel - std::min(status.max_level, db::model::kMaxHintLevel);
  status.current_score   = scoring::ScoreForHints(difficulty_score, status.max_level);
  status.next_hint_score = status.CanUseNextHint() ? scoring::ScoreForHints(difficulty_score, status.next_level) : 0;
  status.score_preview   = scoring::PreviewFor(difficulty_score);
  return status;
}

HintTracker::HintTracker(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

HintReveal HintTracker::UseHint(const std::string& player_id, const std::string& phrase_id, uint32_t level) {
  util::RequireUuid(player_id, "player_id");
  util::RequireUuid(phrase_id, "phrase_id");
  if (level < 1 || level > db::model::kMaxHintLevel) {
    throw util::InvalidArgument("hint level must be 1, 2 or 3, got " + std::to_string(level));
  }

  auto reveal = db::RetryOnConflict("use hint", [&] {
    auto tx     = repository_->Begin();
    auto phrase = LoadPhrase(*repository_, *tx, player_id, phrase_id);

    if (repository_->HasCompletion(*tx, player_id, phrase_id)) {
      throw util::FailedPrecondition("phrase already completed: " + phrase_id);
    }

    auto       used = repository_->ListHintUsage(*tx, player_id, phrase_id);
    HintReveal result;
    result.level   = level;
    result.content = HintContent(phrase.content, phrase.hint, level);

    if (HasLevel(used, level)) {
      result.no_op = true;
    } else {
      if (level > 1 && !HasLevel(used, level - 1)) {
        throw util::FailedPrecondition("hints must be used in order, use level " + std::to_string(level - 1) + " first");
      }

      db::model::HintUsageRecord record;
      record.player_id  = player_id;
      record.phrase_id  = phrase_id;
      record.hint_level = level;
      record.used_at_ms = util::NowMillis();

      auto inserted = repository_->InsertHintUsage(*tx, record);
      if (inserted.code == db::ErrorCode::AlreadyExists) {
        result.no_op = true;
      } else {
        db::ThrowIfError(inserted, "record hint " + player_id + "/" + phrase_id);
        used.push_back(std::move(record));
        tx->Commit();
      }
    }

    result.status = BuildHintStatus(std::move(used), phrase.difficulty_score);
    return result;
  });

  observability::Metrics::Instance().RecordHistoryWrite("hint", reveal.no_op);
  PHRASE_LOG_DEBUG("hint revealed", {StringField("player_id", player_id), StringField("phrase_id", phrase_id), IntField("level", level),
                                     observability::BoolField("no_op", reveal.no_op)});
  return reveal;
}

HintStatus HintTracker::Status(const std::string& player_id, const std::string& phrase_id) {
  util::RequireUuid(player_id, "player_id");
  util::RequireUuid(phrase_id, "phrase_id");

  auto tx     = repository_->Begin();
  auto phrase = LoadPhrase(*repository_, *tx, player_id, phrase_id);
  return BuildHintStatus(repository_->ListHintUsage(*tx, player_id, phrase_id), phrase.difficulty_score);
}

} // namespace phrase::core
