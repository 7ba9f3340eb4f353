#include "completion_tracker.hpp"

#include <algorithm>

#include "internal/db/api/retry.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scoring/difficulty_scorer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace phrase::core {

using observability::IntField;
using observability::StringField;

namespace {

struct Loaded {
  db::model::PhraseRecord phrase;
  db::model::PlayerRecord player;
};

Loaded LoadPair(db::Repository& repository, db::Transaction& tx, const std::string& player_id, const std::string& phrase_id) {
  auto phrase = repository.GetPhrase(tx, phrase_id);
  if (!phrase) throw util::NotFound("phrase not found: " + phrase_id);

  auto player = repository.GetPlayer(tx, player_id);
  if (!player) throw util::NotFound("player not found: " + player_id);

  return {std::move(*phrase), std::move(*player)};
}

} // namespace

CompletionTracker::CompletionTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::PhraseNotifier> notifier)
    : repository_(std::move(repository)), notifier_(std::move(notifier)) {
}

RecordOutcome CompletionTracker::Complete(const CompletionInput& input) {
  util::RequireUuid(input.player_id, "player_id");
  util::RequireUuid(input.phrase_id, "phrase_id");
  if (input.score < 0) throw util::InvalidArgument("score must not be negative");

  std::string player_name;
  auto        outcome = db::RetryOnConflict("record completion", [&] {
    auto tx     = repository_->Begin();
    auto loaded = LoadPair(*repository_, *tx, input.player_id, input.phrase_id);

    uint32_t hints_used = 0;
    for (const auto& hint : repository_->ListHintUsage(*tx, input.player_id, input.phrase_id))
      hints_used = std::max(hints_used, hint.hint_level);

    db::model::CompletionRecord record;
    record.player_id          = input.player_id;
    record.phrase_id          = input.phrase_id;
    record.score              = input.score > 0 ? input.score : scoring::ScoreForHints(loaded.phrase.difficulty_score, hints_used);
    record.hints_used         = hints_used;
    record.completion_time_ms = input.completion_time_ms;
    record.completed_at_ms    = util::NowMillis();

    RecordOutcome result;
    if (!repository_->RecordCompletion(*tx, record)) {
      result.no_op = true;
      return result;
    }

    db::ThrowIfError(repository_->IncrementUsageCount(*tx, input.phrase_id), "increment usage " + input.phrase_id);
    tx->Commit();

    player_name       = loaded.player.name;
    result.score      = record.score;
    result.hints_used = hints_used;
    return result;
  });

  observability::Metrics::Instance().RecordHistoryWrite("completion", outcome.no_op);
  if (outcome.no_op) {
    PHRASE_LOG_DEBUG("completion already recorded", {StringField("player_id", input.player_id), StringField("phrase_id", input.phrase_id)});
    return outcome;
  }

  PHRASE_LOG_INFO("phrase completed", {StringField("player_id", input.player_id), StringField("phrase_id", input.phrase_id),
                                       IntField("score", outcome.score), IntField("hints_used", outcome.hints_used)});

  if (notifier_) {
    notify::PhraseCompletedEvent event;
    event.phrase_id   = input.phrase_id;
    event.player_id   = input.player_id;
    event.player_name = player_name;
    event.score       = outcome.score;
    event.hints_used  = outcome.hints_used;
    try {
      notifier_->PhraseCompleted(event);
    } catch (const std::exception& e) {
      PHRASE_LOG_WARN("completion notification failed", {StringField("phrase_id", input.phrase_id), StringField("error", e.what())});
    }
  }
  return outcome;
}

RecordOutcome CompletionTracker::Skip(const std::string& player_id, const std::string& phrase_id) {
  util::RequireUuid(player_id, "player_id");
  util::RequireUuid(phrase_id, "phrase_id");

  auto outcome = db::RetryOnConflict("record skip", [&] {
    auto tx = repository_->Begin();
    LoadPair(*repository_, *tx, player_id, phrase_id);

    db::model::SkipRecord record;
    record.player_id     = player_id;
    record.phrase_id     = phrase_id;
    record.skipped_at_ms = util::NowMillis();

    RecordOutcome result;
    result.no_op = !repository_->RecordSkip(*tx, record);
    if (!result.no_op) {
      db::ThrowIfError(repository_->IncrementUsageCount(*tx, phrase_id), "increment usage " + phrase_id);
    }

    // A duplicate skip may still have delivered a pending assignment.
    tx->Commit();
    return result;
  });

  observability::Metrics::Instance().RecordHistoryWrite("skip", outcome.no_op);
  PHRASE_LOG_DEBUG("phrase skipped",
                   {StringField("player_id", player_id), StringField("phrase_id", phrase_id), observability::BoolField("no_op", outcome.no_op)});
  return outcome;
}

} // namespace phrase::core
