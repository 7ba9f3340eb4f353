#include "assignment_engine.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/db/api/retry.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scoring/difficulty_scorer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace phrase::core {

using namespace phrase::manager::v1;
using observability::IntField;
using observability::StringField;

namespace {

// Concurrent deliveries to the same player collide on the memory backend.
constexpr int kMaxSelectAttempts = 5;

constexpr const char* kSystemSender = "System";

std::vector<std::string> DistinctTargets(const std::vector<std::string>& ids) {
  std::vector<std::string>        out;
  std::unordered_set<std::string> seen;
  for (const auto& id : ids)
    if (seen.insert(id).second) out.push_back(id);
  return out;
}

const char* TierName(SelectionTier tier) {
  switch (tier) {
    case SELECTION_TIER_TARGETED:
      return "targeted";
    case SELECTION_TIER_GLOBAL:
      return "global";
    case SELECTION_TIER_SKIP_FALLBACK:
      return "skip_fallback";
    default:
      return "none";
  }
}

} // namespace

SelectionPolicy SelectionPolicy::FromConfig(const phrase::runtime::config::SelectionConfig& config) {
  SelectionPolicy policy;
  if (config.beginner_threshold() > 0) policy.beginner_threshold = config.beginner_threshold();
  if (config.beginner_ceiling() > 0) policy.beginner_ceiling = config.beginner_ceiling();
  if (config.default_batch_size() > 0) policy.default_batch_size = config.default_batch_size();
  if (config.max_batch_size() > 0) policy.max_batch_size = config.max_batch_size();
  if (config.default_priority() > 0) policy.default_priority = config.default_priority();
  return policy;
}

int32_t SelectionPolicy::EffectiveCeiling(int32_t max_difficulty) const {
  if (max_difficulty < beginner_threshold) return beginner_ceiling;
  return std::min(max_difficulty, scoring::kMaxScore);
}

uint32_t SelectionPolicy::BatchSize(uint32_t requested) const {
  const uint32_t size = requested == 0 ? default_batch_size : requested;
  return std::clamp<uint32_t>(size, 1, max_batch_size);
}

AssignmentEngine::AssignmentEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<scoring::DifficultyScorer> scorer,
                                   std::shared_ptr<notify::PhraseNotifier> notifier, validation::PhraseValidator validator,
                                   SelectionPolicy policy)
    : repository_(std::move(repository)),
      scorer_(std::move(scorer)),
      notifier_(std::move(notifier)),
      validator_(std::move(validator)),
      policy_(policy) {
}

// ------------------------------------------------------------------
// Creation
// ------------------------------------------------------------------

int32_t AssignmentEngine::ScoreOrDefault(const std::string& content, Language language) const {
  try {
    return std::clamp(scorer_->Score(content, language), scoring::kMinScore, scoring::kMaxScore);
  } catch (const std::exception& e) {
    PHRASE_LOG_WARN("difficulty scoring failed, using minimum", {StringField("error", e.what())});
    return scoring::kMinScore;
  }
}

CreatedPhrase AssignmentEngine::Create(const NewPhrase& request) {
  if (!Language_IsValid(request.language)) throw util::InvalidArgument("unknown language " + std::to_string(request.language));
  if (!PhraseType_IsValid(request.phrase_type)) throw util::InvalidArgument("unknown phrase type " + std::to_string(request.phrase_type));

  const auto validated = validator_.Validate(request.content, request.hint);
  const auto targets   = DistinctTargets(request.target_ids);
  if (!request.is_global && targets.empty()) throw util::InvalidArgument("phrase must be global or have at least one target");

  if (!request.sender_id.empty()) util::RequireUuid(request.sender_id, "sender_id");
  for (const auto& target : targets) {
    util::RequireUuid(target, "target_id");
    if (target == request.sender_id) throw util::InvalidArgument("Cannot target yourself");
  }

  const Language language = request.language == LANGUAGE_UNSPECIFIED ? LANGUAGE_ENGLISH : request.language;

  CreatedPhrase created;
  auto&         record = created.phrase;
  record.id            = util::NewId();
  record.content       = validated.content;
  record.hint          = validated.hint;
  record.language      = language;

  // Scored once here and never again.
  record.difficulty_score = ScoreOrDefault(validated.content, language);
  record.is_global        = request.is_global;
  record.is_approved      = true;
  record.contributor_name = request.contributor_name;
  record.phrase_type      = request.phrase_type;
  if (record.phrase_type == PHRASE_TYPE_UNSPECIFIED) record.phrase_type = request.is_global ? PHRASE_TYPE_GLOBAL : PHRASE_TYPE_CUSTOM;
  record.created_at_ms = util::NowMillis();

  std::optional<db::model::PlayerRecord> sender;
  created.target_count = db::RetryOnConflict("create phrase", [&] {
    auto tx = repository_->Begin();

    sender.reset();
    if (!request.sender_id.empty()) {
      sender = repository_->GetPlayer(*tx, request.sender_id);
      if (!sender) throw util::NotFound("sender not found: " + request.sender_id);
      record.created_by_player_id = sender->id;
    }

    for (const auto& target : targets) {
      if (!repository_->GetPlayer(*tx, target)) throw util::NotFound("target player not found: " + target);
    }

    auto count = repository_->CreatePhraseWithTargets(*tx, record, targets, policy_.default_priority);
    tx->Commit();
    return count;
  });

  if (!record.contributor_name.empty()) {
    created.sender_name = record.contributor_name;
  } else if (sender && !sender->name.empty()) {
    created.sender_name = sender->name;
  } else {
    created.sender_name = kSystemSender;
  }

  observability::Metrics::Instance().RecordPhraseCreated(record.is_global, created.target_count);
  PHRASE_LOG_INFO("phrase created", {StringField("phrase_id", record.id), IntField("difficulty", record.difficulty_score),
                                     observability::BoolField("global", record.is_global), IntField("targets", created.target_count)});

  Notify(created, targets);
  return created;
}

void AssignmentEngine::Notify(const CreatedPhrase& created, const std::vector<std::string>& targets) {
  if (!notifier_) return;

  notify::PhraseAvailableEvent event;
  event.phrase_id     = created.phrase.id;
  event.sender_name   = created.sender_name;
  event.created_at_ms = created.phrase.created_at_ms;

  auto send = [&](std::optional<std::string> target) {
    event.target_player_id = std::move(target);
    try {
      notifier_->PhraseAvailable(event);
    } catch (const std::exception& e) {
      PHRASE_LOG_WARN("phrase notification failed", {StringField("phrase_id", event.phrase_id), StringField("error", e.what())});
    }
  };

  for (const auto& target : targets)
    send(target);
  if (created.phrase.is_global) send(std::nullopt);
}

// ------------------------------------------------------------------
// Selection
// ------------------------------------------------------------------

std::string ResolveSenderName(db::Repository& repository, db::Transaction& tx, const db::model::PhraseRecord& phrase) {
  if (!phrase.contributor_name.empty()) return phrase.contributor_name;
  if (phrase.created_by_player_id) {
    auto player = repository.GetPlayer(tx, *phrase.created_by_player_id);
    if (player && !player->name.empty()) return player->name;
  }
  return kSystemSender;
}

std::optional<Selection> AssignmentEngine::SelectTargeted(const std::string& player_id) {
  return db::RetryOnConflict(
      "targeted delivery",
      [&]() -> std::optional<Selection> {
        auto tx = repository_->Begin();

        auto assignment = repository_->NextTargetedAssignment(*tx, player_id);
        if (!assignment) return std::nullopt;

        auto phrase = repository_->GetPhrase(*tx, assignment->phrase_id);
        if (!phrase) throw util::StorageError("assignment references missing phrase " + assignment->phrase_id, false);

        db::ThrowIfError(repository_->MarkAssignmentDelivered(*tx, assignment->phrase_id, player_id, util::NowMillis()),
                         "mark delivered " + assignment->phrase_id);

        Selection selection;
        selection.tier = SELECTION_TIER_TARGETED;
        selection.phrases.push_back({*phrase, ResolveSenderName(*repository_, *tx, *phrase)});

        tx->Commit();
        return selection;
      },
      kMaxSelectAttempts);
}

Selection AssignmentEngine::SelectNext(const std::string& player_id, uint32_t max_results, int32_t max_difficulty) {
  util::RequireUuid(player_id, "player_id");
  if (max_difficulty < 0) throw util::InvalidArgument("max_difficulty must not be negative");

  Selection selection;
  {
    auto tx     = repository_->Begin();
    auto player = repository_->GetPlayer(*tx, player_id);
    if (!player) throw util::NotFound("player not found: " + player_id);
    if (max_difficulty <= 0) max_difficulty = player->max_difficulty;
  }

  if (auto targeted = SelectTargeted(player_id)) {
    selection = std::move(*targeted);
  } else {
    const uint32_t batch   = policy_.BatchSize(max_results);
    const int32_t  ceiling = policy_.EffectiveCeiling(max_difficulty);

    auto tx = repository_->Begin();

    auto phrases = repository_->EligibleGlobalPhrases(*tx, player_id, ceiling, batch);
    if (!phrases.empty()) {
      selection.tier = SELECTION_TIER_GLOBAL;
    } else {
      phrases = repository_->SkipFallbackPhrases(*tx, player_id, batch);
      if (!phrases.empty()) selection.tier = SELECTION_TIER_SKIP_FALLBACK;
    }

    for (auto& phrase : phrases) {
      auto name = ResolveSenderName(*repository_, *tx, phrase);
      selection.phrases.push_back({std::move(phrase), std::move(name)});
    }
  }

  observability::Metrics::Instance().RecordSelection(TierName(selection.tier));
  PHRASE_LOG_DEBUG("phrase selection", {StringField("player_id", player_id), StringField("tier", TierName(selection.tier)),
                                        IntField("count", static_cast<int64_t>(selection.phrases.size()))});
  return selection;
}

} // namespace phrase::core
