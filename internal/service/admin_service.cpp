#include "admin_service.hpp"

#include <algorithm>

#include "internal/core/assignment_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/api/retry.hpp"
#include "internal/scoring/difficulty_scorer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "phrase_convert.hpp"
#include "rpc_observer.hpp"

namespace phrase::service {

using namespace phrase::manager::v1;

namespace {

constexpr uint32_t kDefaultListLimit = 50;
constexpr uint32_t kMaxListLimit     = 100;

db::model::GlobalPhraseFilter ToFilter(const ListGlobalPhrasesRequest& req) {
  db::model::GlobalPhraseFilter filter;
  if (req.min_difficulty() > 0) filter.min_difficulty = req.min_difficulty();
  if (req.max_difficulty() > 0) filter.max_difficulty = req.max_difficulty();
  if (filter.min_difficulty > filter.max_difficulty) {
    throw util::InvalidArgument("min_difficulty " + std::to_string(filter.min_difficulty) + " exceeds max_difficulty " +
                                std::to_string(filter.max_difficulty));
  }

  switch (req.approval()) {
    case APPROVAL_FILTER_APPROVED:
      filter.approved = true;
      break;
    case APPROVAL_FILTER_PENDING:
      filter.approved = false;
      break;
    case APPROVAL_FILTER_ANY:
      filter.approved.reset();
      break;
    default:
      throw util::InvalidArgument("unknown approval filter " + std::to_string(req.approval()));
  }
  return filter;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ApprovePhraseResponse AdminService::ApprovePhrase(const ApprovePhraseRequest& req) {
  return ObserveRpc("AdminService.ApprovePhrase", "phrase.id", req.id().value(), [&] {
    util::RequireUuid(req.id().value(), "id");

    return db::RetryOnConflict("approve phrase", [&] {
      auto tx = ctx_.repository->Begin();
      db::ThrowIfError(ctx_.repository->SetPhraseApproved(*tx, req.id().value(), req.approved()), "approve phrase " + req.id().value());

      auto record = ctx_.repository->GetPhrase(*tx, req.id().value());
      if (!record) throw util::NotFound("phrase not found: " + req.id().value());

      ApprovePhraseResponse resp;
      *resp.mutable_phrase() = ToProto(*record, core::ResolveSenderName(*ctx_.repository, *tx, *record));
      tx->Commit();
      return resp;
    });
  });
}

ListGlobalPhrasesResponse AdminService::ListGlobalPhrases(const ListGlobalPhrasesRequest& req) {
  return ObserveRpc("AdminService.ListGlobalPhrases", [&] {
    const auto     filter = ToFilter(req);
    const uint32_t limit  = req.limit() == 0 ? kDefaultListLimit : std::min(req.limit(), kMaxListLimit);

    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.repository->ListGlobalPhrases(*tx, filter, limit, req.offset());

    ListGlobalPhrasesResponse resp;
    resp.set_total_count(ctx_.repository->CountGlobalPhrases(*tx, filter));
    for (const auto& record : records)
      *resp.add_phrases() = ToProto(record, core::ResolveSenderName(*ctx_.repository, *tx, record));
    return resp;
  });
}

GetPhraseStatsResponse AdminService::GetPhraseStats(const GetPhraseStatsRequest&) {
  return ObserveRpc("AdminService.GetPhraseStats", [&] {
    auto       tx    = ctx_.repository->Begin();
    const auto stats = ctx_.repository->GetPhraseStats(*tx);

    GetPhraseStatsResponse resp;
    resp.set_total_phrases(stats.total_phrases);
    resp.set_global_phrases(stats.global_phrases);
    resp.set_targeted_phrases(stats.targeted_phrases);
    resp.set_avg_usage(stats.avg_usage);
    resp.set_max_usage(stats.max_usage);
    return resp;
  });
}

AnalyzeDifficultyResponse AdminService::AnalyzeDifficulty(const AnalyzeDifficultyRequest& req) {
  return ObserveRpc("AdminService.AnalyzeDifficulty", [&] {
    if (!Language_IsValid(req.language())) throw util::InvalidArgument("unknown language " + std::to_string(req.language()));

    const auto    language = req.language() == LANGUAGE_UNSPECIFIED ? LANGUAGE_ENGLISH : req.language();
    const int32_t score    = ctx_.scorer->Score(req.content(), language);

    AnalyzeDifficultyResponse resp;
    resp.set_score(score);
    resp.set_label(scoring::LabelFor(score));
    *resp.mutable_score_preview() = scoring::PreviewFor(score);
    return resp;
  });
}

void AdminService::SyncPlayer(const SyncPlayerRequest& req) {
  ObserveRpc("AdminService.SyncPlayer", "player.id", req.id().value(), [&] {
    util::RequireUuid(req.id().value(), "id");
    if (req.max_difficulty() < 0 || req.max_difficulty() > scoring::kMaxScore) {
      throw util::InvalidArgument("max_difficulty must be within [0, 100]");
    }

    db::model::PlayerRecord record;
    record.id             = req.id().value();
    record.name           = req.name();
    record.skill_level    = req.skill_level();
    record.max_difficulty = req.max_difficulty();
    record.updated_at_ms  = util::NowMillis();

    db::RetryOnConflict("sync player", [&] {
      auto tx = ctx_.repository->Begin();
      db::ThrowIfError(ctx_.repository->UpsertPlayer(*tx, record), "sync player " + record.id);
      tx->Commit();
    });
  });
}

} // namespace phrase::service
