#include "phrase_service.hpp"

#include "internal/core/assignment_engine.hpp"
#include "internal/core/completion_tracker.hpp"
#include "internal/core/hint_tracker.hpp"
#include "internal/scoring/difficulty_scorer.hpp"
#include "phrase_convert.hpp"
#include "rpc_observer.hpp"

namespace phrase::service {

using namespace phrase::manager::v1;

PhraseService::PhraseService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreatePhraseResponse PhraseService::CreatePhrase(const CreatePhraseRequest& req) {
  return ObserveRpc("PhraseService.CreatePhrase", "sender.id", req.sender_id().value(), [&] {
    core::NewPhrase request;
    request.content          = req.content();
    request.hint             = req.hint();
    request.language         = req.language();
    request.sender_id        = req.sender_id().value();
    request.is_global        = req.is_global();
    request.phrase_type      = req.phrase_type();
    request.contributor_name = req.contributor_name();
    for (const auto& target : req.target_ids())
      request.target_ids.push_back(target.value());

    const auto created = ctx_.engine->Create(request);

    CreatePhraseResponse resp;
    *resp.mutable_phrase() = ToProto(created.phrase, created.sender_name);
    resp.set_target_count(created.target_count);
    return resp;
  });
}

GetNextPhraseResponse PhraseService::GetNextPhrase(const GetNextPhraseRequest& req) {
  return ObserveRpc("PhraseService.GetNextPhrase", "player.id", req.player_id().value(), [&] {
    const auto selection = ctx_.engine->SelectNext(req.player_id().value(), req.max_results(), req.max_difficulty());

    GetNextPhraseResponse resp;
    resp.set_available(selection.Available());
    resp.set_tier(selection.tier);
    for (const auto& selected : selection.phrases) {
      auto* out                     = resp.add_phrases();
      *out->mutable_phrase()        = ToProto(selected.phrase, selected.sender_name);
      *out->mutable_score_preview() = scoring::PreviewFor(selected.phrase.difficulty_score);
    }
    return resp;
  });
}

CompletePhraseResponse PhraseService::CompletePhrase(const CompletePhraseRequest& req) {
  return ObserveRpc("PhraseService.CompletePhrase", "phrase.id", req.phrase_id().value(), [&] {
    core::CompletionInput input;
    input.player_id          = req.player_id().value();
    input.phrase_id          = req.phrase_id().value();
    input.score              = req.score();
    input.completion_time_ms = req.completion_time_ms();

    const auto outcome = ctx_.tracker->Complete(input);

    CompletePhraseResponse resp;
    resp.set_no_op(outcome.no_op);
    resp.set_score(outcome.score);
    resp.set_hints_used(outcome.hints_used);
    return resp;
  });
}

SkipPhraseResponse PhraseService::SkipPhrase(const SkipPhraseRequest& req) {
  return ObserveRpc("PhraseService.SkipPhrase", "phrase.id", req.phrase_id().value(), [&] {
    const auto outcome = ctx_.tracker->Skip(req.player_id().value(), req.phrase_id().value());

    SkipPhraseResponse resp;
    resp.set_no_op(outcome.no_op);
    return resp;
  });
}

UseHintResponse PhraseService::UseHint(const UseHintRequest& req) {
  return ObserveRpc("PhraseService.UseHint", "phrase.id", req.phrase_id().value(), [&] {
    const auto reveal = ctx_.hints->UseHint(req.player_id().value(), req.phrase_id().value(), req.level());

    UseHintResponse resp;
    resp.set_level(reveal.level);
    resp.set_hint_content(reveal.content);
    resp.set_no_op(reveal.no_op);
    *resp.mutable_status() = ToProto(reveal.status);
    return resp;
  });
}

GetHintStatusResponse PhraseService::GetHintStatus(const GetHintStatusRequest& req) {
  return ObserveRpc("PhraseService.GetHintStatus", "phrase.id", req.phrase_id().value(), [&] {
    GetHintStatusResponse resp;
    *resp.mutable_status() = ToProto(ctx_.hints->Status(req.player_id().value(), req.phrase_id().value()));
    return resp;
  });
}

} // namespace phrase::service
