#pragma once

#include "phrase/manager/v1.hpp"
#include "service_context.hpp"

namespace phrase::service {

/*
  Player-facing entry point. Composes the assignment engine, the
  completion tracker and the hint tracker and returns protocol messages.
*/
class PhraseService {
 public:
  explicit PhraseService(ServiceContext ctx);

  phrase::manager::v1::CreatePhraseResponse
  CreatePhrase(const phrase::manager::v1::CreatePhraseRequest& req);

  phrase::manager::v1::GetNextPhraseResponse
  GetNextPhrase(const phrase::manager::v1::GetNextPhraseRequest& req);

  phrase::manager::v1::CompletePhraseResponse
  CompletePhrase(const phrase::manager::v1::CompletePhraseRequest& req);

  phrase::manager::v1::SkipPhraseResponse
  SkipPhrase(const phrase::manager::v1::SkipPhraseRequest& req);

  phrase::manager::v1::UseHintResponse
  UseHint(const phrase::manager::v1::UseHintRequest& req);

  phrase::manager::v1::GetHintStatusResponse
  GetHintStatus(const phrase::manager::v1::GetHintStatusRequest& req);

 private:
  ServiceContext ctx_;
};

}
