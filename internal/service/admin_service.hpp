#pragma once

#include "phrase/manager/v1.hpp"
#include "service_context.hpp"

namespace phrase::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  phrase::manager::v1::ApprovePhraseResponse
  ApprovePhrase(const phrase::manager::v1::ApprovePhraseRequest& req);

  phrase::manager::v1::ListGlobalPhrasesResponse
  ListGlobalPhrases(const phrase::manager::v1::ListGlobalPhrasesRequest& req);

  phrase::manager::v1::GetPhraseStatsResponse
  GetPhraseStats(const phrase::manager::v1::GetPhraseStatsRequest& req);

  // Scores without persisting anything.
  phrase::manager::v1::AnalyzeDifficultyResponse
  AnalyzeDifficulty(const phrase::manager::v1::AnalyzeDifficultyRequest& req);

  void SyncPlayer(const phrase::manager::v1::SyncPlayerRequest& req);

 private:
  ServiceContext ctx_;
};

}
