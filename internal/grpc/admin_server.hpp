#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "phrase/manager/services/v1/phrase_admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace phrase::grpc {

class AdminServer final : public phrase::manager::v1::PhraseAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<phrase::service::AdminService> svc);

  ::grpc::Status ApprovePhrase(::grpc::ServerContext*,
                               const phrase::manager::v1::ApprovePhraseRequest*,
                               phrase::manager::v1::ApprovePhraseResponse*) override;

  ::grpc::Status ListGlobalPhrases(::grpc::ServerContext*,
                                   const phrase::manager::v1::ListGlobalPhrasesRequest*,
                                   phrase::manager::v1::ListGlobalPhrasesResponse*) override;

  ::grpc::Status GetPhraseStats(::grpc::ServerContext*,
                                const phrase::manager::v1::GetPhraseStatsRequest*,
                                phrase::manager::v1::GetPhraseStatsResponse*) override;

  ::grpc::Status AnalyzeDifficulty(::grpc::ServerContext*,
                                   const phrase::manager::v1::AnalyzeDifficultyRequest*,
                                   phrase::manager::v1::AnalyzeDifficultyResponse*) override;

  ::grpc::Status SyncPlayer(::grpc::ServerContext*,
                            const phrase::manager::v1::SyncPlayerRequest*,
                            phrase::manager::v1::SyncPlayerResponse*) override;

 private:
  std::shared_ptr<phrase::service::AdminService> service_;
};

}
