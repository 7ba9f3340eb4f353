#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "phrase/manager/services/v1/phrase_service.grpc.pb.h"
#include "internal/service/phrase_service.hpp"

namespace phrase::grpc {

class PhraseServer final : public phrase::manager::v1::PhraseService::Service {
 public:
  explicit PhraseServer(std::shared_ptr<phrase::service::PhraseService> svc);

  ::grpc::Status CreatePhrase(::grpc::ServerContext*,
                              const phrase::manager::v1::CreatePhraseRequest*,
                              phrase::manager::v1::CreatePhraseResponse*) override;

  ::grpc::Status GetNextPhrase(::grpc::ServerContext*,
                               const phrase::manager::v1::GetNextPhraseRequest*,
                               phrase::manager::v1::GetNextPhraseResponse*) override;

  ::grpc::Status CompletePhrase(::grpc::ServerContext*,
                                const phrase::manager::v1::CompletePhraseRequest*,
                                phrase::manager::v1::CompletePhraseResponse*) override;

  ::grpc::Status SkipPhrase(::grpc::ServerContext*,
                            const phrase::manager::v1::SkipPhraseRequest*,
                            phrase::manager::v1::SkipPhraseResponse*) override;

  ::grpc::Status UseHint(::grpc::ServerContext*,
                         const phrase::manager::v1::UseHintRequest*,
                         phrase::manager::v1::UseHintResponse*) override;

  ::grpc::Status GetHintStatus(::grpc::ServerContext*,
                               const phrase::manager::v1::GetHintStatusRequest*,
                               phrase::manager::v1::GetHintStatusResponse*) override;

 private:
  std::shared_ptr<phrase::service::PhraseService> service_;
};

}
