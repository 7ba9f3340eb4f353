#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "phrase/manager/v1.hpp"

namespace phrase::grpc {

using namespace phrase::manager::v1;

AdminServer::AdminServer(std::shared_ptr<phrase::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::ApprovePhrase(::grpc::ServerContext*, const ApprovePhraseRequest* req, ApprovePhraseResponse* resp) {
  try {
    *resp = service_->ApprovePhrase(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListGlobalPhrases(::grpc::ServerContext*, const ListGlobalPhrasesRequest* req, ListGlobalPhrasesResponse* resp) {
  try {
    *resp = service_->ListGlobalPhrases(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetPhraseStats(::grpc::ServerContext*, const GetPhraseStatsRequest* req, GetPhraseStatsResponse* resp) {
  try {
    *resp = service_->GetPhraseStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::AnalyzeDifficulty(::grpc::ServerContext*, const AnalyzeDifficultyRequest* req, AnalyzeDifficultyResponse* resp) {
  try {
    *resp = service_->AnalyzeDifficulty(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::SyncPlayer(::grpc::ServerContext*, const SyncPlayerRequest* req, SyncPlayerResponse*) {
  try {
    service_->SyncPlayer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace phrase::grpc
