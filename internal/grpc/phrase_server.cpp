#include "phrase_server.hpp"

#include "grpc_error.hpp"
#include "phrase/manager/v1.hpp"

namespace phrase::grpc {

using namespace phrase::manager::v1;

PhraseServer::PhraseServer(std::shared_ptr<phrase::service::PhraseService> svc) : service_(std::move(svc)) {
}

::grpc::Status PhraseServer::CreatePhrase(::grpc::ServerContext*, const CreatePhraseRequest* req, CreatePhraseResponse* resp) {
  try {
    *resp = service_->CreatePhrase(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PhraseServer::GetNextPhrase(::grpc::ServerContext*, const GetNextPhraseRequest* req, GetNextPhraseResponse* resp) {
  try {
    *resp = service_->GetNextPhrase(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PhraseServer::CompletePhrase(::grpc::ServerContext*, const CompletePhraseRequest* req, CompletePhraseResponse* resp) {
  try {
    *resp = service_->CompletePhrase(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PhraseServer::SkipPhrase(::grpc::ServerContext*, const SkipPhraseRequest* req, SkipPhraseResponse* resp) {
  try {
    *resp = service_->SkipPhrase(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PhraseServer::UseHint(::grpc::ServerContext*, const UseHintRequest* req, UseHintResponse* resp) {
  try {
    *resp = service_->UseHint(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PhraseServer::GetHintStatus(::grpc::ServerContext*, const GetHintStatusRequest* req, GetHintStatusResponse* resp) {
  try {
    *resp = service_->GetHintStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace phrase::grpc
