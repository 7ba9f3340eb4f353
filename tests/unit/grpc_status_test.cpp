#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/phrase_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/phrase_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "phrase/manager/v1.hpp"

namespace {

using namespace phrase::manager::v1;

struct Servers {
  phrase::service::ServiceContext ctx;
  std::unique_ptr<phrase::grpc::PhraseServer> phrases;
  std::unique_ptr<phrase::grpc::AdminServer>  admin;
};

Servers BuildServers() {
  Servers servers;
  servers.ctx = phrase::factory::BuildServiceContext(phrase::runtime::config::RuntimeConfig{},
                                                     std::make_shared<phrase::db::memory::MemoryRepository>(), nullptr);
  servers.phrases = std::make_unique<phrase::grpc::PhraseServer>(std::make_shared<phrase::service::PhraseService>(servers.ctx));
  servers.admin   = std::make_unique<phrase::grpc::AdminServer>(std::make_shared<phrase::service::AdminService>(servers.ctx));
  return servers;
}

std::string SyncPlayer(Servers& servers, const std::string& name) {
  SyncPlayerRequest req;
  req.mutable_id()->set_value(phrase::util::NewId());
  req.set_name(name);
  SyncPlayerResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = servers.admin->SyncPlayer(&grpc_ctx, &req, &resp);
  assert(status.ok());
  return req.id().value();
}

void TestInvalidPhraseReturnsInvalidArgument() {
  auto       servers = BuildServers();
  const auto alice   = SyncPlayer(servers, "alice");
  const auto bob     = SyncPlayer(servers, "bob");

  CreatePhraseRequest req;
  req.set_content("supercalifragilistic");
  req.mutable_sender_id()->set_value(alice);
  req.add_target_ids()->set_value(bob);

  CreatePhraseResponse  resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = servers.phrases->CreatePhrase(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(!status.error_message().empty());
}

void TestSelfTargetReturnsInvalidArgument() {
  auto       servers = BuildServers();
  const auto alice   = SyncPlayer(servers, "alice");

  CreatePhraseRequest req;
  req.set_content("hello world");
  req.mutable_sender_id()->set_value(alice);
  req.add_target_ids()->set_value(alice);

  CreatePhraseResponse  resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = servers.phrases->CreatePhrase(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message() == "Cannot target yourself");
}

void TestUnknownPhraseReturnsNotFound() {
  auto       servers = BuildServers();
  const auto bob     = SyncPlayer(servers, "bob");

  CompletePhraseRequest req;
  req.mutable_player_id()->set_value(bob);
  req.mutable_phrase_id()->set_value(phrase::util::NewId());

  CompletePhraseResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = servers.phrases->CompletePhrase(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestUnknownPlayerSelectionReturnsNotFound() {
  auto servers = BuildServers();

  GetNextPhraseRequest req;
  req.mutable_player_id()->set_value(phrase::util::NewId());

  GetNextPhraseResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = servers.phrases->GetNextPhrase(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestEmptySelectionIsOk() {
  auto       servers = BuildServers();
  const auto bob     = SyncPlayer(servers, "bob");

  GetNextPhraseRequest req;
  req.mutable_player_id()->set_value(bob);

  GetNextPhraseResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = servers.phrases->GetNextPhrase(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.available());
}

void TestAdminErrorsMapToStatus() {
  auto servers = BuildServers();

  ApprovePhraseRequest approve;
  approve.mutable_id()->set_value("not-a-uuid");
  ApprovePhraseResponse approve_resp;
  ::grpc::ServerContext approve_ctx;
  assert(servers.admin->ApprovePhrase(&approve_ctx, &approve, &approve_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  approve.mutable_id()->set_value(phrase::util::NewId());
  ::grpc::ServerContext missing_ctx;
  assert(servers.admin->ApprovePhrase(&missing_ctx, &approve, &approve_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  AnalyzeDifficultyRequest analyze;
  analyze.set_content("hello world");
  analyze.set_language(static_cast<Language>(42));
  AnalyzeDifficultyResponse analyze_resp;
  ::grpc::ServerContext     analyze_ctx;
  assert(servers.admin->AnalyzeDifficulty(&analyze_ctx, &analyze, &analyze_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestOutOfOrderHintReturnsFailedPrecondition() {
  auto       servers = BuildServers();
  const auto alice   = SyncPlayer(servers, "alice");
  const auto bob     = SyncPlayer(servers, "bob");

  CreatePhraseRequest create;
  create.set_content("hello world");
  create.mutable_sender_id()->set_value(alice);
  create.add_target_ids()->set_value(bob);
  CreatePhraseResponse  created;
  ::grpc::ServerContext create_ctx;
  assert(servers.phrases->CreatePhrase(&create_ctx, &create, &created).ok());

  UseHintRequest req;
  req.mutable_player_id()->set_value(bob);
  req.mutable_phrase_id()->set_value(created.phrase().id().value());
  req.set_level(2);

  UseHintResponse       resp;
  ::grpc::ServerContext grpc_ctx;
  assert(servers.phrases->UseHint(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  req.set_level(4);
  ::grpc::ServerContext bad_level_ctx;
  assert(servers.phrases->UseHint(&bad_level_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestExceptionMapping() {
  using phrase::grpc::ToStatus;

  assert(ToStatus(phrase::util::ValidationFailed({"a", "b"})).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(phrase::util::ValidationFailed({"a", "b"})).error_message() == "a; b");
  assert(ToStatus(phrase::util::AlreadyExists("dup")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(phrase::util::FailedPrecondition("order")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(phrase::util::Conflict("race")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(phrase::util::StorageError("busy", true)).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(phrase::util::StorageError("corrupt", false)).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestInvalidPhraseReturnsInvalidArgument();
  TestSelfTargetReturnsInvalidArgument();
  TestUnknownPhraseReturnsNotFound();
  TestUnknownPlayerSelectionReturnsNotFound();
  TestEmptySelectionIsOk();
  TestAdminErrorsMapToStatus();
  TestOutOfOrderHintReturnsFailedPrecondition();
  TestExceptionMapping();

  std::cout << "phrase_manager_unit_grpc_status: pass\n";
  return 0;
}
