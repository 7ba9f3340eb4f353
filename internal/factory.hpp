#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/service/service_context.hpp"

namespace phrase::db { class Repository; }
namespace phrase::notify { class PhraseNotifier; }

namespace phrase::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext context;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root. The ONLY place allowed to know concrete DB types.
  Bootstraps the schema of SQL backends.
*/
std::shared_ptr<db::Repository> BuildRepository(const phrase::runtime::config::RuntimeConfig& config);

// Engine, tracker and scorer over an existing repository.
service::ServiceContext BuildServiceContext(const phrase::runtime::config::RuntimeConfig& config,
                                            std::shared_ptr<db::Repository> repository,
                                            std::shared_ptr<notify::PhraseNotifier> notifier);

Application Build(const phrase::runtime::config::RuntimeConfig& config);

}
