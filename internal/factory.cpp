#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/assignment_engine.hpp"
#include "internal/core/completion_tracker.hpp"
#include "internal/core/hint_tracker.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/phrase_server.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scoring/difficulty_scorer.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/phrase_service.hpp"
#include "internal/validation/phrase_validator.hpp"
#if PHRASE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if PHRASE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace phrase::factory {

using namespace phrase;

namespace {

#if PHRASE_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,name,skill_level,max_difficulty FROM players LIMIT 1;");
  sqlite_db->Exec("SELECT id,difficulty_score,is_global,is_approved,usage_count FROM phrases LIMIT 1;");
  sqlite_db->Exec("SELECT phrase_id,target_player_id,priority,is_delivered FROM player_phrases LIMIT 1;");
}
#endif

#if PHRASE_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,name,skill_level,max_difficulty FROM players LIMIT 1;");
  tx.exec("SELECT id,difficulty_score,is_global,is_approved,usage_count FROM phrases LIMIT 1;");
  tx.exec("SELECT seq,phrase_id,target_player_id,priority,is_delivered FROM player_phrases LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const phrase::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if PHRASE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    PHRASE_LOG_INFO("using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if PHRASE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    PHRASE_LOG_INFO("using postgres repository", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  PHRASE_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

service::ServiceContext BuildServiceContext(const phrase::runtime::config::RuntimeConfig& config,
                                            std::shared_ptr<db::Repository> repository,
                                            std::shared_ptr<notify::PhraseNotifier> notifier) {
  service::ServiceContext ctx;
  ctx.repository = std::move(repository);
  ctx.scorer     = std::make_shared<scoring::FrequencyDifficultyScorer>();

  ctx.engine = std::make_shared<core::AssignmentEngine>(ctx.repository, ctx.scorer, notifier,
                                                        validation::PhraseValidator(validation::ValidationPolicy::FromConfig(config.validation())),
                                                        core::SelectionPolicy::FromConfig(config.selection()));
  ctx.tracker = std::make_shared<core::CompletionTracker>(ctx.repository, notifier);
  ctx.hints   = std::make_shared<core::HintTracker>(ctx.repository);
  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const phrase::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto notifier   = std::make_shared<notify::LoggingNotifier>();

  app.context = BuildServiceContext(config, std::move(repository), std::move(notifier));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto phrase_service = std::make_shared<service::PhraseService>(app.context);
  auto admin_service  = std::make_shared<service::AdminService>(app.context);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::PhraseServer>(phrase_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace phrase::factory
