#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace phrase::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      PHRASE_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::Conflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::Conflict(e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::StorageError(e.what(), true);
  } catch (const pqxx::in_doubt_error& e) {
    throw util::StorageError(e.what(), true);
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
