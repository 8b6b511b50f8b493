#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fmd::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  try {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::failure& e) {
    throw util::Error(util::ErrorKind::Storage, e.what(), "begin");
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_ && tx_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      FMD_LOG_WARN("db", "postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must end before its connection goes back to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::query_cancelled& e) {
    throw util::Error(util::ErrorKind::Timeout, e.what(), "commit");
  } catch (const pqxx::failure& e) {
    throw util::Error(util::ErrorKind::Storage, e.what(), "commit");
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

}
