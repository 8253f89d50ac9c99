#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace datamarket::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->AcquirePrepared();
  tx_ = std::make_unique<pqxx::work>(*conn_);
  tx_->exec("SELECT pg_advisory_xact_lock(" + std::to_string(kLedgerWriterLockKey) + ")");
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      DATAMARKET_LOG_WARN("postgres rollback failed", {datamarket::observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

}
