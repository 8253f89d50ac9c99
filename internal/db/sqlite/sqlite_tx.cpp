#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace datamarket::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_(db_->WriterMutex(), std::defer_lock) {
  if (!writer_.try_lock_for(db_->BusyTimeout())) {
    throw std::runtime_error("sqlite repository busy: another transaction is open");
  }
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      DATAMARKET_LOG_WARN("sqlite rollback failed", {datamarket::observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("sqlite transaction already finished");
  }
  db_->Exec("COMMIT;");
  finished_ = true;
  writer_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  // on failure the lock is released when the transaction is destroyed
  db_->Exec("ROLLBACK;");
  writer_.unlock();
}

} // namespace datamarket::db::sqlite
