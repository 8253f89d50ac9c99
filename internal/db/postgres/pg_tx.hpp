#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace datamarket::db::postgres {

/*
  Postgres transaction.

  Takes a transaction-scoped advisory lock before any statement runs, so
  ledger writers execute one at a time across every connection and every
  process sharing the database. The lock is released by COMMIT/ROLLBACK.
*/
class PgTransaction final : public db::Transaction {
public:
  static constexpr long long kLedgerWriterLockKey = 0x64617461; // "data"

  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return finished_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool finished_ = false;
};

}
