#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace datamarket::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDataset(Transaction&, model::DatasetRecord&) override;
  std::optional<model::DatasetRecord> GetDataset(Transaction&, uint64_t id) override;
  Result UpdateDataset(Transaction&, const model::DatasetRecord&) override;
  uint64_t LastDatasetId(Transaction&) override;

  Result InsertJob(Transaction&, model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, uint64_t id) override;
  Result UpdateJob(Transaction&, const model::JobRecord&) override;
  uint64_t LastJobId(Transaction&) override;

  std::optional<model::BalanceRecord> GetBalance(Transaction&, const std::string& identity) override;
  Result UpsertBalance(Transaction&, const model::BalanceRecord&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static Result NextCounterValue(sqlite3* db, const char* counter, uint64_t* value);
  static uint64_t ReadCounter(sqlite3* db, const char* counter);
};

}
