#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace datamarket::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
  static uint64_t ReadCounter(pqxx::work& w, const char* counter);
};

}
