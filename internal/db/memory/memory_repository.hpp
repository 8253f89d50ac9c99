#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace datamarket::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));

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
  friend class MemoryTransaction;

  struct State {
    std::map<uint64_t, model::DatasetRecord> datasets;
    std::map<uint64_t, model::JobRecord> jobs;
    std::unordered_map<std::string, uint64_t> balances;
    uint64_t last_dataset_id = 0;
    uint64_t last_job_id = 0;
  };

  // Held by the open transaction for its whole lifetime.
  std::timed_mutex writer_mutex_;
  std::chrono::milliseconds busy_timeout_;

  std::mutex mutex_;
  State committed_;
};

}
