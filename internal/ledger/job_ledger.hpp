#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/chain/height_source.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/balance_ledger.hpp"
#include "internal/ledger/escrow_policy.hpp"

namespace datamarket::ledger {

/*
  Training job state machine.

    Pending    --accept-->           Processing
    Processing --complete(provider)--> Completed
    Pending    --cancel(creator)-->  Failed      refunds totalCost
    Processing --fail(provider)-->   Failed      refunds totalCost

  Every transition and the balance moves it causes commit in one
  transaction.
*/
class JobLedger {
 public:
  JobLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<BalanceLedger> balances, std::shared_ptr<chain::HeightSource> height,
            EscrowPolicy escrow);

  db::model::JobRecord CreateTrainingJob(const std::string& caller, const std::string& name, const std::vector<uint64_t>& dataset_ids);
  db::model::JobRecord AcceptTrainingJob(const std::string& caller, uint64_t job_id);
  db::model::JobRecord CompleteTrainingJob(const std::string& caller, uint64_t job_id, const std::string& result_url);
  db::model::JobRecord CancelTrainingJob(const std::string& caller, uint64_t job_id);
  db::model::JobRecord FailTrainingJob(const std::string& caller, uint64_t job_id);

  std::optional<db::model::JobRecord> GetTrainingJob(uint64_t job_id);
  uint64_t                            LastJobId();

  const EscrowPolicy& Escrow() const {
    return escrow_;
  }

 private:
  db::model::JobRecord LoadJob(db::Transaction& tx, uint64_t job_id);
  void                 RefundCreator(db::Transaction& tx, const db::model::JobRecord& job);
  void                 ReleaseEscrow(db::Transaction& tx, const db::model::JobRecord& job);

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<BalanceLedger>       balances_;
  std::shared_ptr<chain::HeightSource> height_;
  EscrowPolicy                         escrow_;
};

} // namespace datamarket::ledger
