#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/balance_record.hpp"
#include "internal/db/model/dataset_record.hpp"
#include "internal/db/model/job_record.hpp"

namespace datamarket::db {

/*
  Repository abstraction over the ledger store.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Id counters advance inside the same transaction as the insert that
    consumes them, so a rolled back insert never burns an id
  - Records are never deleted, only superseded in place

  Persisted layout:
    datasets by id
    training jobs by id (+ ordered dataset entries)
    balances by identity
    last_dataset_id / last_job_id counters
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Datasets
  // ---------------------------------------------------------------------

  // Assigns record.id from the dataset counter.
  virtual Result InsertDataset(Transaction&, model::DatasetRecord&) = 0;

  virtual std::optional<model::DatasetRecord> GetDataset(Transaction&, uint64_t id) = 0;

  virtual Result UpdateDataset(Transaction&, const model::DatasetRecord&) = 0;

  virtual uint64_t LastDatasetId(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Training jobs
  // ---------------------------------------------------------------------

  // Assigns record.id from the job counter and stores the entry list.
  virtual Result InsertJob(Transaction&, model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, uint64_t id) = 0;

  // Entries are immutable after insert; only lifecycle fields are written.
  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  virtual uint64_t LastJobId(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Balances
  // ---------------------------------------------------------------------

  virtual std::optional<model::BalanceRecord> GetBalance(Transaction&, const std::string& identity) = 0;

  virtual Result UpsertBalance(Transaction&, const model::BalanceRecord&) = 0;
};

} // namespace datamarket::db
