#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "datamarket/ledger/v1/types.pb.h"

namespace datamarket::db::model {

/*
  One position in a job's dataset list.

  price is what the creator was charged for this entry at creation time;
  refunds and escrow release use it, never the dataset's current price.
*/
struct JobEntryRecord {
  uint64_t dataset_id = 0;
  uint64_t price      = 0;
};

/*
  Persistent training job row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - entries and total_cost are fixed at insert.
  - computation_provider is set once, on acceptance.
*/
struct JobRecord {
  uint64_t id = 0;

  std::string creator;
  std::string name;

  std::vector<JobEntryRecord> entries;

  std::optional<std::string> computation_provider;

  datamarket::ledger::v1::JobStatus status = datamarket::ledger::v1::JOB_STATUS_PENDING;

  std::optional<std::string> result_url;

  uint64_t total_cost = 0;

  uint64_t                created_at = 0;
  std::optional<uint64_t> completed_at;
};

} // namespace datamarket::db::model
