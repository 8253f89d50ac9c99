#include "internal/ledger/job_ledger.hpp"

#include <map>
#include <stdexcept>
#include <unordered_map>

#include "internal/ledger/validation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/db_errors.hpp"
#include "internal/util/errors.hpp"

namespace datamarket::ledger {

using datamarket::ledger::v1::JobStatus;
using datamarket::ledger::v1::JOB_STATUS_COMPLETED;
using datamarket::ledger::v1::JOB_STATUS_FAILED;
using datamarket::ledger::v1::JOB_STATUS_PENDING;
using datamarket::ledger::v1::JOB_STATUS_PROCESSING;

namespace {

std::string JobLabel(uint64_t job_id) {
  return "training job " + std::to_string(job_id);
}

void RequireStatus(const db::model::JobRecord& job, JobStatus expected, const char* operation) {
  if (job.status != expected) {
    throw util::InvalidParameters(std::string(operation) + ": " + JobLabel(job.id) + " is " + datamarket::ledger::v1::JobStatus_Name(job.status) +
                                  ", expected " + datamarket::ledger::v1::JobStatus_Name(expected));
  }
}

} // namespace

JobLedger::JobLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<BalanceLedger> balances, std::shared_ptr<chain::HeightSource> height,
                     EscrowPolicy escrow)
    : repository_(std::move(repository)), balances_(std::move(balances)), height_(std::move(height)), escrow_(std::move(escrow)) {
  if (!repository_ || !balances_ || !height_) {
    throw std::invalid_argument("JobLedger requires a repository, a balance ledger and a height source");
  }
}

db::model::JobRecord JobLedger::LoadJob(db::Transaction& tx, uint64_t job_id) {
  auto job = repository_->GetJob(tx, job_id);
  if (!job) {
    throw util::NotFound(JobLabel(job_id) + " not found");
  }
  return std::move(*job);
}

db::model::JobRecord JobLedger::CreateTrainingJob(const std::string& caller, const std::string& name, const std::vector<uint64_t>& dataset_ids) {
  RequireIdentity(caller);
  RequireBounded("name", name, kMaxNameLength);
  if (dataset_ids.size() > kMaxJobDatasets) {
    throw util::InvalidParameters("a training job references at most " + std::to_string(kMaxJobDatasets) + " datasets");
  }

  auto tx = repository_->Begin();

  // each id is read once per operation however often it is listed
  std::unordered_map<uint64_t, std::optional<db::model::DatasetRecord>> cache;
  DatasetResolver resolve = [&](uint64_t id) -> std::optional<db::model::DatasetRecord> {
    auto it = cache.find(id);
    if (it == cache.end()) {
      it = cache.emplace(id, repository_->GetDataset(*tx, id)).first;
    }
    return it->second;
  };

  if (!AllDatasetsUsable(dataset_ids, resolve)) {
    throw util::NotFound("training job references a missing or inactive dataset");
  }

  db::model::JobRecord job;
  job.creator    = caller;
  job.name       = name;
  job.entries    = PriceEntries(dataset_ids, resolve);
  job.status     = JOB_STATUS_PENDING;
  job.total_cost = AggregateCost(job.entries);
  job.created_at = height_->CurrentHeight();

  balances_->Debit(*tx, caller, job.total_cost);
  util::ThrowIfDbError(repository_->InsertJob(*tx, job), "create training job");
  tx->Commit();

  observability::Metrics::Instance().RecordEscrowFlow(observability::kEscrowHold, job.total_cost);
  DATAMARKET_LOG_INFO("training job created", {observability::UintField("job_id", job.id), observability::StringField("creator", caller),
                                               observability::UintField("total_cost", job.total_cost),
                                               observability::UintField("datasets", job.entries.size())});
  return job;
}

db::model::JobRecord JobLedger::AcceptTrainingJob(const std::string& caller, uint64_t job_id) {
  RequireIdentity(caller);

  auto tx  = repository_->Begin();
  auto job = LoadJob(*tx, job_id);
  RequireStatus(job, JOB_STATUS_PENDING, "accept");

  job.computation_provider = caller;
  job.status               = JOB_STATUS_PROCESSING;

  util::ThrowIfDbError(repository_->UpdateJob(*tx, job), "accept training job");
  tx->Commit();

  DATAMARKET_LOG_INFO("training job accepted", {observability::UintField("job_id", job_id), observability::StringField("provider", caller)});
  return job;
}

db::model::JobRecord JobLedger::CompleteTrainingJob(const std::string& caller, uint64_t job_id, const std::string& result_url) {
  RequireIdentity(caller);
  RequireBounded("result_url", result_url, kMaxUrlLength);

  auto tx  = repository_->Begin();
  auto job = LoadJob(*tx, job_id);
  if (job.computation_provider != caller) {
    throw util::NotAuthorized(caller + " is not the computation provider of " + JobLabel(job_id));
  }
  RequireStatus(job, JOB_STATUS_PROCESSING, "complete");

  job.status       = JOB_STATUS_COMPLETED;
  job.result_url   = result_url;
  job.completed_at = height_->CurrentHeight();

  // one increment per list occurrence; ordered so writes are deterministic
  std::map<uint64_t, uint64_t> occurrences;
  for (const auto& entry : job.entries) {
    ++occurrences[entry.dataset_id];
  }
  for (const auto& [dataset_id, count] : occurrences) {
    auto dataset = repository_->GetDataset(*tx, dataset_id);
    if (!dataset || !dataset->active) {
      continue;
    }
    dataset->access_count = CheckedAdd("access count", dataset->access_count, count);
    util::ThrowIfDbError(repository_->UpdateDataset(*tx, *dataset), "record dataset access");
  }

  util::ThrowIfDbError(repository_->UpdateJob(*tx, job), "complete training job");
  ReleaseEscrow(*tx, job);
  tx->Commit();

  if (escrow_.ReleasesOnCompletion()) {
    observability::Metrics::Instance().RecordEscrowFlow(observability::kEscrowRelease, job.total_cost);
  }

  DATAMARKET_LOG_INFO("training job completed", {observability::UintField("job_id", job_id), observability::StringField("provider", caller),
                                                 observability::BoolField("escrow_released", escrow_.ReleasesOnCompletion())});
  return job;
}

db::model::JobRecord JobLedger::CancelTrainingJob(const std::string& caller, uint64_t job_id) {
  RequireIdentity(caller);

  auto tx  = repository_->Begin();
  auto job = LoadJob(*tx, job_id);
  if (job.creator != caller) {
    throw util::NotAuthorized(caller + " did not create " + JobLabel(job_id));
  }
  RequireStatus(job, JOB_STATUS_PENDING, "cancel");

  job.status = JOB_STATUS_FAILED;
  util::ThrowIfDbError(repository_->UpdateJob(*tx, job), "cancel training job");
  RefundCreator(*tx, job);
  tx->Commit();

  observability::Metrics::Instance().RecordEscrowFlow(observability::kEscrowRefund, job.total_cost);

  DATAMARKET_LOG_INFO("training job cancelled", {observability::UintField("job_id", job_id), observability::UintField("refund", job.total_cost)});
  return job;
}

db::model::JobRecord JobLedger::FailTrainingJob(const std::string& caller, uint64_t job_id) {
  RequireIdentity(caller);

  auto tx  = repository_->Begin();
  auto job = LoadJob(*tx, job_id);
  if (job.computation_provider != caller) {
    throw util::NotAuthorized(caller + " is not the computation provider of " + JobLabel(job_id));
  }
  RequireStatus(job, JOB_STATUS_PROCESSING, "fail");

  job.status = JOB_STATUS_FAILED;
  util::ThrowIfDbError(repository_->UpdateJob(*tx, job), "fail training job");
  RefundCreator(*tx, job);
  tx->Commit();

  observability::Metrics::Instance().RecordEscrowFlow(observability::kEscrowRefund, job.total_cost);

  DATAMARKET_LOG_WARN("training job failed", {observability::UintField("job_id", job_id), observability::StringField("provider", caller),
                                              observability::UintField("refund", job.total_cost)});
  return job;
}

void JobLedger::RefundCreator(db::Transaction& tx, const db::model::JobRecord& job) {
  balances_->Credit(tx, job.creator, job.total_cost);
}

void JobLedger::ReleaseEscrow(db::Transaction& tx, const db::model::JobRecord& job) {
  if (!escrow_.ReleasesOnCompletion()) {
    return;
  }

  auto settlement = escrow_.ComputeSettlement(job, [&](uint64_t dataset_id) -> std::optional<std::string> {
    auto dataset = repository_->GetDataset(tx, dataset_id);
    if (!dataset) {
      return std::nullopt;
    }
    return dataset->owner;
  });

  for (const auto& payout : settlement.payouts) {
    balances_->Credit(tx, payout.identity, payout.amount);
  }
}

std::optional<db::model::JobRecord> JobLedger::GetTrainingJob(uint64_t job_id) {
  auto tx = repository_->Begin();
  return repository_->GetJob(*tx, job_id);
}

uint64_t JobLedger::LastJobId() {
  auto tx = repository_->Begin();
  return repository_->LastJobId(*tx);
}

} // namespace datamarket::ledger
