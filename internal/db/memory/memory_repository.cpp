#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace datamarket::db::memory {

MemoryRepository::MemoryRepository(std::chrono::milliseconds busy_timeout) : busy_timeout_(busy_timeout) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Datasets
// ------------------------------------------------------------------

Result MemoryRepository::InsertDataset(Transaction& t, model::DatasetRecord& r) {
  auto&          s  = TX(t).Mutable();
  const uint64_t id = s.last_dataset_id + 1;
  if (s.datasets.contains(id)) return Result::Err(ErrorCode::AlreadyExists, "dataset id " + std::to_string(id));
  r.id = id;
  s.datasets[id]    = r;
  s.last_dataset_id = id;
  return Result::Ok();
}

std::optional<model::DatasetRecord> MemoryRepository::GetDataset(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.datasets.find(id);
  if (it == s.datasets.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateDataset(Transaction& t, const model::DatasetRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.datasets.contains(r.id)) return Result::Err(ErrorCode::NotFound, "dataset " + std::to_string(r.id));
  s.datasets[r.id] = r;
  return Result::Ok();
}

uint64_t MemoryRepository::LastDatasetId(Transaction& t) {
  return TX(t).View().last_dataset_id;
}

// ------------------------------------------------------------------
// Training jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  auto&          s  = TX(t).Mutable();
  const uint64_t id = s.last_job_id + 1;
  if (s.jobs.contains(id)) return Result::Err(ErrorCode::AlreadyExists, "job id " + std::to_string(id));
  r.id          = id;
  s.jobs[id]    = r;
  s.last_job_id = id;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound, "job " + std::to_string(r.id));

  auto& stored                = it->second;
  stored.computation_provider = r.computation_provider;
  stored.status               = r.status;
  stored.result_url           = r.result_url;
  stored.completed_at         = r.completed_at;
  return Result::Ok();
}

uint64_t MemoryRepository::LastJobId(Transaction& t) {
  return TX(t).View().last_job_id;
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

std::optional<model::BalanceRecord> MemoryRepository::GetBalance(Transaction& t, const std::string& identity) {
  const auto& s  = TX(t).View();
  auto        it = s.balances.find(identity);
  if (it == s.balances.end()) return std::nullopt;
  return model::BalanceRecord{.identity = identity, .amount = it->second};
}

Result MemoryRepository::UpsertBalance(Transaction& t, const model::BalanceRecord& r) {
  TX(t).Mutable().balances[r.identity] = r.amount;
  return Result::Ok();
}

} // namespace datamarket::db::memory
