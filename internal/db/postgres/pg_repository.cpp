#include "pg_repository.hpp"

#include "datamarket/ledger/v1/types.pb.h"

namespace datamarket::db::postgres {

namespace {

// BIGINT columns hold values up to INT64_MAX; amounts are bounded there.
int64_t ToSql(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::optional<int64_t> ToSql(const std::optional<uint64_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

uint64_t U64(const pqxx::field& f) {
  return static_cast<uint64_t>(f.as<int64_t>());
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return U64(f);
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

model::DatasetRecord DatasetFromRow(const pqxx::row& row) {
  model::DatasetRecord r;
  r.id            = U64(row[0]);
  r.owner         = row[1].c_str();
  r.name          = row[2].c_str();
  r.metadata_url  = row[3].c_str();
  r.category      = row[4].c_str();
  r.price_per_use = U64(row[5]);
  r.access_count  = U64(row[6]);
  r.active        = row[7].as<bool>();
  r.created_at    = U64(row[8]);
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

uint64_t PgRepository::ReadCounter(pqxx::work& w, const char* counter) {
  auto res = w.exec_prepared("read_counter", counter);
  if (res.empty()) throw std::runtime_error(std::string("missing counter ") + counter);
  return U64(res[0][0]);
}

// ------------------------------------------------------------------
// Datasets
// ------------------------------------------------------------------

Result PgRepository::InsertDataset(Transaction& t, model::DatasetRecord& r) {
  try {
    auto& w = TX(t).Work();

    auto counter = w.exec_prepared("next_counter", "last_dataset_id");
    if (counter.empty()) return Result::Err(ErrorCode::InternalError, "missing counter last_dataset_id");
    const uint64_t id = U64(counter[0][0]);

    w.exec_prepared("insert_dataset",
                    ToSql(id),
                    r.owner,
                    r.name,
                    r.metadata_url,
                    r.category,
                    ToSql(r.price_per_use),
                    ToSql(r.access_count),
                    r.active,
                    ToSql(r.created_at));
    r.id = id;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DatasetRecord> PgRepository::GetDataset(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_dataset", ToSql(id));
  if (res.empty()) return std::nullopt;
  return DatasetFromRow(res[0]);
}

Result PgRepository::UpdateDataset(Transaction& t, const model::DatasetRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_dataset",
                                          ToSql(r.id),
                                          r.name,
                                          r.metadata_url,
                                          r.category,
                                          ToSql(r.price_per_use),
                                          ToSql(r.access_count),
                                          r.active);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "dataset " + std::to_string(r.id) + " not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::LastDatasetId(Transaction& t) {
  return ReadCounter(TX(t).Work(), "last_dataset_id");
}

// ------------------------------------------------------------------
// Training jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  try {
    auto& w = TX(t).Work();

    auto counter = w.exec_prepared("next_counter", "last_job_id");
    if (counter.empty()) return Result::Err(ErrorCode::InternalError, "missing counter last_job_id");
    const uint64_t id = U64(counter[0][0]);

    w.exec_prepared("insert_job",
                    ToSql(id),
                    r.creator,
                    r.name,
                    r.computation_provider,
                    static_cast<int>(r.status),
                    r.result_url,
                    ToSql(r.total_cost),
                    ToSql(r.created_at),
                    ToSql(r.completed_at));

    for (std::size_t i = 0; i < r.entries.size(); ++i) {
      w.exec_prepared("insert_job_entry", ToSql(id), static_cast<int>(i), ToSql(r.entries[i].dataset_id), ToSql(r.entries[i].price));
    }

    r.id = id;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, uint64_t id) {
  auto& w   = TX(t).Work();
  auto  res = w.exec_prepared("get_job", ToSql(id));
  if (res.empty()) return std::nullopt;

  const auto& row = res[0];

  model::JobRecord r;
  r.id                   = U64(row[0]);
  r.creator              = row[1].c_str();
  r.name                 = row[2].c_str();
  r.computation_provider = OptText(row[3]);
  r.status               = static_cast<datamarket::ledger::v1::JobStatus>(row[4].as<int>());
  r.result_url           = OptText(row[5]);
  r.total_cost           = U64(row[6]);
  r.created_at           = U64(row[7]);
  r.completed_at         = OptU64(row[8]);

  auto entries = w.exec_prepared("get_job_entries", ToSql(id));
  r.entries.reserve(entries.size());
  for (const auto& e : entries) {
    r.entries.push_back(model::JobEntryRecord{.dataset_id = U64(e[0]), .price = U64(e[1])});
  }
  return r;
}

Result PgRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared(
        "update_job", ToSql(r.id), r.computation_provider, static_cast<int>(r.status), r.result_url, ToSql(r.completed_at));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "training job " + std::to_string(r.id) + " not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::LastJobId(Transaction& t) {
  return ReadCounter(TX(t).Work(), "last_job_id");
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

std::optional<model::BalanceRecord> PgRepository::GetBalance(Transaction& t, const std::string& identity) {
  auto res = TX(t).Work().exec_prepared("get_balance", identity);
  if (res.empty()) return std::nullopt;

  model::BalanceRecord r;
  r.identity = res[0][0].c_str();
  r.amount   = U64(res[0][1]);
  return r;
}

Result PgRepository::UpsertBalance(Transaction& t, const model::BalanceRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_balance", r.identity, ToSql(r.amount));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace datamarket::db::postgres
