#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "datamarket/ledger/v1/types.pb.h"

namespace datamarket::db::sqlite {

using datamarket::db::ErrorCode;
using datamarket::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
    if (v) {
        BindU64(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColU64(st, col);
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return st;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

Result SqliteRepository::NextCounterValue(sqlite3* db, const char* counter, uint64_t* value) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "UPDATE ledger_counters SET value=value+1 WHERE name=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    sqlite3_bind_text(st, 1, counter, -1, SQLITE_STATIC);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::InternalError, std::string("missing counter ") + counter);

    *value = ReadCounter(db, counter);
    return Result::Ok();
}

uint64_t SqliteRepository::ReadCounter(sqlite3* db, const char* counter) {
    sqlite3_stmt* st = PrepareOrThrow(db, "SELECT value FROM ledger_counters WHERE name=?;");
    sqlite3_bind_text(st, 1, counter, -1, SQLITE_STATIC);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        throw std::runtime_error(std::string("missing counter ") + counter);
    }

    uint64_t v = ColU64(st, 0);
    sqlite3_finalize(st);
    return v;
}

// ------------------------------------------------------------------
// Datasets
// ------------------------------------------------------------------

Result SqliteRepository::InsertDataset(Transaction& t, model::DatasetRecord& r) {
    auto* db = TX(t).Handle();

    uint64_t id = 0;
    if (auto res = NextCounterValue(db, "last_dataset_id", &id); !res) return res;

    const char* sql =
        "INSERT INTO datasets(id,owner,name,metadata_url,category,price_per_use,access_count,active,created_at) "
        "VALUES(?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, id);
    BindText(st, 2, r.owner);
    BindText(st, 3, r.name);
    BindText(st, 4, r.metadata_url);
    BindText(st, 5, r.category);
    BindU64(st, 6, r.price_per_use);
    BindU64(st, 7, r.access_count);
    BindI32(st, 8, r.active ? 1 : 0);
    BindU64(st, 9, r.created_at);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto res = Translate(db, rc);
    if (res) r.id = id;
    return res;
}

std::optional<model::DatasetRecord>
SqliteRepository::GetDataset(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,owner,name,metadata_url,category,price_per_use,access_count,active,created_at "
        "FROM datasets WHERE id=?;";

    sqlite3_stmt* st = PrepareOrThrow(db, sql);
    BindU64(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite read dataset: ") + sqlite3_errmsg(db));
        return std::nullopt;
    }

    model::DatasetRecord r;
    r.id            = ColU64(st, 0);
    r.owner         = ColText(st, 1);
    r.name          = ColText(st, 2);
    r.metadata_url  = ColText(st, 3);
    r.category      = ColText(st, 4);
    r.price_per_use = ColU64(st, 5);
    r.access_count  = ColU64(st, 6);
    r.active        = ColI32(st, 7) != 0;
    r.created_at    = ColU64(st, 8);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpdateDataset(Transaction& t, const model::DatasetRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE datasets SET name=?,metadata_url=?,category=?,price_per_use=?,access_count=?,active=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.name);
    BindText(st, 2, r.metadata_url);
    BindText(st, 3, r.category);
    BindU64(st, 4, r.price_per_use);
    BindU64(st, 5, r.access_count);
    BindI32(st, 6, r.active ? 1 : 0);
    BindU64(st, 7, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "dataset " + std::to_string(r.id) + " not found");

    return Translate(db, rc);
}

uint64_t SqliteRepository::LastDatasetId(Transaction& t) {
    return ReadCounter(TX(t).Handle(), "last_dataset_id");
}

// ------------------------------------------------------------------
// Training jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, model::JobRecord& r) {
    auto* db = TX(t).Handle();

    uint64_t id = 0;
    if (auto res = NextCounterValue(db, "last_job_id", &id); !res) return res;

    const char* sql =
        "INSERT INTO training_jobs(id,creator,name,computation_provider,status,result_url,total_cost,created_at,completed_at) "
        "VALUES(?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, id);
    BindText(st, 2, r.creator);
    BindText(st, 3, r.name);
    BindOptText(st, 4, r.computation_provider);
    BindI32(st, 5, static_cast<int>(r.status));
    BindOptText(st, 6, r.result_url);
    BindU64(st, 7, r.total_cost);
    BindU64(st, 8, r.created_at);
    BindOptU64(st, 9, r.completed_at);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (auto res = Translate(db, rc); !res) return res;

    const char* entry_sql = "INSERT INTO training_job_datasets(job_id,position,dataset_id,price) VALUES(?,?,?,?);";
    if (sqlite3_prepare_v2(db, entry_sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (size_t i = 0; i < r.entries.size(); ++i) {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);

        BindU64(st, 1, id);
        BindI32(st, 2, static_cast<int>(i));
        BindU64(st, 3, r.entries[i].dataset_id);
        BindU64(st, 4, r.entries[i].price);

        rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            auto res = Translate(db, rc);
            sqlite3_finalize(st);
            return res;
        }
    }
    sqlite3_finalize(st);

    r.id = id;
    return Result::Ok();
}

std::optional<model::JobRecord>
SqliteRepository::GetJob(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,creator,name,computation_provider,status,result_url,total_cost,created_at,completed_at "
        "FROM training_jobs WHERE id=?;";

    sqlite3_stmt* st = PrepareOrThrow(db, sql);
    BindU64(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite read job: ") + sqlite3_errmsg(db));
        return std::nullopt;
    }

    model::JobRecord r;
    r.id                   = ColU64(st, 0);
    r.creator              = ColText(st, 1);
    r.name                 = ColText(st, 2);
    r.computation_provider = ColOptText(st, 3);
    r.status               = static_cast<datamarket::ledger::v1::JobStatus>(ColI32(st, 4));
    r.result_url           = ColOptText(st, 5);
    r.total_cost           = ColU64(st, 6);
    r.created_at           = ColU64(st, 7);
    r.completed_at         = ColOptU64(st, 8);
    sqlite3_finalize(st);

    st = PrepareOrThrow(db, "SELECT dataset_id,price FROM training_job_datasets WHERE job_id=? ORDER BY position;");
    BindU64(st, 1, id);

    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        r.entries.push_back(model::JobEntryRecord{.dataset_id = ColU64(st, 0), .price = ColU64(st, 1)});
    }
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite read job entries: ") + sqlite3_errmsg(db));

    return r;
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE training_jobs SET computation_provider=?,status=?,result_url=?,completed_at=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindOptText(st, 1, r.computation_provider);
    BindI32(st, 2, static_cast<int>(r.status));
    BindOptText(st, 3, r.result_url);
    BindOptU64(st, 4, r.completed_at);
    BindU64(st, 5, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "training job " + std::to_string(r.id) + " not found");

    return Translate(db, rc);
}

uint64_t SqliteRepository::LastJobId(Transaction& t) {
    return ReadCounter(TX(t).Handle(), "last_job_id");
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

std::optional<model::BalanceRecord>
SqliteRepository::GetBalance(Transaction& t, const std::string& identity) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(db, "SELECT identity,amount FROM balances WHERE identity=?;");
    BindText(st, 1, identity);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite read balance: ") + sqlite3_errmsg(db));
        return std::nullopt;
    }

    model::BalanceRecord r;
    r.identity = ColText(st, 0);
    r.amount   = ColU64(st, 1);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpsertBalance(Transaction& t, const model::BalanceRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO balances(identity,amount) VALUES(?,?) "
        "ON CONFLICT(identity) DO UPDATE SET amount=excluded.amount;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.identity);
    BindU64(st, 2, r.amount);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

} // namespace datamarket::db::sqlite
