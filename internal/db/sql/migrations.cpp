#include "migrations.hpp"

#include <stdexcept>

namespace datamarket::db::sql {

namespace {

const std::vector<std::string> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS ledger_counters (name TEXT PRIMARY KEY, value INTEGER NOT NULL);",
    "INSERT OR IGNORE INTO ledger_counters(name,value) VALUES('last_dataset_id',0);",
    "INSERT OR IGNORE INTO ledger_counters(name,value) VALUES('last_job_id',0);",
    "CREATE TABLE IF NOT EXISTS datasets (id INTEGER PRIMARY KEY, owner TEXT NOT NULL, name TEXT NOT NULL, metadata_url TEXT NOT NULL, "
    "category TEXT NOT NULL, price_per_use INTEGER NOT NULL CHECK(price_per_use >= 0), access_count INTEGER NOT NULL CHECK(access_count >= 0), "
    "active INTEGER NOT NULL, created_at INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS training_jobs (id INTEGER PRIMARY KEY, creator TEXT NOT NULL, name TEXT NOT NULL, computation_provider TEXT, "
    "status INTEGER NOT NULL, result_url TEXT, total_cost INTEGER NOT NULL CHECK(total_cost >= 0), created_at INTEGER NOT NULL, completed_at INTEGER);",
    "CREATE TABLE IF NOT EXISTS training_job_datasets (job_id INTEGER NOT NULL REFERENCES training_jobs(id), position INTEGER NOT NULL, "
    "dataset_id INTEGER NOT NULL REFERENCES datasets(id), price INTEGER NOT NULL, PRIMARY KEY (job_id, position));",
    "CREATE TABLE IF NOT EXISTS balances (identity TEXT PRIMARY KEY, amount INTEGER NOT NULL CHECK(amount >= 0));",
};

const std::vector<std::string> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS ledger_counters (name TEXT PRIMARY KEY, value BIGINT NOT NULL);",
    "INSERT INTO ledger_counters(name,value) VALUES('last_dataset_id',0) ON CONFLICT (name) DO NOTHING;",
    "INSERT INTO ledger_counters(name,value) VALUES('last_job_id',0) ON CONFLICT (name) DO NOTHING;",
    "CREATE TABLE IF NOT EXISTS datasets (id BIGINT PRIMARY KEY, owner TEXT NOT NULL, name TEXT NOT NULL, metadata_url TEXT NOT NULL, "
    "category TEXT NOT NULL, price_per_use BIGINT NOT NULL CHECK(price_per_use >= 0), access_count BIGINT NOT NULL CHECK(access_count >= 0), "
    "active BOOLEAN NOT NULL, created_at BIGINT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS training_jobs (id BIGINT PRIMARY KEY, creator TEXT NOT NULL, name TEXT NOT NULL, computation_provider TEXT, "
    "status SMALLINT NOT NULL, result_url TEXT, total_cost BIGINT NOT NULL CHECK(total_cost >= 0), created_at BIGINT NOT NULL, completed_at BIGINT);",
    "CREATE TABLE IF NOT EXISTS training_job_datasets (job_id BIGINT NOT NULL REFERENCES training_jobs(id), position INTEGER NOT NULL, "
    "dataset_id BIGINT NOT NULL REFERENCES datasets(id), price BIGINT NOT NULL, PRIMARY KEY (job_id, position));",
    "CREATE TABLE IF NOT EXISTS balances (identity TEXT PRIMARY KEY, amount BIGINT NOT NULL CHECK(amount >= 0));",
};

} // namespace

const std::vector<std::string>& LedgerSchema(Dialect dialect) {
  switch (dialect) {
    case Dialect::kSqlite:
      return kSqliteSchema;
    case Dialect::kPostgres:
      return kPostgresSchema;
  }
  throw std::invalid_argument("unknown SQL dialect");
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace datamarket::db::sql
