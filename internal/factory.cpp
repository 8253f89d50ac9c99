#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/chain/external_holdings.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/ledger/balance_ledger.hpp"
#include "internal/ledger/dataset_registry.hpp"
#include "internal/ledger/escrow_policy.hpp"
#include "internal/ledger/job_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if DATAMARKET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if DATAMARKET_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace datamarket::factory {

namespace {

constexpr std::chrono::milliseconds kDefaultBusyTimeout{5000};

std::shared_ptr<db::Repository> BuildRepository(const datamarket::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DATAMARKET_DB_SQLITE
    const auto busy_timeout = database.sqlite().busy_timeout_ms() == 0 ? kDefaultBusyTimeout
                                                                       : std::chrono::milliseconds(database.sqlite().busy_timeout_ms());
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode(), busy_timeout);
    db::sql::RunMigrations(*sqlite_db, db::sql::LedgerSchema(db::sql::Dialect::kSqlite));
    DATAMARKET_LOG_INFO("ledger store ready", {observability::StringField("backend", "sqlite"),
                                               observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DATAMARKET_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::sql::RunMigrations(*pool, db::sql::LedgerSchema(db::sql::Dialect::kPostgres));
    DATAMARKET_LOG_INFO("ledger store ready", {observability::StringField("backend", "postgres"),
                                               observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  const auto busy_timeout = database.memory().busy_timeout_ms() == 0 ? kDefaultBusyTimeout
                                                                     : std::chrono::milliseconds(database.memory().busy_timeout_ms());
  DATAMARKET_LOG_INFO("ledger store ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>(busy_timeout);
}

} // namespace

/*
    Build full ledger dependency graph
*/
RuntimeDependencies BuildRuntime(const datamarket::runtime::config::RuntimeConfig& config, std::shared_ptr<chain::ValueTransfer> transfer,
                                 std::shared_ptr<chain::HeightSource> height) {
  config::ValidateConfig(config);

  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  deps.repository = BuildRepository(config);
  deps.transfer   = transfer ? std::move(transfer) : std::make_shared<chain::ExternalHoldings>();
  deps.height     = height ? std::move(height) : std::make_shared<chain::ManualHeightSource>(config.ledger().genesis_height());

  // ------------------------------------------------------------------
  // Ledger components
  // ------------------------------------------------------------------
  ledger::EscrowPolicy escrow(config.ledger().escrow_release(), config.ledger().treasury_identity());

  auto balances = std::make_shared<ledger::BalanceLedger>(deps.repository, deps.transfer);
  auto datasets = std::make_shared<ledger::DatasetRegistry>(deps.repository, deps.height);
  auto jobs     = std::make_shared<ledger::JobLedger>(deps.repository, balances, deps.height, std::move(escrow));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.datasets = datasets;
  ctx.jobs     = jobs;
  ctx.balances = balances;

  deps.ledger_service = std::make_shared<service::LedgerService>(ctx);

  DATAMARKET_LOG_INFO("ledger runtime built", {observability::BoolField("escrow_release_on_completion", jobs->Escrow().ReleasesOnCompletion()),
                                               observability::UintField("height", deps.height->CurrentHeight())});
  return deps;
}

} // namespace datamarket::factory
