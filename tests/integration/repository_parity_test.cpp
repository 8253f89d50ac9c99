#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"

#if DATAMARKET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if DATAMARKET_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using datamarket::db::ErrorCode;
using datamarket::db::Repository;
using datamarket::db::memory::MemoryRepository;
using datamarket::db::model::BalanceRecord;
using datamarket::db::model::DatasetRecord;
using datamarket::db::model::JobEntryRecord;
using datamarket::db::model::JobRecord;
using datamarket::ledger::v1::JOB_STATUS_COMPLETED;
using datamarket::ledger::v1::JOB_STATUS_PENDING;
using datamarket::ledger::v1::JOB_STATUS_PROCESSING;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

constexpr std::chrono::milliseconds kDefaultBusyTimeout{5000};
constexpr std::chrono::milliseconds kShortBusyTimeout{50};

struct BackendFactory {
  std::string                                                        name;
  std::function<std::shared_ptr<Repository>(std::chrono::milliseconds)> make_repository;
  std::function<bool()>                                              supports_restart;
  std::function<void(std::shared_ptr<Repository>&)>                  restart;
  std::function<void()>                                              cleanup;
  // false when a waiting Begin() blocks without a deadline
  bool writer_wait_times_out = true;
};

DatasetRecord MakeDataset(const std::string& owner, uint64_t price) {
  return DatasetRecord{
      .owner         = owner,
      .name          = "imagenet-subset",
      .metadata_url  = "ipfs://meta",
      .category      = "vision",
      .price_per_use = price,
      .access_count  = 0,
      .active        = true,
      .created_at    = 7,
  };
}

void VerifyDatasetLifecycle(Repository& repo, const std::string& owner) {
  auto tx = repo.Begin();

  const auto before = repo.LastDatasetId(*tx);

  auto first = MakeDataset(owner, 10);
  assert(repo.InsertDataset(*tx, first));
  assert(first.id == before + 1);

  auto second = MakeDataset(owner, 15);
  assert(repo.InsertDataset(*tx, second));
  assert(second.id == before + 2);
  assert(repo.LastDatasetId(*tx) == before + 2);

  auto read = repo.GetDataset(*tx, first.id);
  assert(read.has_value());
  assert(read->owner == owner);
  assert(read->name == "imagenet-subset");
  assert(read->metadata_url == "ipfs://meta");
  assert(read->category == "vision");
  assert(read->price_per_use == 10);
  assert(read->access_count == 0);
  assert(read->active);
  assert(read->created_at == 7);

  read->price_per_use = 12;
  read->active        = false;
  read->access_count  = 3;
  assert(repo.UpdateDataset(*tx, *read));

  auto updated = repo.GetDataset(*tx, first.id);
  assert(updated.has_value());
  assert(updated->price_per_use == 12);
  assert(!updated->active);
  assert(updated->access_count == 3);

  DatasetRecord missing = MakeDataset(owner, 1);
  missing.id            = before + 1000;
  auto result           = repo.UpdateDataset(*tx, missing);
  assert(!result);
  assert(result.code == ErrorCode::NotFound);

  assert(!repo.GetDataset(*tx, before + 1000).has_value());

  tx->Commit();
}

void VerifyJobLifecycle(Repository& repo, const std::string& creator) {
  uint64_t dataset_a = 0;
  uint64_t dataset_b = 0;
  uint64_t job_id    = 0;

  {
    auto tx = repo.Begin();
    auto a  = MakeDataset(creator, 10);
    auto b  = MakeDataset(creator, 15);
    assert(repo.InsertDataset(*tx, a));
    assert(repo.InsertDataset(*tx, b));
    dataset_a = a.id;
    dataset_b = b.id;

    JobRecord job;
    job.creator    = creator;
    job.name       = "fine-tune";
    job.entries    = {{.dataset_id = dataset_a, .price = 10}, {.dataset_id = dataset_a, .price = 10}, {.dataset_id = dataset_b, .price = 15}};
    job.status     = JOB_STATUS_PENDING;
    job.total_cost = 35;
    job.created_at = 42;

    const auto before = repo.LastJobId(*tx);
    assert(repo.InsertJob(*tx, job));
    assert(job.id == before + 1);
    assert(repo.LastJobId(*tx) == job.id);
    job_id = job.id;
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto job = repo.GetJob(*tx, job_id);
    assert(job.has_value());
    assert(job->creator == creator);
    assert(job->name == "fine-tune");
    assert(job->status == JOB_STATUS_PENDING);
    assert(!job->computation_provider.has_value());
    assert(!job->result_url.has_value());
    assert(!job->completed_at.has_value());
    assert(job->total_cost == 35);
    assert(job->created_at == 42);
    assert(job->entries.size() == 3);
    assert(job->entries[0].dataset_id == dataset_a);
    assert(job->entries[1].dataset_id == dataset_a);
    assert(job->entries[2].dataset_id == dataset_b);
    assert(job->entries[2].price == 15);

    job->computation_provider = creator + "-provider";
    job->status               = JOB_STATUS_PROCESSING;
    assert(repo.UpdateJob(*tx, *job));

    job->status       = JOB_STATUS_COMPLETED;
    job->result_url   = "s3://results/model.bin";
    job->completed_at = 50;
    assert(repo.UpdateJob(*tx, *job));
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto job = repo.GetJob(*tx, job_id);
    assert(job.has_value());
    assert(job->status == JOB_STATUS_COMPLETED);
    assert(job->computation_provider == creator + "-provider");
    assert(job->result_url == std::string("s3://results/model.bin"));
    assert(job->completed_at == std::optional<uint64_t>(50));
    assert(job->entries.size() == 3);

    JobRecord missing;
    missing.id  = job_id + 1000;
    auto result = repo.UpdateJob(*tx, missing);
    assert(!result);
    assert(result.code == ErrorCode::NotFound);
    assert(!repo.GetJob(*tx, job_id + 1000).has_value());
    tx->Commit();
  }
}

void VerifyBalances(Repository& repo, const std::string& identity) {
  auto tx = repo.Begin();
  assert(!repo.GetBalance(*tx, identity).has_value());

  assert(repo.UpsertBalance(*tx, BalanceRecord{.identity = identity, .amount = 100}));
  auto read = repo.GetBalance(*tx, identity);
  assert(read.has_value());
  assert(read->amount == 100);

  assert(repo.UpsertBalance(*tx, BalanceRecord{.identity = identity, .amount = 0}));
  read = repo.GetBalance(*tx, identity);
  assert(read.has_value());
  assert(read->amount == 0);

  // largest amount every backend stores losslessly
  const uint64_t max_amount = static_cast<uint64_t>(INT64_MAX);
  assert(repo.UpsertBalance(*tx, BalanceRecord{.identity = identity, .amount = max_amount}));
  assert(repo.GetBalance(*tx, identity)->amount == max_amount);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& identity) {
  uint64_t dataset_counter = 0;
  {
    auto tx         = repo.Begin();
    dataset_counter = repo.LastDatasetId(*tx);
    auto dataset    = MakeDataset(identity, 5);
    assert(repo.InsertDataset(*tx, dataset));
    assert(repo.UpsertBalance(*tx, BalanceRecord{.identity = identity, .amount = 77}));
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    // a rolled back insert never burns an id
    assert(repo.LastDatasetId(*tx) == dataset_counter);
    assert(!repo.GetDataset(*tx, dataset_counter + 1).has_value());
    assert(!repo.GetBalance(*tx, identity).has_value());
    tx->Commit();
  }

  {
    // destruction without commit is a rollback too
    auto tx = repo.Begin();
    assert(repo.UpsertBalance(*tx, BalanceRecord{.identity = identity, .amount = 9}));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetBalance(*check_tx, identity).has_value());
  check_tx->Commit();
}

// Concurrent writers on one repository queue behind each other; read-modify-write
// increments from many threads must not lose an update.
void VerifyWriterSerialization(Repository& repo, const std::string& identity) {
  constexpr int kThreads   = 8;
  constexpr int kPerThread = 25;

  std::vector<std::future<int>> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.push_back(std::async(std::launch::async, [&repo, &identity] {
      int failures = 0;
      for (int n = 0; n < kPerThread; ++n) {
        try {
          auto tx      = repo.Begin();
          auto current = repo.GetBalance(*tx, identity);
          if (!repo.UpsertBalance(*tx, BalanceRecord{.identity = identity, .amount = (current ? current->amount : 0) + 1})) {
            ++failures;
            continue;
          }
          tx->Commit();
        } catch (const std::exception& e) {
          std::cerr << "concurrent writer failed: " << e.what() << "\n";
          ++failures;
        }
      }
      return failures;
    }));
  }

  int failures = 0;
  for (auto& worker : workers) {
    failures += worker.get();
  }
  assert(failures == 0);

  auto tx = repo.Begin();
  auto b  = repo.GetBalance(*tx, identity);
  assert(b.has_value());
  assert(b->amount == static_cast<uint64_t>(kThreads * kPerThread));
  tx->Commit();
}

// A waiting writer proceeds once the holder commits and sees its write.
void VerifyWaitingWriterSeesCommit(Repository& repo, const std::string& identity) {
  auto holder = repo.Begin();
  assert(repo.UpsertBalance(*holder, BalanceRecord{.identity = identity, .amount = 11}));

  auto waiter = std::async(std::launch::async, [&repo, &identity] {
    auto tx = repo.Begin();
    auto b  = repo.GetBalance(*tx, identity);
    tx->Commit();
    return b ? b->amount : 0;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  holder->Commit();
  assert(waiter.get() == 11);
}

// With a short busy timeout, a writer on another thread gives up while the
// first transaction stays open, and succeeds once it finishes.
void VerifyBusyTimeout(Repository& repo) {
  auto holder = repo.Begin();

  auto contender = std::async(std::launch::async, [&repo] {
    try {
      auto tx = repo.Begin();
      return false;
    } catch (const std::runtime_error&) {
      return true;
    }
  });
  assert(contender.get());

  holder->Rollback();

  auto next = std::async(std::launch::async, [&repo] {
    auto tx = repo.Begin();
    tx->Commit();
    return true;
  });
  assert(next.get());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& identity) {
  if (!backend.supports_restart()) {
    return;
  }

  auto     repo       = backend.make_repository(kDefaultBusyTimeout);
  uint64_t dataset_id = 0;
  {
    auto tx      = repo->Begin();
    auto dataset = MakeDataset(identity, 20);
    assert(repo->InsertDataset(*tx, dataset));
    dataset_id = dataset.id;
    assert(repo->UpsertBalance(*tx, BalanceRecord{.identity = identity, .amount = 80}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto d  = repo->GetDataset(*tx, dataset_id);
  assert(d.has_value());
  assert(d->owner == identity);
  assert(d->price_per_use == 20);
  assert(repo->LastDatasetId(*tx) >= dataset_id);
  auto b = repo->GetBalance(*tx, identity);
  assert(b.has_value());
  assert(b->amount == 80);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                     = "memory",
      .make_repository       = [](std::chrono::milliseconds busy_timeout) { return std::make_shared<MemoryRepository>(busy_timeout); },
      .supports_restart      = []() { return false; },
      .restart               = [](std::shared_ptr<Repository>&) {},
      .cleanup               = []() {},
      .writer_wait_times_out = true,
  };
}

#if DATAMARKET_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path   = (std::filesystem::temp_directory_path() / ("datamarket_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();
  auto make_repo = [db_path](std::chrono::milliseconds busy_timeout) {
    auto db = std::make_shared<datamarket::db::sqlite::SqliteDB>(db_path, true, busy_timeout);
    datamarket::db::sql::RunMigrations(*db, datamarket::db::sql::LedgerSchema(datamarket::db::sql::Dialect::kSqlite));
    return std::make_shared<datamarket::db::sqlite::SqliteRepository>(std::move(db));
  };
  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo(kDefaultBusyTimeout);
      },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .writer_wait_times_out = true,
  };
}
#endif

#if DATAMARKET_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("DATAMARKET_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("DATAMARKET_TEST_POSTGRES_URI is not set");
  }
  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo](std::chrono::milliseconds) {
    auto pool = std::make_shared<datamarket::db::postgres::PgPool>(conninfo);
    datamarket::db::sql::RunMigrations(*pool, datamarket::db::sql::LedgerSchema(datamarket::db::sql::Dialect::kPostgres));
    return std::make_shared<datamarket::db::postgres::PgRepository>(std::move(pool));
  };
  return BackendFactory{
      .name                     = "postgres",
      .make_repository       = make_repo,
      .supports_restart      = []() { return true; },
      .restart               = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(kDefaultBusyTimeout); },
      .cleanup               = []() {},
      .writer_wait_times_out = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  // identities are unique per run so a shared postgres database can be reused
  const auto run = backend.name + "-" + std::to_string(NowMs());

  auto repo = backend.make_repository(kDefaultBusyTimeout);
  VerifyDatasetLifecycle(*repo, run + "-owner");
  VerifyJobLifecycle(*repo, run + "-creator");
  VerifyBalances(*repo, run + "-balance");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyWriterSerialization(*repo, run + "-concurrent");
  VerifyWaitingWriterSeesCommit(*repo, run + "-waiter");
  repo.reset();

  if (backend.writer_wait_times_out) {
    auto impatient = backend.make_repository(kShortBusyTimeout);
    VerifyBusyTimeout(*impatient);
  }

  VerifyRestartDurability(backend, run + "-durable");
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if DATAMARKET_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif
#if DATAMARKET_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "datamarket_integration_repository_parity: pass\n";
  return 0;
}
