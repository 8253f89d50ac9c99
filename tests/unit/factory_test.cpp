#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/chain/external_holdings.hpp"
#include "internal/chain/height_source.hpp"

namespace {

using namespace datamarket::ledger::v1;
using datamarket::chain::ExternalHoldings;
using datamarket::chain::ManualHeightSource;
using datamarket::factory::BuildRuntime;
using datamarket::runtime::config::ESCROW_RELEASE_ON_COMPLETION;
using datamarket::runtime::config::RuntimeConfig;

uint64_t BalanceOf(datamarket::service::LedgerService& service, const std::string& identity) {
  GetUserBalanceRequest req;
  req.set_identity(identity);
  return service.GetUserBalance(req).amount();
}

// register, fund and run a single-dataset job to completion
void RunMarketplaceRound(datamarket::service::LedgerService& service, ExternalHoldings& holdings) {
  holdings.Fund("creator", 1'000);

  RegisterDatasetRequest reg;
  reg.set_name("corpus");
  reg.set_price_per_use(100);
  const auto dataset_id = service.RegisterDataset("owner", reg).dataset_id();

  DepositFundsRequest deposit;
  deposit.set_amount(1'000);
  service.DepositFunds("creator", deposit);

  CreateTrainingJobRequest create;
  create.add_dataset_ids(dataset_id);
  const auto job_id = service.CreateTrainingJob("creator", create).job_id();

  AcceptTrainingJobRequest accept;
  accept.set_job_id(job_id);
  service.AcceptTrainingJob("gpu", accept);

  CompleteTrainingJobRequest complete;
  complete.set_job_id(job_id);
  complete.set_result_url("ipfs://model");
  service.CompleteTrainingJob("gpu", complete);
}

void TestDefaultConfigBuildsMemoryLedger() {
  RuntimeConfig config;
  config.mutable_ledger()->set_genesis_height(500);

  auto deps = BuildRuntime(config);
  assert(deps.repository);
  assert(deps.transfer);
  assert(deps.height);
  assert(deps.ledger_service);
  assert(deps.height->CurrentHeight() == 500);

  auto holdings = std::dynamic_pointer_cast<ExternalHoldings>(deps.transfer);
  assert(holdings);

  RunMarketplaceRound(*deps.ledger_service, *holdings);
  assert(BalanceOf(*deps.ledger_service, "creator") == 900);
  // default escrow policy holds funds
  assert(BalanceOf(*deps.ledger_service, "owner") == 0);

  GetDatasetRequest get_dataset;
  get_dataset.set_dataset_id(1);
  assert(deps.ledger_service->GetDataset(get_dataset).dataset().created_at() == 500);
}

void TestInjectedCollaboratorsAreUsed() {
  RuntimeConfig config;
  config.mutable_database()->mutable_memory()->set_busy_timeout_ms(100);

  auto holdings = std::make_shared<ExternalHoldings>();
  auto height   = std::make_shared<ManualHeightSource>(77);

  auto deps = BuildRuntime(config, holdings, height);
  assert(deps.transfer == holdings);
  assert(deps.height == height);

  holdings->Fund("alice", 10);
  DepositFundsRequest deposit;
  deposit.set_amount(10);
  assert(deps.ledger_service->DepositFunds("alice", deposit).balance() == 10);
  assert(holdings->Custody() == 10);
}

void TestReleaseOnCompletionIsWired() {
  RuntimeConfig config;
  config.mutable_ledger()->set_escrow_release(ESCROW_RELEASE_ON_COMPLETION);
  config.mutable_ledger()->set_treasury_identity("treasury");

  auto deps     = BuildRuntime(config);
  auto holdings = std::dynamic_pointer_cast<ExternalHoldings>(deps.transfer);
  RunMarketplaceRound(*deps.ledger_service, *holdings);

  assert(BalanceOf(*deps.ledger_service, "treasury") == 3);
  assert(BalanceOf(*deps.ledger_service, "owner") == 97);
}

void TestInvalidConfigIsRejected() {
  RuntimeConfig config;
  config.mutable_ledger()->set_escrow_release(ESCROW_RELEASE_ON_COMPLETION);

  bool threw = false;
  try {
    (void)BuildRuntime(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

#if DATAMARKET_DB_SQLITE
void TestSqliteLedgerSurvivesRebuild() {
  const auto db_path = std::filesystem::temp_directory_path() / "datamarket_factory_test.db";
  std::filesystem::remove(db_path);

  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(db_path.string());
  config.mutable_database()->mutable_sqlite()->set_wal_mode(false);

  {
    auto deps     = BuildRuntime(config);
    auto holdings = std::dynamic_pointer_cast<ExternalHoldings>(deps.transfer);
    RunMarketplaceRound(*deps.ledger_service, *holdings);
  }

  // migrations are idempotent and committed state is durable
  auto deps = BuildRuntime(config);
  assert(BalanceOf(*deps.ledger_service, "creator") == 900);

  GetTrainingJobRequest get_job;
  get_job.set_job_id(1);
  const auto job = deps.ledger_service->GetTrainingJob(get_job).job();
  assert(job.status() == JOB_STATUS_COMPLETED);
  assert(job.computation_provider() == "gpu");

  GetDatasetRequest get_dataset;
  get_dataset.set_dataset_id(1);
  assert(deps.ledger_service->GetDataset(get_dataset).dataset().access_count() == 1);

  deps = {};
  std::filesystem::remove(db_path);
}

// Ledger operations from many threads share one SQLite connection; each
// waits for the writer lock instead of failing on a nested BEGIN.
void TestSqliteConcurrentDeposits() {
  const auto db_path = std::filesystem::temp_directory_path() / "datamarket_factory_concurrent_test.db";
  std::filesystem::remove(db_path);

  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(db_path.string());
  config.mutable_database()->mutable_sqlite()->set_wal_mode(true);

  constexpr int kThreads  = 8;
  constexpr int kDeposits = 50;

  {
    auto deps     = BuildRuntime(config);
    auto holdings = std::dynamic_pointer_cast<ExternalHoldings>(deps.transfer);
    for (int t = 0; t < kThreads; ++t) {
      holdings->Fund("depositor-" + std::to_string(t), kDeposits);
    }
    holdings->Fund("shared", kThreads * kDeposits);

    auto& service = *deps.ledger_service;
    std::vector<std::future<int>> workers;
    for (int t = 0; t < kThreads; ++t) {
      workers.push_back(std::async(std::launch::async, [&service, t] {
        int failures = 0;
        for (int n = 0; n < kDeposits; ++n) {
          DepositFundsRequest deposit;
          deposit.set_amount(1);
          try {
            service.DepositFunds("depositor-" + std::to_string(t), deposit);
            service.DepositFunds("shared", deposit);
          } catch (const std::exception& e) {
            std::cerr << "deposit failed: " << e.what() << "\n";
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

    for (int t = 0; t < kThreads; ++t) {
      assert(BalanceOf(service, "depositor-" + std::to_string(t)) == static_cast<uint64_t>(kDeposits));
    }
    assert(BalanceOf(service, "shared") == static_cast<uint64_t>(kThreads * kDeposits));
    assert(holdings->Custody() == static_cast<uint64_t>(2 * kThreads * kDeposits));
  }

  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path.string() + "-wal");
  std::filesystem::remove(db_path.string() + "-shm");
}
#endif

} // namespace

int main() {
  TestDefaultConfigBuildsMemoryLedger();
  TestInjectedCollaboratorsAreUsed();
  TestReleaseOnCompletionIsWired();
  TestInvalidConfigIsRejected();
#if DATAMARKET_DB_SQLITE
  TestSqliteLedgerSurvivesRebuild();
  TestSqliteConcurrentDeposits();
#endif

  std::cout << "datamarket_unit_factory: pass\n";
  return 0;
}
