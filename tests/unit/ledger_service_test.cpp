#include "internal/service/ledger_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/chain/external_holdings.hpp"
#include "internal/chain/height_source.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/balance_ledger.hpp"
#include "internal/ledger/dataset_registry.hpp"
#include "internal/ledger/job_ledger.hpp"
#include "internal/util/error_kind.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace datamarket::ledger::v1;

using datamarket::chain::ExternalHoldings;
using datamarket::chain::ManualHeightSource;
using datamarket::db::memory::MemoryRepository;
using datamarket::service::LedgerService;
using datamarket::service::ServiceContext;
using datamarket::util::ClassifyError;

struct Harness {
  Harness() {
    auto repo = std::make_shared<MemoryRepository>();
    auto balances = std::make_shared<datamarket::ledger::BalanceLedger>(repo, holdings);

    ServiceContext ctx;
    ctx.datasets = std::make_shared<datamarket::ledger::DatasetRegistry>(repo, height);
    ctx.balances = balances;
    ctx.jobs     = std::make_shared<datamarket::ledger::JobLedger>(repo, balances, height, datamarket::ledger::EscrowPolicy::Hold());
    service      = std::make_unique<LedgerService>(ctx);
  }

  std::shared_ptr<ExternalHoldings>   holdings = std::make_shared<ExternalHoldings>();
  std::shared_ptr<ManualHeightSource> height   = std::make_shared<ManualHeightSource>(1);
  std::unique_ptr<LedgerService>      service;
};

template <typename Fn>
ErrorKind FailureKind(Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    return ClassifyError(e);
  }
  return ERROR_KIND_UNSPECIFIED;
}

uint64_t BalanceOf(LedgerService& service, const std::string& identity) {
  GetUserBalanceRequest req;
  req.set_identity(identity);
  return service.GetUserBalance(req).amount();
}

void TestEndToEndMarketplaceScenario() {
  Harness h;
  auto&   svc = *h.service;
  h.holdings->Fund("U", 100);

  RegisterDatasetRequest reg;
  reg.set_name("D");
  reg.set_metadata_url("ipfs://d");
  reg.set_price_per_use(20);
  reg.set_category("vision");
  const auto dataset_id = svc.RegisterDataset("U", reg).dataset_id();
  assert(dataset_id == 1);

  DepositFundsRequest deposit;
  deposit.set_amount(100);
  assert(svc.DepositFunds("U", deposit).balance() == 100);

  CreateTrainingJobRequest create;
  create.set_name("J");
  create.add_dataset_ids(dataset_id);
  const auto created = svc.CreateTrainingJob("U", create);
  assert(created.total_cost() == 20);
  assert(BalanceOf(svc, "U") == 80);

  AcceptTrainingJobRequest accept;
  accept.set_job_id(created.job_id());
  const auto accepted = svc.AcceptTrainingJob("P", accept);
  assert(accepted.job().status() == JOB_STATUS_PROCESSING);
  assert(accepted.job().computation_provider() == "P");

  CompleteTrainingJobRequest complete;
  complete.set_job_id(created.job_id());
  complete.set_result_url("ipfs://model");
  const auto completed = svc.CompleteTrainingJob("P", complete);
  assert(completed.job().status() == JOB_STATUS_COMPLETED);
  assert(completed.job().result_url() == "ipfs://model");
  assert(completed.job().has_completed_at());

  GetDatasetRequest get_dataset;
  get_dataset.set_dataset_id(dataset_id);
  assert(svc.GetDataset(get_dataset).dataset().access_count() == 1);

  assert(FailureKind([&] { svc.CompleteTrainingJob("P", complete); }) == ERROR_KIND_INVALID_PARAMETERS);
}

void TestLookupsOfUnknownIdsLeaveMessageUnset() {
  Harness h;

  GetDatasetRequest get_dataset;
  get_dataset.set_dataset_id(5);
  assert(!h.service->GetDataset(get_dataset).has_dataset());

  GetTrainingJobRequest get_job;
  get_job.set_job_id(5);
  assert(!h.service->GetTrainingJob(get_job).has_job());

  assert(BalanceOf(*h.service, "stranger") == 0);
}

void TestRecordsConvertWithAllFields() {
  Harness h;
  auto&   svc = *h.service;
  h.height->Set(40);

  RegisterDatasetRequest reg;
  reg.set_name("corpus");
  reg.set_metadata_url("ipfs://corpus");
  reg.set_price_per_use(7);
  reg.set_category("text");
  const auto id = svc.RegisterDataset("owner", reg).dataset_id();

  GetDatasetRequest get_dataset;
  get_dataset.set_dataset_id(id);
  const auto dataset = svc.GetDataset(get_dataset).dataset();
  assert(dataset.id() == id);
  assert(dataset.owner() == "owner");
  assert(dataset.name() == "corpus");
  assert(dataset.metadata_url() == "ipfs://corpus");
  assert(dataset.category() == "text");
  assert(dataset.price_per_use() == 7);
  assert(dataset.access_count() == 0);
  assert(dataset.active());
  assert(dataset.created_at() == 40);

  h.holdings->Fund("creator", 50);
  DepositFundsRequest deposit;
  deposit.set_amount(50);
  svc.DepositFunds("creator", deposit);

  CreateTrainingJobRequest create;
  create.set_name("train");
  create.add_dataset_ids(id);
  create.add_dataset_ids(id);
  const auto job_id = svc.CreateTrainingJob("creator", create).job_id();

  GetTrainingJobRequest get_job;
  get_job.set_job_id(job_id);
  const auto job = svc.GetTrainingJob(get_job).job();
  assert(job.id() == job_id);
  assert(job.creator() == "creator");
  assert(job.name() == "train");
  assert(job.dataset_ids_size() == 2);
  assert(job.dataset_ids(0) == id && job.dataset_ids(1) == id);
  assert(!job.has_computation_provider());
  assert(!job.has_result_url());
  assert(!job.has_completed_at());
  assert(job.status() == JOB_STATUS_PENDING);
  assert(job.total_cost() == 14);
  assert(job.created_at() == 40);
}

void TestNonOwnerUpdateIsNotAuthorizedAndChangesNothing() {
  Harness h;
  auto&   svc = *h.service;

  RegisterDatasetRequest reg;
  reg.set_name("corpus");
  reg.set_price_per_use(7);
  const auto id = svc.RegisterDataset("owner", reg).dataset_id();

  UpdateDatasetRequest update;
  update.set_dataset_id(id);
  update.set_name("stolen");
  update.set_price_per_use(0);
  update.set_active(false);
  assert(FailureKind([&] { svc.UpdateDataset("mallory", update); }) == ERROR_KIND_NOT_AUTHORIZED);

  GetDatasetRequest get_dataset;
  get_dataset.set_dataset_id(id);
  const auto dataset = svc.GetDataset(get_dataset).dataset();
  assert(dataset.name() == "corpus");
  assert(dataset.price_per_use() == 7);
  assert(dataset.active());

  const auto updated = svc.UpdateDataset("owner", update).dataset();
  assert(updated.name() == "stolen");
  assert(!updated.active());
}

void TestErrorKindsSurfaceThroughService() {
  Harness h;
  auto&   svc = *h.service;

  WithdrawFundsRequest withdraw;
  withdraw.set_amount(1);
  assert(FailureKind([&] { svc.WithdrawFunds("nobody", withdraw); }) == ERROR_KIND_INSUFFICIENT_FUNDS);

  // no external holding to draw from
  DepositFundsRequest deposit;
  deposit.set_amount(10);
  assert(FailureKind([&] { svc.DepositFunds("nobody", deposit); }) == ERROR_KIND_PAYMENT_FAILED);
  assert(BalanceOf(svc, "nobody") == 0);

  AcceptTrainingJobRequest accept;
  accept.set_job_id(3);
  assert(FailureKind([&] { svc.AcceptTrainingJob("gpu", accept); }) == ERROR_KIND_NOT_FOUND);

  RegisterDatasetRequest reg;
  reg.set_name(std::string(101, 'x'));
  assert(FailureKind([&] { svc.RegisterDataset("owner", reg); }) == ERROR_KIND_INVALID_PARAMETERS);

  CreateTrainingJobRequest create;
  create.add_dataset_ids(1);
  assert(FailureKind([&] { svc.CreateTrainingJob("creator", create); }) == ERROR_KIND_NOT_FOUND);
}

void TestCancelAndFailThroughService() {
  Harness h;
  auto&   svc = *h.service;
  h.holdings->Fund("creator", 30);

  RegisterDatasetRequest reg;
  reg.set_name("corpus");
  reg.set_price_per_use(10);
  const auto id = svc.RegisterDataset("owner", reg).dataset_id();

  DepositFundsRequest deposit;
  deposit.set_amount(30);
  svc.DepositFunds("creator", deposit);

  CreateTrainingJobRequest create;
  create.add_dataset_ids(id);
  const auto first  = svc.CreateTrainingJob("creator", create).job_id();
  const auto second = svc.CreateTrainingJob("creator", create).job_id();
  assert(BalanceOf(svc, "creator") == 10);

  CancelTrainingJobRequest cancel;
  cancel.set_job_id(first);
  assert(svc.CancelTrainingJob("creator", cancel).job().status() == JOB_STATUS_FAILED);

  AcceptTrainingJobRequest accept;
  accept.set_job_id(second);
  svc.AcceptTrainingJob("gpu", accept);
  FailTrainingJobRequest fail;
  fail.set_job_id(second);
  assert(svc.FailTrainingJob("gpu", fail).job().status() == JOB_STATUS_FAILED);

  assert(BalanceOf(svc, "creator") == 30);

  WithdrawFundsRequest withdraw;
  withdraw.set_amount(30);
  assert(svc.WithdrawFunds("creator", withdraw).balance() == 0);
  assert(h.holdings->Holding("creator") == 30);
}

void TestPlatformFeeIsThreePercent() {
  Harness h;
  assert(h.service->GetPlatformFee().fee_percent() == 3);
}

void TestClassifyErrorMapsTaxonomy() {
  using namespace datamarket::util;
  assert(ClassifyError(NotAuthorized("x")) == ERROR_KIND_NOT_AUTHORIZED);
  assert(ClassifyError(NotFound("x")) == ERROR_KIND_NOT_FOUND);
  assert(ClassifyError(InvalidParameters("x")) == ERROR_KIND_INVALID_PARAMETERS);
  assert(ClassifyError(InsufficientFunds("x")) == ERROR_KIND_INSUFFICIENT_FUNDS);
  assert(ClassifyError(PaymentFailed("x")) == ERROR_KIND_PAYMENT_FAILED);
  assert(ClassifyError(AlreadyExists("x")) == ERROR_KIND_ALREADY_EXISTS);
  assert(ClassifyError(std::runtime_error("disk on fire")) == ERROR_KIND_INTERNAL);
  assert(ErrorKindName(ERROR_KIND_NOT_FOUND) == "ERROR_KIND_NOT_FOUND");
}

} // namespace

int main() {
  TestEndToEndMarketplaceScenario();
  TestLookupsOfUnknownIdsLeaveMessageUnset();
  TestRecordsConvertWithAllFields();
  TestNonOwnerUpdateIsNotAuthorizedAndChangesNothing();
  TestErrorKindsSurfaceThroughService();
  TestCancelAndFailThroughService();
  TestPlatformFeeIsThreePercent();
  TestClassifyErrorMapsTaxonomy();

  std::cout << "datamarket_unit_ledger_service: pass\n";
  return 0;
}
