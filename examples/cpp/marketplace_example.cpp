#include <iostream>
#include <memory>
#include <string>

#include "internal/chain/external_holdings.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/error_kind.hpp"

using namespace datamarket::ledger::v1;

namespace {

void Shutdown() {
  datamarket::observability::ShutdownLogging();
  datamarket::observability::ShutdownMetrics();
  datamarket::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "Usage: marketplace_example [config.yaml]" << std::endl;
    return 1;
  }

  try {
    datamarket::runtime::config::RuntimeConfig config;
    if (argc == 2) {
      config = datamarket::config::ConfigLoader::LoadFromYaml(argv[1]);
    }

    datamarket::observability::InitializeTracing(config);
    datamarket::observability::InitializeMetrics(config);
    datamarket::observability::InitializeLogging(config);

    // The host owns the external holdings; seed the participants.
    auto holdings = std::make_shared<datamarket::chain::ExternalHoldings>();
    holdings->Fund("alice", 1'000);

    auto  runtime = datamarket::factory::BuildRuntime(config, holdings);
    auto& ledger  = *runtime.ledger_service;

    RegisterDatasetRequest reg;
    reg.set_name("street-scenes");
    reg.set_metadata_url("ipfs://street-scenes/manifest.json");
    reg.set_price_per_use(120);
    reg.set_category("vision");
    const auto dataset_id = ledger.RegisterDataset("bob", reg).dataset_id();

    DepositFundsRequest deposit;
    deposit.set_amount(500);
    ledger.DepositFunds("alice", deposit);

    CreateTrainingJobRequest create;
    create.set_name("detector-v1");
    create.add_dataset_ids(dataset_id);
    create.add_dataset_ids(dataset_id);
    const auto created = ledger.CreateTrainingJob("alice", create);
    std::cout << "job " << created.job_id() << " escrowed " << created.total_cost() << std::endl;

    AcceptTrainingJobRequest accept;
    accept.set_job_id(created.job_id());
    ledger.AcceptTrainingJob("gpu-provider", accept);

    CompleteTrainingJobRequest complete;
    complete.set_job_id(created.job_id());
    complete.set_result_url("ipfs://detector-v1/weights");
    const auto done = ledger.CompleteTrainingJob("gpu-provider", complete);
    std::cout << "job " << done.job().id() << " is " << JobStatus_Name(done.job().status()) << std::endl;

    // a second completion is rejected with a tagged error
    try {
      ledger.CompleteTrainingJob("gpu-provider", complete);
    } catch (const std::exception& e) {
      std::cout << "second completion: " << datamarket::util::ErrorKindName(datamarket::util::ClassifyError(e)) << std::endl;
    }

    for (const auto* identity : {"alice", "bob"}) {
      GetUserBalanceRequest balance;
      balance.set_identity(identity);
      std::cout << identity << " balance " << ledger.GetUserBalance(balance).amount() << std::endl;
    }
    std::cout << "platform fee " << ledger.GetPlatformFee().fee_percent() << "%" << std::endl;
  } catch (const std::exception& e) {
    DATAMARKET_LOG_ERROR("Fatal error", {datamarket::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  Shutdown();
  return 0;
}
