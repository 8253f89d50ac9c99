#pragma once

#include <memory>

namespace datamarket::ledger { class DatasetRegistry; }
namespace datamarket::ledger { class JobLedger; }
namespace datamarket::ledger { class BalanceLedger; }

namespace datamarket::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<datamarket::ledger::DatasetRegistry> datasets;
  std::shared_ptr<datamarket::ledger::JobLedger> jobs;
  std::shared_ptr<datamarket::ledger::BalanceLedger> balances;
};

}
