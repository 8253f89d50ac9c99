#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/chain/height_source.hpp"
#include "internal/chain/value_transfer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/ledger_service.hpp"

namespace datamarket::factory {

/*
  RuntimeDependencies

  Owns all long-lived singletons a host embeds.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<chain::HeightSource> height;
  std::shared_ptr<chain::ValueTransfer> transfer;

  std::shared_ptr<service::LedgerService> ledger_service;
};


/*
  BuildRuntime

  Constructs the entire ledger based on runtime config.

  transfer and height default to the in-process ExternalHoldings and a
  ManualHeightSource seeded from ledger.genesis_height.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies BuildRuntime(
    const datamarket::runtime::config::RuntimeConfig& config,
    std::shared_ptr<chain::ValueTransfer> transfer = nullptr,
    std::shared_ptr<chain::HeightSource> height = nullptr);

}
