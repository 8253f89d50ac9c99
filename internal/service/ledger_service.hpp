#pragma once

#include <string>

#include "service_context.hpp"
#include "datamarket/ledger/v1.hpp"

namespace datamarket::service {

/*
  Public operation surface of the marketplace.

  caller is the identity the host has already authenticated. Failures
  surface as util:: exceptions; util::ClassifyError maps them to
  ledger::v1::ErrorKind.
*/
class LedgerService {
public:
  explicit LedgerService(ServiceContext ctx);

  datamarket::ledger::v1::RegisterDatasetResponse
  RegisterDataset(const std::string& caller, const datamarket::ledger::v1::RegisterDatasetRequest& req);

  datamarket::ledger::v1::UpdateDatasetResponse
  UpdateDataset(const std::string& caller, const datamarket::ledger::v1::UpdateDatasetRequest& req);

  // dataset is unset when the id is unknown
  datamarket::ledger::v1::GetDatasetResponse
  GetDataset(const datamarket::ledger::v1::GetDatasetRequest& req);

  datamarket::ledger::v1::CreateTrainingJobResponse
  CreateTrainingJob(const std::string& caller, const datamarket::ledger::v1::CreateTrainingJobRequest& req);

  datamarket::ledger::v1::TrainingJobResponse
  AcceptTrainingJob(const std::string& caller, const datamarket::ledger::v1::AcceptTrainingJobRequest& req);

  datamarket::ledger::v1::TrainingJobResponse
  CompleteTrainingJob(const std::string& caller, const datamarket::ledger::v1::CompleteTrainingJobRequest& req);

  datamarket::ledger::v1::TrainingJobResponse
  CancelTrainingJob(const std::string& caller, const datamarket::ledger::v1::CancelTrainingJobRequest& req);

  datamarket::ledger::v1::TrainingJobResponse
  FailTrainingJob(const std::string& caller, const datamarket::ledger::v1::FailTrainingJobRequest& req);

  // job is unset when the id is unknown
  datamarket::ledger::v1::TrainingJobResponse
  GetTrainingJob(const datamarket::ledger::v1::GetTrainingJobRequest& req);

  datamarket::ledger::v1::GetUserBalanceResponse
  GetUserBalance(const datamarket::ledger::v1::GetUserBalanceRequest& req);

  datamarket::ledger::v1::BalanceResponse
  DepositFunds(const std::string& caller, const datamarket::ledger::v1::DepositFundsRequest& req);

  datamarket::ledger::v1::BalanceResponse
  WithdrawFunds(const std::string& caller, const datamarket::ledger::v1::WithdrawFundsRequest& req);

  datamarket::ledger::v1::GetPlatformFeeResponse GetPlatformFee();

private:
  ServiceContext ctx_;
};

}
