#include "ledger_service.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include "internal/ledger/balance_ledger.hpp"
#include "internal/ledger/dataset_registry.hpp"
#include "internal/ledger/escrow_policy.hpp"
#include "internal/ledger/job_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/error_kind.hpp"

namespace datamarket::service {

using namespace datamarket::ledger::v1;

namespace {

template <typename Fn>
auto ObserveOperation(std::string_view operation, std::string_view caller, Fn&& fn) {
  datamarket::observability::SpanScope span(operation);
  if (!caller.empty()) {
    span.SetAttribute("ledger.caller", caller);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      datamarket::observability::Metrics::Instance().RecordRequest(operation, true);
      datamarket::observability::Metrics::Instance().ObserveRequestLatencyMs(operation, elapsed_ms());
      return;
    } else {
      auto result = fn();
      datamarket::observability::Metrics::Instance().RecordRequest(operation, true);
      datamarket::observability::Metrics::Instance().ObserveRequestLatencyMs(operation, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    const auto kind = datamarket::util::ClassifyError(ex);
    span.RecordException(ex.what());
    span.SetAttribute("ledger.error_kind", datamarket::util::ErrorKindName(kind));

    // rejected requests are routine; only unclassified failures are errors
    if (kind == ERROR_KIND_INTERNAL) {
      DATAMARKET_LOG_ERROR("ledger operation failed",
                           {datamarket::observability::StringField("operation", operation), datamarket::observability::StringField("caller", caller),
                            datamarket::observability::StringField("error_kind", datamarket::util::ErrorKindName(kind)),
                            datamarket::observability::StringField("error", ex.what())});
    } else {
      DATAMARKET_LOG_WARN("ledger operation rejected",
                          {datamarket::observability::StringField("operation", operation), datamarket::observability::StringField("caller", caller),
                           datamarket::observability::StringField("error_kind", datamarket::util::ErrorKindName(kind)),
                           datamarket::observability::StringField("error", ex.what())});
    }
    datamarket::observability::Metrics::Instance().RecordRequest(operation, false);
    datamarket::observability::Metrics::Instance().ObserveRequestLatencyMs(operation, elapsed_ms());
    throw;
  }
}

Dataset ToProto(const datamarket::db::model::DatasetRecord& record) {
  Dataset dataset;
  dataset.set_id(record.id);
  dataset.set_owner(record.owner);
  dataset.set_name(record.name);
  dataset.set_metadata_url(record.metadata_url);
  dataset.set_category(record.category);
  dataset.set_price_per_use(record.price_per_use);
  dataset.set_access_count(record.access_count);
  dataset.set_active(record.active);
  dataset.set_created_at(record.created_at);
  return dataset;
}

TrainingJob ToProto(const datamarket::db::model::JobRecord& record) {
  TrainingJob job;
  job.set_id(record.id);
  job.set_creator(record.creator);
  job.set_name(record.name);
  for (const auto& entry : record.entries) {
    job.add_dataset_ids(entry.dataset_id);
  }
  if (record.computation_provider) {
    job.set_computation_provider(*record.computation_provider);
  }
  job.set_status(record.status);
  if (record.result_url) {
    job.set_result_url(*record.result_url);
  }
  job.set_total_cost(record.total_cost);
  job.set_created_at(record.created_at);
  if (record.completed_at) {
    job.set_completed_at(*record.completed_at);
  }
  return job;
}

TrainingJobResponse JobResponse(const datamarket::db::model::JobRecord& record) {
  TrainingJobResponse resp;
  *resp.mutable_job() = ToProto(record);
  return resp;
}

} // namespace

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.datasets || !ctx_.jobs || !ctx_.balances) {
    throw std::invalid_argument("LedgerService requires dataset, job and balance ledgers");
  }
}

RegisterDatasetResponse LedgerService::RegisterDataset(const std::string& caller, const RegisterDatasetRequest& req) {
  return ObserveOperation("LedgerService.RegisterDataset", caller, [&] {
    RegisterDatasetResponse resp;
    resp.set_dataset_id(ctx_.datasets->RegisterDataset(caller, req.name(), req.metadata_url(), req.price_per_use(), req.category()));
    return resp;
  });
}

UpdateDatasetResponse LedgerService::UpdateDataset(const std::string& caller, const UpdateDatasetRequest& req) {
  return ObserveOperation("LedgerService.UpdateDataset", caller, [&] {
    UpdateDatasetResponse resp;
    *resp.mutable_dataset() =
        ToProto(ctx_.datasets->UpdateDataset(caller, req.dataset_id(), req.name(), req.metadata_url(), req.price_per_use(), req.active(), req.category()));
    return resp;
  });
}

GetDatasetResponse LedgerService::GetDataset(const GetDatasetRequest& req) {
  return ObserveOperation("LedgerService.GetDataset", {}, [&] {
    GetDatasetResponse resp;
    if (auto record = ctx_.datasets->GetDataset(req.dataset_id())) {
      *resp.mutable_dataset() = ToProto(*record);
    }
    return resp;
  });
}

CreateTrainingJobResponse LedgerService::CreateTrainingJob(const std::string& caller, const CreateTrainingJobRequest& req) {
  return ObserveOperation("LedgerService.CreateTrainingJob", caller, [&] {
    const std::vector<uint64_t> dataset_ids(req.dataset_ids().begin(), req.dataset_ids().end());
    const auto                  job = ctx_.jobs->CreateTrainingJob(caller, req.name(), dataset_ids);

    CreateTrainingJobResponse resp;
    resp.set_job_id(job.id);
    resp.set_total_cost(job.total_cost);
    return resp;
  });
}

TrainingJobResponse LedgerService::AcceptTrainingJob(const std::string& caller, const AcceptTrainingJobRequest& req) {
  return ObserveOperation("LedgerService.AcceptTrainingJob", caller, [&] { return JobResponse(ctx_.jobs->AcceptTrainingJob(caller, req.job_id())); });
}

TrainingJobResponse LedgerService::CompleteTrainingJob(const std::string& caller, const CompleteTrainingJobRequest& req) {
  return ObserveOperation("LedgerService.CompleteTrainingJob", caller,
                          [&] { return JobResponse(ctx_.jobs->CompleteTrainingJob(caller, req.job_id(), req.result_url())); });
}

TrainingJobResponse LedgerService::CancelTrainingJob(const std::string& caller, const CancelTrainingJobRequest& req) {
  return ObserveOperation("LedgerService.CancelTrainingJob", caller, [&] { return JobResponse(ctx_.jobs->CancelTrainingJob(caller, req.job_id())); });
}

TrainingJobResponse LedgerService::FailTrainingJob(const std::string& caller, const FailTrainingJobRequest& req) {
  return ObserveOperation("LedgerService.FailTrainingJob", caller, [&] { return JobResponse(ctx_.jobs->FailTrainingJob(caller, req.job_id())); });
}

TrainingJobResponse LedgerService::GetTrainingJob(const GetTrainingJobRequest& req) {
  return ObserveOperation("LedgerService.GetTrainingJob", {}, [&] {
    TrainingJobResponse resp;
    if (auto record = ctx_.jobs->GetTrainingJob(req.job_id())) {
      *resp.mutable_job() = ToProto(*record);
    }
    return resp;
  });
}

GetUserBalanceResponse LedgerService::GetUserBalance(const GetUserBalanceRequest& req) {
  return ObserveOperation("LedgerService.GetUserBalance", {}, [&] {
    GetUserBalanceResponse resp;
    resp.set_amount(ctx_.balances->GetUserBalance(req.identity()));
    return resp;
  });
}

BalanceResponse LedgerService::DepositFunds(const std::string& caller, const DepositFundsRequest& req) {
  return ObserveOperation("LedgerService.DepositFunds", caller, [&] {
    BalanceResponse resp;
    resp.set_balance(ctx_.balances->DepositFunds(caller, req.amount()));
    return resp;
  });
}

BalanceResponse LedgerService::WithdrawFunds(const std::string& caller, const WithdrawFundsRequest& req) {
  return ObserveOperation("LedgerService.WithdrawFunds", caller, [&] {
    BalanceResponse resp;
    resp.set_balance(ctx_.balances->WithdrawFunds(caller, req.amount()));
    return resp;
  });
}

GetPlatformFeeResponse LedgerService::GetPlatformFee() {
  return ObserveOperation("LedgerService.GetPlatformFee", {}, [&] {
    GetPlatformFeeResponse resp;
    resp.set_fee_percent(datamarket::ledger::GetPlatformFee());
    return resp;
  });
}

}
