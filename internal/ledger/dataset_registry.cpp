#include "internal/ledger/dataset_registry.hpp"

#include <stdexcept>

#include "internal/ledger/validation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/db_errors.hpp"
#include "internal/util/errors.hpp"

namespace datamarket::ledger {

namespace {

void RequireDatasetFields(const std::string& name, const std::string& metadata_url, uint64_t price_per_use, const std::string& category) {
  RequireBounded("name", name, kMaxNameLength);
  RequireBounded("metadata_url", metadata_url, kMaxUrlLength);
  RequireBounded("category", category, kMaxCategoryLength);
  RequireAmount("price_per_use", price_per_use);
}

} // namespace

DatasetRegistry::DatasetRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<chain::HeightSource> height)
    : repository_(std::move(repository)), height_(std::move(height)) {
  if (!repository_ || !height_) {
    throw std::invalid_argument("DatasetRegistry requires a repository and a height source");
  }
}

uint64_t DatasetRegistry::RegisterDataset(const std::string& caller, const std::string& name, const std::string& metadata_url,
                                          uint64_t price_per_use, const std::string& category) {
  RequireIdentity(caller);
  RequireDatasetFields(name, metadata_url, price_per_use, category);

  auto tx = repository_->Begin();

  db::model::DatasetRecord record{
      .owner         = caller,
      .name          = name,
      .metadata_url  = metadata_url,
      .category      = category,
      .price_per_use = price_per_use,
      .access_count  = 0,
      .active        = true,
      .created_at    = height_->CurrentHeight(),
  };
  util::ThrowIfDbError(repository_->InsertDataset(*tx, record), "register dataset");
  tx->Commit();

  DATAMARKET_LOG_INFO("dataset registered", {observability::UintField("dataset_id", record.id), observability::StringField("owner", caller),
                                             observability::UintField("price_per_use", price_per_use)});
  return record.id;
}

db::model::DatasetRecord DatasetRegistry::UpdateDataset(const std::string& caller, uint64_t dataset_id, const std::string& name,
                                                        const std::string& metadata_url, uint64_t price_per_use, bool active,
                                                        const std::string& category) {
  RequireIdentity(caller);
  RequireDatasetFields(name, metadata_url, price_per_use, category);

  auto tx       = repository_->Begin();
  auto existing = repository_->GetDataset(*tx, dataset_id);
  if (!existing) {
    throw util::NotFound("dataset " + std::to_string(dataset_id) + " not found");
  }
  if (existing->owner != caller) {
    throw util::NotAuthorized(caller + " does not own dataset " + std::to_string(dataset_id));
  }

  existing->name          = name;
  existing->metadata_url  = metadata_url;
  existing->price_per_use = price_per_use;
  existing->active        = active;
  existing->category      = category;

  util::ThrowIfDbError(repository_->UpdateDataset(*tx, *existing), "update dataset");
  tx->Commit();

  DATAMARKET_LOG_INFO("dataset updated", {observability::UintField("dataset_id", dataset_id), observability::BoolField("active", active)});
  return *existing;
}

std::optional<db::model::DatasetRecord> DatasetRegistry::GetDataset(uint64_t dataset_id) {
  auto tx = repository_->Begin();
  return repository_->GetDataset(*tx, dataset_id);
}

uint64_t DatasetRegistry::LastDatasetId() {
  auto tx = repository_->Begin();
  return repository_->LastDatasetId(*tx);
}

} // namespace datamarket::ledger
