#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/chain/height_source.hpp"
#include "internal/db/api/repository.hpp"

namespace datamarket::ledger {

class DatasetRegistry {
 public:
  DatasetRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<chain::HeightSource> height);

  uint64_t RegisterDataset(const std::string& caller, const std::string& name, const std::string& metadata_url, uint64_t price_per_use,
                           const std::string& category);

  // Owner only. id, owner, createdAt and accessCount are preserved.
  db::model::DatasetRecord UpdateDataset(const std::string& caller, uint64_t dataset_id, const std::string& name, const std::string& metadata_url,
                                         uint64_t price_per_use, bool active, const std::string& category);

  std::optional<db::model::DatasetRecord> GetDataset(uint64_t dataset_id);

  uint64_t LastDatasetId();

 private:
  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<chain::HeightSource> height_;
};

} // namespace datamarket::ledger
