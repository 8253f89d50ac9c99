#include "internal/ledger/validation.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace datamarket::ledger {

void RequireIdentity(std::string_view identity) {
  if (identity.empty()) {
    throw util::InvalidParameters("caller identity is empty");
  }
  if (identity.size() > kMaxIdentityLength) {
    throw util::InvalidParameters("caller identity exceeds " + std::to_string(kMaxIdentityLength) + " characters");
  }
}

void RequireBounded(std::string_view field, std::string_view value, std::size_t max_length) {
  if (value.size() > max_length) {
    throw util::InvalidParameters(std::string(field) + " exceeds " + std::to_string(max_length) + " characters");
  }
}

void RequireAmount(std::string_view field, uint64_t amount) {
  if (amount > kMaxAmount) {
    throw util::InvalidParameters(std::string(field) + " exceeds maximum amount");
  }
}

uint64_t CheckedAdd(std::string_view what, uint64_t lhs, uint64_t rhs) {
  if (lhs > kMaxAmount || rhs > kMaxAmount - lhs) {
    throw util::InvalidParameters(std::string(what) + " overflows maximum amount");
  }
  return lhs + rhs;
}

bool AllDatasetsUsable(const std::vector<uint64_t>& dataset_ids, const DatasetResolver& resolve) {
  bool usable = true;
  for (const auto id : dataset_ids) {
    const auto dataset = resolve(id);
    usable             = usable && dataset.has_value() && dataset->active;
  }
  return usable;
}

std::vector<db::model::JobEntryRecord> PriceEntries(const std::vector<uint64_t>& dataset_ids, const DatasetResolver& resolve) {
  std::vector<db::model::JobEntryRecord> entries;
  entries.reserve(dataset_ids.size());
  for (const auto id : dataset_ids) {
    const auto dataset = resolve(id);
    entries.push_back({.dataset_id = id, .price = dataset ? dataset->price_per_use : 0});
  }
  return entries;
}

uint64_t AggregateCost(const std::vector<db::model::JobEntryRecord>& entries) {
  uint64_t total = 0;
  for (const auto& entry : entries) {
    total = CheckedAdd("job cost", total, entry.price);
  }
  return total;
}

} // namespace datamarket::ledger
