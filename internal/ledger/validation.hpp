#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/db/model/dataset_record.hpp"
#include "internal/db/model/job_record.hpp"

namespace datamarket::ledger {

inline constexpr std::size_t kMaxNameLength     = 100;
inline constexpr std::size_t kMaxUrlLength      = 256;
inline constexpr std::size_t kMaxCategoryLength = 50;
inline constexpr std::size_t kMaxIdentityLength = 128;
inline constexpr std::size_t kMaxJobDatasets    = 20;

// Every amount must fit a signed 64-bit column.
inline constexpr uint64_t kMaxAmount = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

// All throw util::InvalidParameters.
void RequireIdentity(std::string_view identity);
void RequireBounded(std::string_view field, std::string_view value, std::size_t max_length);
void RequireAmount(std::string_view field, uint64_t amount);
uint64_t CheckedAdd(std::string_view what, uint64_t lhs, uint64_t rhs);

using DatasetResolver = std::function<std::optional<db::model::DatasetRecord>(uint64_t)>;

// Conjunction over the whole list: every id resolves to an active dataset.
bool AllDatasetsUsable(const std::vector<uint64_t>& dataset_ids, const DatasetResolver& resolve);

// One entry per list position, priced at the dataset's current pricePerUse.
// An id that does not resolve is priced 0.
std::vector<db::model::JobEntryRecord> PriceEntries(const std::vector<uint64_t>& dataset_ids, const DatasetResolver& resolve);

// Sum of entry prices in list order; InvalidParameters past kMaxAmount.
uint64_t AggregateCost(const std::vector<db::model::JobEntryRecord>& entries);

} // namespace datamarket::ledger
