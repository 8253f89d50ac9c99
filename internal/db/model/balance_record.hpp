#pragma once

#include <cstdint>
#include <string>

namespace datamarket::db::model {

// Internal (escrow-side) balance of one identity. Absent rows read as 0.
struct BalanceRecord {
  std::string identity;
  uint64_t    amount = 0;
};

} // namespace datamarket::db::model
