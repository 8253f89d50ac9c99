#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/model/job_record.hpp"

namespace datamarket::ledger {

inline constexpr uint32_t kPlatformFeePercent = 3;

uint32_t GetPlatformFee();

// floor(price * kPlatformFeePercent / 100), exact for every uint64_t price.
uint64_t PlatformFeeFor(uint64_t price);

struct Payout {
  std::string identity;
  uint64_t    amount = 0;
};

/*
  Where a completed job's escrow goes.

  payouts are aggregated per identity in first-appearance order (treasury
  first when any fee is due); their sum is always the job's totalCost.
*/
struct Settlement {
  std::vector<Payout> payouts;
  uint64_t            fee_total = 0;
};

using OwnerResolver = std::function<std::optional<std::string>(uint64_t dataset_id)>;

class EscrowPolicy {
 public:
  // Throws std::invalid_argument for ON_COMPLETION without a treasury.
  EscrowPolicy(datamarket::runtime::config::EscrowRelease release, std::string treasury_identity);

  static EscrowPolicy Hold();

  bool ReleasesOnCompletion() const {
    return release_ == datamarket::runtime::config::ESCROW_RELEASE_ON_COMPLETION;
  }

  const std::string& TreasuryIdentity() const {
    return treasury_identity_;
  }

  Settlement ComputeSettlement(const db::model::JobRecord& job, const OwnerResolver& owner_of) const;

 private:
  datamarket::runtime::config::EscrowRelease release_;
  std::string                                treasury_identity_;
};

} // namespace datamarket::ledger
