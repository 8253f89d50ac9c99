#include "internal/ledger/escrow_policy.hpp"

#include <stdexcept>
#include <unordered_map>

namespace datamarket::ledger {

using datamarket::runtime::config::EscrowRelease;

uint32_t GetPlatformFee() {
  return kPlatformFeePercent;
}

uint64_t PlatformFeeFor(uint64_t price) {
  return (price / 100) * kPlatformFeePercent + ((price % 100) * kPlatformFeePercent) / 100;
}

EscrowPolicy::EscrowPolicy(EscrowRelease release, std::string treasury_identity)
    : release_(release == datamarket::runtime::config::ESCROW_RELEASE_UNSPECIFIED ? datamarket::runtime::config::ESCROW_RELEASE_HOLD : release),
      treasury_identity_(std::move(treasury_identity)) {
  if (ReleasesOnCompletion() && treasury_identity_.empty()) {
    throw std::invalid_argument("escrow release on completion requires a treasury identity");
  }
}

EscrowPolicy EscrowPolicy::Hold() {
  return EscrowPolicy(datamarket::runtime::config::ESCROW_RELEASE_HOLD, {});
}

Settlement EscrowPolicy::ComputeSettlement(const db::model::JobRecord& job, const OwnerResolver& owner_of) const {
  Settlement settlement;
  if (!ReleasesOnCompletion()) {
    return settlement;
  }

  std::unordered_map<std::string, std::size_t> index;
  auto credit = [&](const std::string& identity, uint64_t amount) {
    if (amount == 0) {
      return;
    }
    auto [it, inserted] = index.emplace(identity, settlement.payouts.size());
    if (inserted) {
      settlement.payouts.push_back({identity, amount});
    } else {
      settlement.payouts[it->second].amount += amount;
    }
  };

  for (const auto& entry : job.entries) {
    settlement.fee_total += PlatformFeeFor(entry.price);
  }
  credit(treasury_identity_, settlement.fee_total);

  for (const auto& entry : job.entries) {
    auto owner = owner_of(entry.dataset_id);
    if (!owner) {
      throw std::runtime_error("escrow settlement: dataset " + std::to_string(entry.dataset_id) + " has no owner");
    }
    credit(*owner, entry.price - PlatformFeeFor(entry.price));
  }

  return settlement;
}

} // namespace datamarket::ledger
