#include "internal/chain/external_holdings.hpp"

#include <limits>
#include <stdexcept>

namespace datamarket::chain {

bool ExternalHoldings::TransferIn(const std::string& identity, uint64_t amount) {
  std::lock_guard lock(mutex_);

  auto it = holdings_.find(identity);
  if (amount == 0 || it == holdings_.end() || it->second < amount) {
    return false;
  }
  if (custody_ > std::numeric_limits<uint64_t>::max() - amount) {
    return false;
  }

  it->second -= amount;
  custody_ += amount;
  return true;
}

bool ExternalHoldings::TransferOut(const std::string& identity, uint64_t amount) {
  std::lock_guard lock(mutex_);

  if (amount == 0 || custody_ < amount) {
    return false;
  }

  auto& holding = holdings_[identity];
  if (holding > std::numeric_limits<uint64_t>::max() - amount) {
    return false;
  }

  custody_ -= amount;
  holding += amount;
  return true;
}

void ExternalHoldings::Fund(const std::string& identity, uint64_t amount) {
  std::lock_guard lock(mutex_);

  auto& holding = holdings_[identity];
  if (holding > std::numeric_limits<uint64_t>::max() - amount) {
    throw std::overflow_error("external holding overflow for " + identity);
  }
  holding += amount;
}

uint64_t ExternalHoldings::Holding(const std::string& identity) const {
  std::lock_guard lock(mutex_);

  auto it = holdings_.find(identity);
  return it == holdings_.end() ? 0 : it->second;
}

uint64_t ExternalHoldings::Custody() const {
  std::lock_guard lock(mutex_);
  return custody_;
}

} // namespace datamarket::chain
