#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/chain/value_transfer.hpp"

namespace datamarket::chain {

/*
  In-process ValueTransfer.

  Tracks each identity's external holding and the escrow custody account
  that deposits land in. Zero-amount transfers and transfers exceeding the
  source holding are rejected.
*/
class ExternalHoldings final : public ValueTransfer {
 public:
  bool TransferIn(const std::string& identity, uint64_t amount) override;
  bool TransferOut(const std::string& identity, uint64_t amount) override;

  // Credits an external holding directly (genesis allocation, faucets).
  void Fund(const std::string& identity, uint64_t amount);

  uint64_t Holding(const std::string& identity) const;
  uint64_t Custody() const;

 private:
  mutable std::mutex                        mutex_;
  std::unordered_map<std::string, uint64_t> holdings_;
  uint64_t                                  custody_ = 0;
};

} // namespace datamarket::chain
