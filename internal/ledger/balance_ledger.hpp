#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/chain/value_transfer.hpp"
#include "internal/db/api/repository.hpp"

namespace datamarket::ledger {

/*
  Internal (escrow-side) balances.

  Public operations each run in their own transaction. Credit/Debit join
  a caller's transaction so job transitions and balance moves commit
  together.
*/
class BalanceLedger {
 public:
  BalanceLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<chain::ValueTransfer> transfer);

  uint64_t GetUserBalance(const std::string& identity);

  // Both return the caller's balance after the move.
  uint64_t DepositFunds(const std::string& caller, uint64_t amount);
  uint64_t WithdrawFunds(const std::string& caller, uint64_t amount);

  uint64_t Balance(db::Transaction& tx, const std::string& identity);
  uint64_t Credit(db::Transaction& tx, const std::string& identity, uint64_t amount);
  // Throws util::InsufficientFunds when the balance is below amount.
  uint64_t Debit(db::Transaction& tx, const std::string& identity, uint64_t amount);

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<chain::ValueTransfer> transfer_;
};

} // namespace datamarket::ledger
