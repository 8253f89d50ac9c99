#include "internal/ledger/balance_ledger.hpp"

#include <stdexcept>

#include "internal/ledger/validation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/db_errors.hpp"
#include "internal/util/errors.hpp"

namespace datamarket::ledger {

BalanceLedger::BalanceLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<chain::ValueTransfer> transfer)
    : repository_(std::move(repository)), transfer_(std::move(transfer)) {
  if (!repository_) {
    throw std::invalid_argument("BalanceLedger requires a repository");
  }
  if (!transfer_) {
    throw std::invalid_argument("BalanceLedger requires a value transfer");
  }
}

uint64_t BalanceLedger::GetUserBalance(const std::string& identity) {
  auto tx = repository_->Begin();
  return Balance(*tx, identity);
}

uint64_t BalanceLedger::DepositFunds(const std::string& caller, uint64_t amount) {
  RequireIdentity(caller);
  RequireAmount("deposit amount", amount);

  auto       tx      = repository_->Begin();
  const auto balance = Credit(*tx, caller, amount);

  if (!transfer_->TransferIn(caller, amount)) {
    throw util::PaymentFailed("deposit of " + std::to_string(amount) + " rejected for " + caller);
  }

  try {
    tx->Commit();
  } catch (...) {
    // value already left the external holding; hand it back
    if (!transfer_->TransferOut(caller, amount)) {
      DATAMARKET_LOG_ERROR("deposit compensation rejected",
                           {observability::StringField("identity", caller), observability::UintField("amount", amount)});
    }
    throw;
  }

  DATAMARKET_LOG_INFO("funds deposited", {observability::StringField("identity", caller), observability::UintField("amount", amount)});
  return balance;
}

uint64_t BalanceLedger::WithdrawFunds(const std::string& caller, uint64_t amount) {
  RequireIdentity(caller);
  RequireAmount("withdraw amount", amount);

  auto       tx      = repository_->Begin();
  const auto balance = Debit(*tx, caller, amount);

  if (!transfer_->TransferOut(caller, amount)) {
    throw util::PaymentFailed("withdrawal of " + std::to_string(amount) + " rejected for " + caller);
  }

  try {
    tx->Commit();
  } catch (...) {
    if (!transfer_->TransferIn(caller, amount)) {
      DATAMARKET_LOG_ERROR("withdraw compensation rejected",
                           {observability::StringField("identity", caller), observability::UintField("amount", amount)});
    }
    throw;
  }

  DATAMARKET_LOG_INFO("funds withdrawn", {observability::StringField("identity", caller), observability::UintField("amount", amount)});
  return balance;
}

uint64_t BalanceLedger::Balance(db::Transaction& tx, const std::string& identity) {
  auto record = repository_->GetBalance(tx, identity);
  return record ? record->amount : 0;
}

uint64_t BalanceLedger::Credit(db::Transaction& tx, const std::string& identity, uint64_t amount) {
  const auto updated = CheckedAdd("balance of " + identity, Balance(tx, identity), amount);
  util::ThrowIfDbError(repository_->UpsertBalance(tx, {.identity = identity, .amount = updated}), "credit balance");
  return updated;
}

uint64_t BalanceLedger::Debit(db::Transaction& tx, const std::string& identity, uint64_t amount) {
  const auto current = Balance(tx, identity);
  if (current < amount) {
    throw util::InsufficientFunds(identity + " has " + std::to_string(current) + ", needs " + std::to_string(amount));
  }
  util::ThrowIfDbError(repository_->UpsertBalance(tx, {.identity = identity, .amount = current - amount}), "debit balance");
  return current - amount;
}

} // namespace datamarket::ledger
