#pragma once

#include <cstdint>
#include <string>

namespace datamarket::chain {

/*
  External value-transfer primitive.

  TransferIn moves amount from the identity's external holding into ledger
  custody; TransferOut moves it back. A false return is a rejected transfer
  and must leave external state untouched. Exceptions are reserved for
  failures other than rejection.
*/
class ValueTransfer {
 public:
  virtual ~ValueTransfer() = default;

  virtual bool TransferIn(const std::string& identity, uint64_t amount)  = 0;
  virtual bool TransferOut(const std::string& identity, uint64_t amount) = 0;
};

} // namespace datamarket::chain
