#include "error_kind.hpp"

#include "internal/util/errors.hpp"

namespace datamarket::util {

using datamarket::ledger::v1::ErrorKind;

ErrorKind ClassifyError(const std::exception& e) {
  if (dynamic_cast<const NotAuthorized*>(&e)) {
    return datamarket::ledger::v1::ERROR_KIND_NOT_AUTHORIZED;
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return datamarket::ledger::v1::ERROR_KIND_NOT_FOUND;
  }
  if (dynamic_cast<const InvalidParameters*>(&e)) {
    return datamarket::ledger::v1::ERROR_KIND_INVALID_PARAMETERS;
  }
  if (dynamic_cast<const InsufficientFunds*>(&e)) {
    return datamarket::ledger::v1::ERROR_KIND_INSUFFICIENT_FUNDS;
  }
  if (dynamic_cast<const PaymentFailed*>(&e)) {
    return datamarket::ledger::v1::ERROR_KIND_PAYMENT_FAILED;
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return datamarket::ledger::v1::ERROR_KIND_ALREADY_EXISTS;
  }

  return datamarket::ledger::v1::ERROR_KIND_INTERNAL;
}

std::string ErrorKindName(ErrorKind kind) {
  return datamarket::ledger::v1::ErrorKind_Name(kind);
}

} // namespace datamarket::util
