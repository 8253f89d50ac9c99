#pragma once

#include <stdexcept>
#include <string>

namespace datamarket::util {

/*
  Central error types.

  Every ledger operation reports failure by throwing one of these. The
  service boundary classifies them into ledger::v1::ErrorKind.
*/

class NotAuthorized : public std::runtime_error {
 public:
  explicit NotAuthorized(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidParameters : public std::runtime_error {
 public:
  explicit InvalidParameters(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientFunds : public std::runtime_error {
 public:
  explicit InsufficientFunds(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PaymentFailed : public std::runtime_error {
 public:
  explicit PaymentFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Reserved for duplicate-registration guards; no operation raises it yet
// except the repository translation of ErrorCode::AlreadyExists.
class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace datamarket::util
