#include "db_errors.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace datamarket::util {

void ThrowIfDbError(const datamarket::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case datamarket::db::ErrorCode::AlreadyExists:
      throw AlreadyExists(message);
    case datamarket::db::ErrorCode::NotFound:
      throw NotFound(message);
    case datamarket::db::ErrorCode::ConstraintViolation:
      throw InvalidParameters(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace datamarket::util
