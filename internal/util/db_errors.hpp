#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace datamarket::util {

// Throws the ledger error matching a failed repository result.
void ThrowIfDbError(const datamarket::db::Result& result, const std::string& context);

} // namespace datamarket::util
