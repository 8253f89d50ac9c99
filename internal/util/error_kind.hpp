#pragma once

#include <exception>
#include <string>

#include "datamarket/ledger/v1/types.pb.h"

namespace datamarket::util {

/*
  Converts internal exceptions into the tagged error kind reported to
  callers. Anything outside the ledger taxonomy is ERROR_KIND_INTERNAL.
*/

datamarket::ledger::v1::ErrorKind ClassifyError(const std::exception& e);

std::string ErrorKindName(datamarket::ledger::v1::ErrorKind kind);

} // namespace datamarket::util
