#pragma once

#include "datamarket/ledger/v1/types.pb.h"
#include "datamarket/ledger/v1/ledger_service.pb.h"
