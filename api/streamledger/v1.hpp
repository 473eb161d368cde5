#pragma once

#include "streamledger/v1/types.pb.h"

#include "streamledger/v1/ledger_service.pb.h"
