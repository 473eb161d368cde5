#pragma once

#include "streamledger/v1.hpp"

#include "streamledger/v1/ledger_service.grpc.pb.h"
