#pragma once

#include <functional>
#include <memory>

#include "internal/model/types.hpp"

namespace streamledger::ledger { class StreamLedger; }

namespace streamledger::service {

/*
  Dependency container shared by all services.

  clock returns unix seconds; it is read once per call.
*/
struct ServiceContext {
  std::shared_ptr<streamledger::ledger::StreamLedger> ledger;
  std::function<streamledger::model::Timestamp()> clock;
};

}
