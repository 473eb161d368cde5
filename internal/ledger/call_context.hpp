#pragma once

#include "internal/model/types.hpp"

namespace streamledger::ledger {

/*
  Per-call ambient state supplied by the host.

  caller is the externally verified identity of whoever invoked the
  operation. now is read once per call; the whole operation observes it.
*/
struct CallContext {
  model::AccountId caller;
  model::Timestamp now = 0;
};

} // namespace streamledger::ledger
