#pragma once

#include "internal/model/stream.hpp"
#include "internal/model/types.hpp"

namespace streamledger::vesting {

/*
  Linear vesting calculator.

  Pure functions of (stream, now). The caller supplies "now"; nothing here
  reads the clock or mutates the stream.
*/

// Cumulative amount unlocked at `now`. 0 up to start_date, original_balance
// from end_date on, linear and truncated in between.
model::Amount VestedAmount(const model::Stream& stream, model::Timestamp now);

// Vested minus already withdrawn, floored at 0.
model::Amount WithdrawableAmount(const model::Stream& stream, model::Timestamp now);

struct StreamStatus {
  model::Amount      vested       = 0;
  model::Amount      withdrawable = 0;
  model::StreamState state        = model::StreamState::kUnspecified;
};

StreamStatus Evaluate(const model::Stream& stream, model::Timestamp now);

} // namespace streamledger::vesting
