#include "vesting.hpp"

namespace streamledger::vesting {

using model::Amount;
using model::Stream;
using model::Timestamp;

Amount VestedAmount(const Stream& stream, Timestamp now) {
  if (now <= stream.start_date) {
    return 0;
  }
  if (now >= stream.end_date) {
    return stream.original_balance;
  }

  // start_date < now < end_date here, so the window is non-empty.
  const unsigned __int128 elapsed  = now - stream.start_date;
  const unsigned __int128 duration = stream.end_date - stream.start_date;

  unsigned __int128 vested = stream.original_balance;
  vested *= elapsed;
  vested /= duration;

  // elapsed < duration keeps the quotient below original_balance.
  return static_cast<Amount>(vested);
}

Amount WithdrawableAmount(const Stream& stream, Timestamp now) {
  const Amount vested    = VestedAmount(stream, now);
  const Amount withdrawn = model::Withdrawn(stream);
  if (vested <= withdrawn) {
    return 0;
  }
  return vested - withdrawn;
}

StreamStatus Evaluate(const Stream& stream, Timestamp now) {
  StreamStatus status;
  status.vested       = VestedAmount(stream, now);
  status.withdrawable = WithdrawableAmount(stream, now);
  status.state        = model::StateOf(stream);
  return status;
}

} // namespace streamledger::vesting
