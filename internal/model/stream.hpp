#pragma once

#include <cstdint>
#include <string_view>

#include "internal/model/types.hpp"

namespace streamledger::model {

/*
  A time-vested, one-directional value commitment from payer to recipient.

  payer, recipient, original_balance, start_date and end_date are fixed at
  creation. current_balance only ever decreases, through withdrawals.
*/
struct Stream {
  AccountId payer;
  AccountId recipient;

  Amount original_balance = 0;
  Amount current_balance  = 0;

  Timestamp start_date = 0;
  Timestamp end_date   = 0;

  bool operator==(const Stream&) const = default;
};

enum class StreamState : std::uint8_t {
  kUnspecified = 0,
  kActive      = 1,
  kDrained     = 2,
};

constexpr bool IsTerminal(StreamState state) {
  return state == StreamState::kDrained;
}

constexpr std::string_view ToString(StreamState state) {
  switch (state) {
    case StreamState::kActive:
      return "active";
    case StreamState::kDrained:
      return "drained";
    case StreamState::kUnspecified:
    default:
      return "unspecified";
  }
}

inline StreamState StateOf(const Stream& stream) {
  return stream.current_balance == 0 ? StreamState::kDrained : StreamState::kActive;
}

// Amount already paid out to the recipient.
inline Amount Withdrawn(const Stream& stream) {
  if (stream.current_balance >= stream.original_balance) {
    return 0;
  }
  return stream.original_balance - stream.current_balance;
}

} // namespace streamledger::model
