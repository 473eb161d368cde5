#pragma once

#include <chrono>
#include <cstdint>

namespace streamledger::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixSeconds(TimePoint tp);

// Whole seconds since the epoch, the resolution the ledger works in.
uint64_t NowSeconds();

} // namespace streamledger::util
