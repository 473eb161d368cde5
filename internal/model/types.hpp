#pragma once

#include <cstdint>
#include <string>

namespace streamledger::model {

// Opaque caller identity, resolved and verified by the host.
using AccountId = std::string;

// Smallest indivisible currency unit.
using Amount = std::uint64_t;

// Seconds since the Unix epoch.
using Timestamp = std::uint64_t;

using StreamId = std::uint64_t;

} // namespace streamledger::model
