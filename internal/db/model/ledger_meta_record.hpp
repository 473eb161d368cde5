#pragma once

#include <cstdint>
#include <string>

namespace streamledger::db::model {

struct LedgerMetaRecord {
  std::string owner;

  // Next stream id to hand out. Ids start at 1 and are never reused.
  uint64_t next_stream_id = 1;
};

} // namespace streamledger::db::model
