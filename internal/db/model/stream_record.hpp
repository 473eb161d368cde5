#pragma once

#include <cstdint>
#include <string>

namespace streamledger::db::model {

/*
  Persistent stream row.

  Rows are never deleted. current_balance is the only column written after
  insert.
*/
struct StreamRecord {
  uint64_t    stream_id = 0;
  std::string payer;
  std::string recipient;
  uint64_t    original_balance = 0;
  uint64_t    current_balance  = 0;
  uint64_t    start_date       = 0;
  uint64_t    end_date         = 0;
};

} // namespace streamledger::db::model
