#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/ledger_meta_record.hpp"
#include "internal/db/model/stream_record.hpp"

namespace streamledger::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A rolled back transaction leaves no trace, including id allocation
  - Getters return nullopt only for a missing row; backend errors throw

  The DB is the source of truth for:
    stream balances
    the stream id counter
    the ledger owner
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Ledger metadata (single row)
  // ---------------------------------------------------------------------

  virtual std::optional<model::LedgerMetaRecord> GetLedgerMeta(Transaction&) = 0;

  virtual Result UpsertLedgerMeta(Transaction&, const model::LedgerMetaRecord&) = 0;

  // ---------------------------------------------------------------------
  // Streams
  // ---------------------------------------------------------------------

  // Fails with AlreadyExists when the id is taken.
  virtual Result InsertStream(Transaction&, const model::StreamRecord&) = 0;

  virtual std::optional<model::StreamRecord> GetStream(Transaction&, uint64_t stream_id) = 0;

  // Fails with NotFound when the id is unknown.
  virtual Result UpdateStream(Transaction&, const model::StreamRecord&) = 0;

  // Sum of current_balance over every stream. Throws if it does not fit.
  virtual uint64_t SumCurrentBalances(Transaction&) = 0;
};

} // namespace streamledger::db
