#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace streamledger::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::LedgerMetaRecord> GetLedgerMeta(Transaction&) override;
  Result UpsertLedgerMeta(Transaction&, const model::LedgerMetaRecord&) override;

  Result InsertStream(Transaction&, const model::StreamRecord&) override;
  std::optional<model::StreamRecord> GetStream(Transaction&, uint64_t stream_id) override;
  Result UpdateStream(Transaction&, const model::StreamRecord&) override;
  uint64_t SumCurrentBalances(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
