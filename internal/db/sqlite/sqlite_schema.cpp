#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace streamledger::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  // Amounts and dates are uint64 stored through int64 columns.
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS ledger_meta (id INTEGER PRIMARY KEY CHECK (id = 1), owner TEXT NOT NULL, next_stream_id INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS streams (stream_id INTEGER PRIMARY KEY, payer TEXT NOT NULL, recipient TEXT NOT NULL, original_balance INTEGER NOT NULL, current_balance INTEGER NOT NULL, start_date INTEGER NOT NULL, end_date INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS streams_recipient ON streams(recipient);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT owner,next_stream_id FROM ledger_meta LIMIT 1;");
  db.Exec("SELECT stream_id,payer,recipient,original_balance,current_balance,start_date,end_date FROM streams LIMIT 1;");
}

} // namespace streamledger::db::sqlite
