#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace streamledger::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on the shared connection.

  The write lock is taken up front so a ledger call never upgrades from a
  read lock halfway through. Only one transaction can be open per
  connection; StreamLedger serializes calls so this holds.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;

  bool committed_ = false;
  // set by Commit and Rollback; the destructor rolls back otherwise
  bool finished_ = false;
};

} // namespace streamledger::db::sqlite
