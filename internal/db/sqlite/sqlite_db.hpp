#pragma once

#include <sqlite3.h>

#include <string>

namespace streamledger::db::sqlite {

/*
  Owns the sqlite3 connection for the ledger database file.

  Opened FULLMUTEX with synchronous=FULL: a committed withdrawal must not be
  lost after custody has paid it out.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements without results. Throws on error.
  void Exec(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace streamledger::db::sqlite
