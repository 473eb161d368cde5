#include "sqlite_db.hpp"

#include <stdexcept>
#include <utility>

namespace streamledger::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

// Applied to every connection after open. WAL is optional and runs first.
constexpr const char* kPragmas[] = {
    // a withdrawal is only final once COMMIT has reached disk
    "PRAGMA synchronous=FULL;",
    "PRAGMA temp_store=MEMORY;",
};

std::string ErrorText(sqlite3* db, const std::string& context) {
  return context + ": " + (db ? sqlite3_errmsg(db) : "out of memory");
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  constexpr int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const auto message = ErrorText(db_, "open ledger database " + path_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(message);
  }

  try {
    Configure(wal_mode);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) {
    return;
  }
  std::string message = sql + " failed: " + (err ? err : sqlite3_errmsg(db_));
  sqlite3_free(err);
  throw std::runtime_error(message);
}

void SqliteDB::Configure(bool wal_mode) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  for (const char* pragma : kPragmas) {
    Exec(pragma);
  }
  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error(ErrorText(db_, "busy_timeout"));
  }
}

} // namespace streamledger::db::sqlite
