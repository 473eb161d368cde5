#pragma once

#include "sqlite_db.hpp"

namespace streamledger::db::sqlite {

// Creates the ledger tables when missing. Safe to call on every start.
void BootstrapSchema(SqliteDB& db);

} // namespace streamledger::db::sqlite
