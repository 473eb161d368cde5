#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <limits>
#include <stdexcept>
#include <string>

namespace streamledger::db::sqlite {

using streamledger::db::ErrorCode;
using streamledger::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Reads have no Result to carry an error; a failure must not read as "no row".
[[noreturn]] static void ThrowRead(sqlite3* db, const char* what) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Ledger metadata
// ------------------------------------------------------------------

std::optional<model::LedgerMetaRecord>
SqliteRepository::GetLedgerMeta(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT owner,next_stream_id FROM ledger_meta WHERE id=1;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        ThrowRead(db, "read ledger_meta");

    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        ThrowRead(db, "read ledger_meta");
    }

    model::LedgerMetaRecord r;
    r.owner = ColText(st, 0);
    r.next_stream_id = ColU64(st, 1);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpsertLedgerMeta(Transaction& t, const model::LedgerMetaRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO ledger_meta(id,owner,next_stream_id) VALUES(1,?,?) "
        "ON CONFLICT(id) DO UPDATE SET owner=excluded.owner, next_stream_id=excluded.next_stream_id;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.owner);
    BindU64(st, 2, r.next_stream_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

Result SqliteRepository::InsertStream(Transaction& t, const model::StreamRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO streams(stream_id,payer,recipient,original_balance,current_balance,start_date,end_date) "
        "VALUES(?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.stream_id);
    BindText(st, 2, r.payer);
    BindText(st, 3, r.recipient);
    BindU64(st, 4, r.original_balance);
    BindU64(st, 5, r.current_balance);
    BindU64(st, 6, r.start_date);
    BindU64(st, 7, r.end_date);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    // stream_id is the only constraint on the table
    if ((rc & 0xFF) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));

    return Translate(db, rc);
}

std::optional<model::StreamRecord>
SqliteRepository::GetStream(Transaction& t, uint64_t stream_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT stream_id,payer,recipient,original_balance,current_balance,start_date,end_date "
        "FROM streams WHERE stream_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        ThrowRead(db, "read stream");

    BindU64(st, 1, stream_id);

    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        ThrowRead(db, "read stream");
    }

    model::StreamRecord r;
    r.stream_id = ColU64(st, 0);
    r.payer = ColText(st, 1);
    r.recipient = ColText(st, 2);
    r.original_balance = ColU64(st, 3);
    r.current_balance = ColU64(st, 4);
    r.start_date = ColU64(st, 5);
    r.end_date = ColU64(st, 6);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpdateStream(Transaction& t, const model::StreamRecord& r) {
    auto* db = TX(t).Handle();

    // Only the balance moves after insert.
    const char* sql = "UPDATE streams SET current_balance=? WHERE stream_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.current_balance);
    BindU64(st, 2, r.stream_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound);
    return result;
}

uint64_t SqliteRepository::SumCurrentBalances(Transaction& t) {
    auto* db = TX(t).Handle();

    // balances are stored as int64 bit patterns, so SUM() in SQL would be wrong
    const char* sql = "SELECT current_balance FROM streams;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        ThrowRead(db, "sum balances");

    uint64_t total = 0;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        const uint64_t balance = ColU64(st, 0);
        if (balance > std::numeric_limits<uint64_t>::max() - total) {
            sqlite3_finalize(st);
            throw std::overflow_error("outstanding stream balances overflow uint64");
        }
        total += balance;
    }
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE)
        ThrowRead(db, "sum balances");
    return total;
}

} // namespace streamledger::db::sqlite
