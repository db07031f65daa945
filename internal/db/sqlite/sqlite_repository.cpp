#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace scanhub::db::sqlite {

using scanhub::db::ErrorCode;
using scanhub::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Column order matches SELECT_PAIRING / SELECT_LATEST_FOR_PRODUCT.
static model::PairingRecord ReadPairing(sqlite3_stmt* st) {
    model::PairingRecord r;
    r.id = ColI64(st, 0);
    r.login = ColText(st, 1);
    r.platform = ColI64(st, 2);
    r.product = ColI64(st, 3);
    r.scanned_at_ms = static_cast<uint64_t>(ColI64(st, 4));
    r.overwrite = ColI32(st, 5) != 0;
    r.sync_status = static_cast<model::SyncStatus>(ColI32(st, 6));
    r.sync_error = ColText(st, 7);
    return r;
}

// Runs a prepared single-row query; nullopt when no row matched.
template <typename Bind>
static std::optional<model::PairingRecord> QueryPairing(sqlite3* db, const char* sql, Bind&& bind) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    bind(st);

    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        throw std::runtime_error("sqlite step: " + msg);
    }

    auto record = ReadPairing(st);
    sqlite3_finalize(st);
    return record;
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

    switch (rc) {
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
// Pairings
// ------------------------------------------------------------------

std::optional<model::PairingRecord>
SqliteRepository::MarkLatestOverwritten(Transaction& t, int64_t product) {
    auto* db = TX(t).Handle();

    // BEGIN IMMEDIATE already holds the write lock, so the select and the
    // update below cannot interleave with another commit.
    auto latest = QueryPairing(db, sql::SELECT_LATEST_FOR_PRODUCT, [&](sqlite3_stmt* st) { BindI64(st, 1, product); });
    if (!latest) return std::nullopt;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::MARK_OVERWRITTEN, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindI64(st, 1, latest->id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (!result) throw std::runtime_error("mark overwritten: " + result.message);

    return latest;
}

Result SqliteRepository::InsertPairing(Transaction& t, model::PairingRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_PAIRING, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.login);
    BindI64(st, 2, r.platform);
    BindI64(st, 3, r.product);
    BindI64(st, 4, static_cast<int64_t>(r.scanned_at_ms));

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result) {
        r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    }
    return result;
}

Result SqliteRepository::UpdateSyncStatus(Transaction& t, int64_t id, model::SyncStatus status, const std::string& diagnostic) {
    if (!model::IsTerminal(status))
        return Result::Err(ErrorCode::ConstraintViolation, "sync status can only move to success or failure");

    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_SYNC_STATUS, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st, 1, static_cast<int>(status));
    if (diagnostic.empty()) {
        sqlite3_bind_null(st, 2);
    } else {
        BindText(st, 2, diagnostic);
    }
    BindI64(st, 3, id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (!result) return result;

    if (sqlite3_changes(db) == 0) {
        // Either unknown or no longer pending.
        auto existing = QueryPairing(db, sql::SELECT_PAIRING, [&](sqlite3_stmt* q) { BindI64(q, 1, id); });
        if (!existing) return Result::Err(ErrorCode::NotFound, "pairing " + std::to_string(id) + " not found");
        return Result::Err(ErrorCode::Conflict, "pairing " + std::to_string(id) + " already " + std::string(model::ToString(existing->sync_status)));
    }
    return Result::Ok();
}

std::optional<model::PairingRecord> SqliteRepository::GetPairing(Transaction& t, int64_t id) {
    return QueryPairing(TX(t).Handle(), sql::SELECT_PAIRING, [&](sqlite3_stmt* st) { BindI64(st, 1, id); });
}

std::optional<int64_t> SqliteRepository::FindLatestPlatformForIdentity(Transaction& t, const std::string& login) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_LATEST_PLATFORM_FOR_LOGIN, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindText(st, 1, login);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto platform = ColI64(st, 0);
    sqlite3_finalize(st);
    return platform;
}

} // namespace scanhub::db::sqlite
