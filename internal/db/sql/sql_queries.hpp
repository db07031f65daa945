#pragma once

namespace scanhub::db::sql {

/*
  Canonical SQL for the pairings table.

  IMPORTANT:
  Written in the SQLite dialect (? placeholders) unless suffixed _POSTGRES.
  The Postgres backend keeps its own $n variants as prepared statements in
  PgPool.
*/

static constexpr const char* CREATE_PAIRINGS_SQLITE =
    "CREATE TABLE IF NOT EXISTS pairings ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " login TEXT NOT NULL DEFAULT 'unknown',"
    " platform INTEGER NOT NULL,"
    " product INTEGER NOT NULL,"
    " scanned_at_ms INTEGER NOT NULL,"
    " is_overwrite INTEGER NOT NULL DEFAULT 0,"
    " sync_status INTEGER NOT NULL DEFAULT 0,"
    " sync_error TEXT);";

static constexpr const char* CREATE_PAIRINGS_INDEXES_SQLITE =
    "CREATE INDEX IF NOT EXISTS idx_pairings_platform_product ON pairings(platform, product);"
    "CREATE INDEX IF NOT EXISTS idx_pairings_product_id ON pairings(product, id);"
    "CREATE INDEX IF NOT EXISTS idx_pairings_login_id ON pairings(login, id);";

static constexpr const char* CREATE_PAIRINGS_POSTGRES =
    "CREATE TABLE IF NOT EXISTS pairings ("
    " id BIGSERIAL PRIMARY KEY,"
    " login TEXT NOT NULL DEFAULT 'unknown',"
    " platform BIGINT NOT NULL,"
    " product BIGINT NOT NULL,"
    " scanned_at_ms BIGINT NOT NULL,"
    " is_overwrite BOOLEAN NOT NULL DEFAULT FALSE,"
    " sync_status SMALLINT NOT NULL DEFAULT 0,"
    " sync_error TEXT);"
    "CREATE INDEX IF NOT EXISTS idx_pairings_product_id ON pairings(product, id);"
    "CREATE INDEX IF NOT EXISTS idx_pairings_login_id ON pairings(login, id);";

// "Latest" is commit order. Ids are assigned while the product is locked, so
// the highest id for a product is always the live record; scanned_at_ms is
// informational and may disagree under concurrent scans.
static constexpr const char* SELECT_LATEST_FOR_PRODUCT =
    "SELECT id,login,platform,product,scanned_at_ms,is_overwrite,sync_status,sync_error"
    " FROM pairings WHERE product=? ORDER BY id DESC LIMIT 1;";

static constexpr const char* MARK_OVERWRITTEN =
    "UPDATE pairings SET is_overwrite=1 WHERE id=?;";

static constexpr const char* INSERT_PAIRING =
    "INSERT INTO pairings(login,platform,product,scanned_at_ms,is_overwrite,sync_status)"
    " VALUES(?,?,?,?,0,0);";

// Guarded on pending so the terminal transition happens once.
static constexpr const char* UPDATE_SYNC_STATUS =
    "UPDATE pairings SET sync_status=?, sync_error=?"
    " WHERE id=? AND sync_status=0;";

static constexpr const char* SELECT_PAIRING =
    "SELECT id,login,platform,product,scanned_at_ms,is_overwrite,sync_status,sync_error"
    " FROM pairings WHERE id=?;";

static constexpr const char* SELECT_LATEST_PLATFORM_FOR_LOGIN =
    "SELECT platform FROM pairings WHERE login=? ORDER BY id DESC LIMIT 1;";

}
