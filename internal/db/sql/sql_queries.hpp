#pragma once

namespace shortener::db::sql {

/*
  Canonical SQL for the urls table.

  Schema statements are valid in both engines; the statement texts below
  use SQLite "?" placeholders. PostgreSQL prepares its own "$n" variants
  per connection (see PgPool::PrepareStatements).
*/

static constexpr const char* CREATE_URLS_TABLE =
    "CREATE TABLE IF NOT EXISTS urls ("
    " short_id TEXT PRIMARY KEY,"
    " original_url TEXT NOT NULL,"
    " user_id TEXT,"
    " is_deleted BOOLEAN NOT NULL DEFAULT FALSE);";

static constexpr const char* CREATE_URLS_ORIGINAL_URL_INDEX =
    "CREATE INDEX IF NOT EXISTS idx_urls_original_url ON urls(original_url);";

static constexpr const char* CREATE_URLS_USER_ID_INDEX =
    "CREATE INDEX IF NOT EXISTS idx_urls_user_id ON urls(user_id);";

static constexpr const char* INSERT_URL =
    "INSERT INTO urls(short_id,original_url,user_id) VALUES(?,?,?);";

static constexpr const char* SELECT_BY_SHORT_ID =
    "SELECT original_url FROM urls WHERE short_id=? AND is_deleted=0;";

static constexpr const char* SELECT_BY_ORIGINAL_URL =
    "SELECT short_id FROM urls WHERE original_url=? AND is_deleted=0 LIMIT 1;";

static constexpr const char* SELECT_BY_USER_ID =
    "SELECT short_id,original_url FROM urls WHERE user_id=? AND is_deleted=0;";

static constexpr const char* MARK_DELETED =
    "UPDATE urls SET is_deleted=1 WHERE short_id=? AND user_id=?;";

static constexpr const char* PING = "SELECT 1;";

} // namespace shortener::db::sql
