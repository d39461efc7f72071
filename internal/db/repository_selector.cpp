#include "repository_selector.hpp"

#include <exception>
#include <stdexcept>

#include "internal/db/file/file_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if SHORTENER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SHORTENER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace shortener::db {

using observability::StringField;

std::shared_ptr<UrlRepository> OpenSqlRepository(const std::string& sql_dsn) {
  const std::string sqlite_prefix = kSqliteDsnPrefix;
  if (sql_dsn.rfind(sqlite_prefix, 0) == 0) {
#if SHORTENER_DB_SQLITE
    auto path = sql_dsn.substr(sqlite_prefix.size());
    if (path.empty()) {
      throw std::runtime_error("sqlite dsn has no database path");
    }
    return std::make_shared<sqlite::SqliteRepository>(std::make_shared<sqlite::SqliteDB>(path));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

#if SHORTENER_DB_POSTGRES
  return std::make_shared<postgres::PgRepository>(std::make_shared<postgres::PgPool>(sql_dsn));
#else
  throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
}

std::shared_ptr<UrlRepository> SelectRepository(const std::string& sql_dsn, const std::string& file_path) {
  if (!sql_dsn.empty()) {
    try {
      auto repository = OpenSqlRepository(sql_dsn);
      SHORTENER_LOG_INFO("using SQL storage", {StringField("backend", repository->Name())});
      return repository;
    } catch (const std::exception& ex) {
      SHORTENER_LOG_WARN("SQL storage unavailable, falling back", {StringField("error", ex.what())});
    }
  }

  if (!file_path.empty()) {
    try {
      auto repository = std::make_shared<file::FileRepository>(file_path);
      SHORTENER_LOG_INFO("using file storage", {StringField("path", file_path)});
      return repository;
    } catch (const std::exception& ex) {
      SHORTENER_LOG_WARN("file storage unavailable, falling back to memory", {StringField("path", file_path), StringField("error", ex.what())});
    }
  }

  SHORTENER_LOG_INFO("using in-memory storage");
  return std::make_shared<memory::MemoryRepository>();
}

} // namespace shortener::db
