#include "sqlite_db.hpp"

#include <stdexcept>

namespace shortener::db::sqlite {

namespace {

// writers queue behind each other for this long before SQLITE_BUSY
constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kMemoryPath = ":memory:";

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string detail = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    Fail("open", detail);
  }

  try {
    Configure();
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
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    const std::string detail = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    Fail("exec", detail);
  }
}

void SqliteDB::Configure() {
  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) Fail("busy timeout", sqlite3_errmsg(db_));

  // WAL lets listing and redirects proceed while a save holds the write lock
  if (path_ != kMemoryPath) Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
}

void SqliteDB::Fail(const std::string& what, const std::string& detail) const {
  throw std::runtime_error("sqlite " + what + " " + path_ + ": " + detail);
}

} // namespace shortener::db::sqlite
