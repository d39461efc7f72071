#pragma once

#include <memory>
#include <mutex>

#include "sqlite_db.hpp"

namespace shortener::db::sqlite {

/*
  SQLite transaction guard.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Holds the handle's lock for its lifetime; rolls back on destruction
  unless committed.
*/
class SqliteTransaction final {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit();
  void Rollback();

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool finished_ = false;
};

}
