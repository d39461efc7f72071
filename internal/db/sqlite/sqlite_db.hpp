#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace shortener::db::sqlite {

/*
  Owns the url store's single sqlite3 connection.

  One connection is shared by every request thread. Lock() must be held
  around each statement sequence so a transaction opened by one thread
  never absorbs statements issued by another. Errors are thrown as
  std::runtime_error naming the database file.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  // Opens (creating if needed) the database at path; ":memory:" is accepted.
  explicit SqliteDB(std::string path);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  std::unique_lock<std::mutex> Lock() {
    return std::unique_lock<std::mutex>(mutex_);
  }

 private:
  void Configure();
  [[noreturn]] void Fail(const std::string& what, const std::string& detail) const;

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  mutex_;
};

} // namespace shortener::db::sqlite
