#pragma once

#include <string>
#include <vector>

namespace shortener::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL(). Migrations only create what is
  missing; nothing is ever dropped.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// The urls schema, in order.
const std::vector<std::string>& UrlSchema();

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace shortener::db::sql
