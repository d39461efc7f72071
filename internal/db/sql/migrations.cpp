#include "migrations.hpp"

#include "sql_queries.hpp"

namespace shortener::db::sql {

const std::vector<std::string>& UrlSchema() {
  static const std::vector<std::string> kSchema = {
      CREATE_URLS_TABLE,
      CREATE_URLS_ORIGINAL_URL_INDEX,
      CREATE_URLS_USER_ID_INDEX,
  };
  return kSchema;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace shortener::db::sql
