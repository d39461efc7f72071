#pragma once

#include <memory>
#include <string>

#include "internal/db/api/url_repository.hpp"

namespace shortener::db {

inline constexpr const char* kSqliteDsnPrefix = "sqlite://";

/*
  SelectRepository

  Fixed priority, evaluated once at startup:

    1. SQL   when sql_dsn is non-empty ("sqlite://<path>" or a PostgreSQL uri)
    2. File  when file_path is non-empty
    3. Memory, which cannot fail

  A backend that fails to construct is logged and skipped. No retries.
*/
std::shared_ptr<UrlRepository> SelectRepository(const std::string& sql_dsn, const std::string& file_path);

// Throws when the backend cannot be constructed (or was not compiled in).
std::shared_ptr<UrlRepository> OpenSqlRepository(const std::string& sql_dsn);

} // namespace shortener::db
