#pragma once

#include <string>

namespace shortener::db::model {

/*
  Persistent short url row.

  - short_id is the primary key.
  - At most one live (is_deleted == false) row per original_url.
  - Deleted rows stay in storage; their original_url may be reused.
*/
struct UrlRecord {
  std::string short_id;
  std::string original_url;
  std::string user_id;
  bool        is_deleted = false;
};

} // namespace shortener::db::model
