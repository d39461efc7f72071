#pragma once

#include <memory>

#include "internal/db/api/url_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace shortener::db::sqlite {

class SqliteRepository final : public db::UrlRepository {
public:
  // Runs the urls schema migrations on db.
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  const char* Name() const override {
    return "sqlite";
  }

  Result Save(const CancellationToken&, const std::string& short_id, const std::string& original_url,
              const std::string& user_id) override;
  Result SaveBatch(const CancellationToken&, const UrlBatch& items, const std::string& user_id) override;

  std::optional<std::string> Get(const CancellationToken&, const std::string& short_id) override;
  std::optional<std::string> FindByOriginalURL(const CancellationToken&, const std::string& original_url) override;
  std::vector<UserUrl> GetURLsByUserID(const CancellationToken&, const std::string& user_id) override;

  Result DeleteURLs(const CancellationToken&, const std::vector<std::string>& short_ids,
                    const std::string& user_id) override;

  Result Ping(const CancellationToken&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static Result Translate(sqlite3* db, int rc);
  static Result Insert(sqlite3* db, const std::string& short_id, const std::string& original_url, const std::string& user_id);
};

}
