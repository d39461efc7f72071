#pragma once

#include <memory>

#include "internal/db/api/url_repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace shortener::db::postgres {

class PgRepository final : public db::UrlRepository {
public:
  // Connects once to create the urls schema if missing; throws on failure.
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  const char* Name() const override {
    return "postgres";
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
  std::shared_ptr<PgPool> pool_;

  static Result Translate(const std::exception&);
};

}
