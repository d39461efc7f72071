#pragma once

#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/url_repository.hpp"
#include "internal/db/model/url_record.hpp"

namespace shortener::db::memory {

/*
  Volatile store. Construction cannot fail; this is the last link of the
  selector's fallback chain.
*/
class MemoryRepository final : public db::UrlRepository {
public:
  MemoryRepository();

  const char* Name() const override {
    return "memory";
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

  std::size_t Size() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, model::UrlRecord> urls_;
};

}
