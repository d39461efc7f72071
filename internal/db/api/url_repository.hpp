#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/url.hpp"
#include "internal/util/cancellation.hpp"

namespace shortener::db {

using util::CancellationToken;
using UserUrl = shortener::model::UserUrl;

// short id -> original url
using UrlBatch = std::unordered_map<std::string, std::string>;

/*
  Storage abstraction shared by the memory, file and SQL stores.

  CRITICAL GUARANTEES:

  - Save/SaveBatch never overwrite an existing short id; a conflict returns
    AlreadyExists and writes nothing
  - SaveBatch is all-or-nothing
  - Get and FindByOriginalURL only see live (non-deleted) rows
  - DeleteURLs silently skips ids the caller does not own
  - Implementations are safe for concurrent use and never call back into
    the service layer

  Writes report failure through Result. Reads that must surface a backend
  failure (FindByOriginalURL, GetURLsByUserID) throw util::StorageError, or
  util::Cancelled when the token is already cancelled. Get hides failures
  behind "not found".
*/
class UrlRepository {
 public:
  virtual ~UrlRepository() = default;

  // "memory", "file", "sqlite", "postgres"
  virtual const char* Name() const = 0;

  virtual Result Save(const CancellationToken& ctx, const std::string& short_id, const std::string& original_url,
                      const std::string& user_id) = 0;

  virtual Result SaveBatch(const CancellationToken& ctx, const UrlBatch& items, const std::string& user_id) = 0;

  virtual std::optional<std::string> Get(const CancellationToken& ctx, const std::string& short_id) = 0;

  virtual std::optional<std::string> FindByOriginalURL(const CancellationToken& ctx, const std::string& original_url) = 0;

  // short_url of each entry holds the bare short id
  virtual std::vector<UserUrl> GetURLsByUserID(const CancellationToken& ctx, const std::string& user_id) = 0;

  virtual Result DeleteURLs(const CancellationToken& ctx, const std::vector<std::string>& short_ids,
                            const std::string& user_id) = 0;

  virtual Result Ping(const CancellationToken& ctx) = 0;
};

} // namespace shortener::db
