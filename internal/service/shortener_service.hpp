#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/url.hpp"
#include "internal/util/cancellation.hpp"
#include "service_context.hpp"

namespace shortener::service {

/*
  Orchestrates id generation, deduplication, storage and the per-user cache.

  Safe for concurrent use. Lock order is cache, then storage; storage never
  calls back into the service.

  Failures are thrown as util::StorageError, util::ConfigurationError or
  util::Cancelled. DeleteURLs is best effort and never reports per-id
  failures.
*/
class ShortenerService {
 public:
  // Attempts per request before giving up on a colliding generator.
  static constexpr int kMaxGenerateAttempts = 5;

  explicit ShortenerService(ServiceContext ctx);

  model::ShortenResult Shorten(const util::CancellationToken& ctx, const std::string& original_url,
                               const std::string& user_id);

  std::vector<model::BatchShortenResult> ShortenBatch(const util::CancellationToken& ctx,
                                                      const std::vector<model::BatchShortenRequest>& items,
                                                      const std::string& user_id);

  std::optional<std::string> Get(const util::CancellationToken& ctx, const std::string& short_id);

  std::vector<model::UserUrl> GetURLsByUserID(const util::CancellationToken& ctx, const std::string& user_id);

  // Returns once every id is queued for the delete workers, or as soon as
  // ctx is cancelled. Queued deletions run to completion either way.
  void DeleteURLs(const util::CancellationToken& ctx, const std::vector<std::string>& short_ids,
                  const std::string& user_id);

  db::Result Ping(const util::CancellationToken& ctx);

  const ServiceContext& Context() const {
    return ctx_;
  }

 private:
  class UrlClaim;

  std::string ShortUrl(const std::string& short_id) const;
  std::string NextId();
  std::optional<std::string> FindExisting(const util::CancellationToken& ctx, const std::string& original_url);

  ServiceContext ctx_;

  // A url with a Shorten in progress. Waiters park on their own request
  // token, so cancelling a request releases it from the wait.
  struct ClaimState {
    std::uint64_t                        generation = 0;
    std::vector<util::CancellationToken> waiters;
  };

  // keeps concurrent callers from minting two live ids for one url
  std::mutex                                  claims_mutex_;
  std::unordered_map<std::string, ClaimState> claims_;
  std::uint64_t                               claim_generation_ = 0;
};

}
