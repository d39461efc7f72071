#include "shortener_service.hpp"

#include <exception>
#include <type_traits>
#include <unordered_map>

#include "internal/cache/user_url_cache.hpp"
#include "internal/db/api/url_repository.hpp"
#include "internal/deletion/delete_worker_pool.hpp"
#include "internal/generator/short_id_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shortener::service {

using observability::IntField;
using observability::StringField;

namespace {

template <typename Fn>
auto ObserveCall(std::string_view route, const std::string& user_id, Fn&& fn) {
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const util::Cancelled&) {
    throw;
  } catch (const std::exception& ex) {
    SHORTENER_LOG_ERROR("request failed", {StringField("route", route), StringField("user_id", user_id),
                                           StringField("error", ex.what())});
    throw;
  }
}

void EnsureActive(const util::CancellationToken& ctx, std::string_view operation) {
  if (ctx.IsCancelled()) throw util::Cancelled(std::string(operation) + ": request cancelled");
}

[[noreturn]] void ThrowWriteFailure(const db::Result& result, const std::string& what) {
  if (result.code == db::ErrorCode::Cancelled) throw util::Cancelled(what + ": " + result.Describe());
  throw util::StorageError(what + ": " + result.Describe());
}

} // namespace

// Holds a url exclusively for the lifetime of one Shorten call. Throws
// util::Cancelled if ctx is cancelled while another call holds the url.
class ShortenerService::UrlClaim {
 public:
  UrlClaim(ShortenerService& service, const util::CancellationToken& ctx, const std::string& url)
      : service_(service), url_(url) {
    bool          acquired      = false;
    std::uint64_t registered_in = 0;

    // runs under ctx's lock; the holder notifies every registered waiter on release
    ctx.WaitUntil([&] {
      if (acquired) return true;

      std::lock_guard lock(service_.claims_mutex_);
      auto it = service_.claims_.find(url_);
      if (it == service_.claims_.end()) {
        service_.claims_.emplace(url_, ClaimState{.generation = ++service_.claim_generation_, .waiters = {}});
        acquired = true;
        return true;
      }
      if (registered_in != it->second.generation) {
        it->second.waiters.push_back(ctx);
        registered_in = it->second.generation;
      }
      return false;
    });

    if (!acquired) throw util::Cancelled("shorten: request cancelled while waiting for " + url_);
  }

  ~UrlClaim() {
    std::vector<util::CancellationToken> waiters;
    {
      std::lock_guard lock(service_.claims_mutex_);
      auto it = service_.claims_.find(url_);
      waiters = std::move(it->second.waiters);
      service_.claims_.erase(it);
    }
    for (const auto& waiter : waiters) waiter.Notify();
  }

  UrlClaim(const UrlClaim&)            = delete;
  UrlClaim& operator=(const UrlClaim&) = delete;

 private:
  ShortenerService& service_;
  std::string       url_;
};

ShortenerService::ShortenerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.repository) throw util::InvalidArgument("shortener service requires a repository");
  if (!ctx_.generator) throw util::InvalidArgument("shortener service requires a generator");
  if (!ctx_.cache) throw util::InvalidArgument("shortener service requires a cache");
  if (!ctx_.deletions) throw util::InvalidArgument("shortener service requires a delete pool");
}

std::string ShortenerService::ShortUrl(const std::string& short_id) const {
  return ctx_.base_url + "/" + short_id;
}

std::string ShortenerService::NextId() {
  auto id = ctx_.generator->Generate();
  if (id.empty()) throw util::ConfigurationError("short id generator returned an empty id");
  return id;
}

std::optional<std::string> ShortenerService::FindExisting(const util::CancellationToken& ctx,
                                                          const std::string& original_url) {
  try {
    return ctx_.repository->FindByOriginalURL(ctx, original_url);
  } catch (const util::Cancelled&) {
    throw;
  } catch (const std::exception& ex) {
    throw util::StorageError("error finding URL " + original_url + ": " + ex.what());
  }
}

model::ShortenResult ShortenerService::Shorten(const util::CancellationToken& ctx, const std::string& original_url,
                                               const std::string& user_id) {
  return ObserveCall("Shorten", user_id, [&] {
    EnsureActive(ctx, "shorten");

    UrlClaim claim(*this, ctx, original_url);

    if (auto existing = FindExisting(ctx, original_url)) {
      return model::ShortenResult{.short_url = ShortUrl(*existing), .is_new = false};
    }

    for (int attempt = 0; attempt < kMaxGenerateAttempts; ++attempt) {
      const auto id = NextId();

      ctx_.cache->Invalidate(user_id);

      const auto result = ctx_.repository->Save(ctx, id, original_url, user_id);
      if (result) return model::ShortenResult{.short_url = ShortUrl(id), .is_new = true};
      if (result.code != db::ErrorCode::AlreadyExists)
        ThrowWriteFailure(result, "error saving URL " + original_url + " as " + id);
    }

    throw util::ConfigurationError("no unused short id after " + std::to_string(kMaxGenerateAttempts) +
                                   " attempts; increase generator length");
  });
}

std::vector<model::BatchShortenResult> ShortenerService::ShortenBatch(
    const util::CancellationToken& ctx, const std::vector<model::BatchShortenRequest>& items,
    const std::string& user_id) {
  return ObserveCall("ShortenBatch", user_id, [&] {
    EnsureActive(ctx, "shorten batch");

    std::vector<model::BatchShortenResult> results;
    if (items.empty()) return results;

    for (int attempt = 0; attempt < kMaxGenerateAttempts; ++attempt) {
      // ids[i] belongs to items[i]; the batch map alone cannot recover that
      // pairing when urls repeat
      std::vector<std::string> ids;
      ids.reserve(items.size());
      db::UrlBatch batch;

      for (const auto& item : items) {
        auto id = NextId();
        for (int retry = 1; batch.contains(id); ++retry) {
          if (retry >= kMaxGenerateAttempts)
            throw util::ConfigurationError("short id generator keeps repeating ids within one batch");
          id = NextId();
        }
        batch.emplace(id, item.original_url);
        ids.push_back(std::move(id));
      }

      ctx_.cache->Invalidate(user_id);

      const auto result = ctx_.repository->SaveBatch(ctx, batch, user_id);
      if (!result) {
        if (result.code == db::ErrorCode::AlreadyExists) continue;
        ThrowWriteFailure(result, "error saving batch of " + std::to_string(items.size()) + " URLs");
      }

      results.reserve(items.size());
      for (std::size_t i = 0; i < items.size(); ++i) {
        results.push_back({.correlation_id = items[i].correlation_id, .short_url = ShortUrl(ids[i])});
      }
      return results;
    }

    throw util::ConfigurationError("no unused short ids for batch after " + std::to_string(kMaxGenerateAttempts) +
                                   " attempts; increase generator length");
  });
}

std::optional<std::string> ShortenerService::Get(const util::CancellationToken& ctx, const std::string& short_id) {
  return ctx_.repository->Get(ctx, short_id);
}

std::vector<model::UserUrl> ShortenerService::GetURLsByUserID(const util::CancellationToken& ctx,
                                                              const std::string& user_id) {
  return ObserveCall("GetURLsByUserID", user_id, [&] {
    EnsureActive(ctx, "list urls");

    if (auto cached = ctx_.cache->Get(user_id)) return *cached;

    const auto epoch = ctx_.cache->Epoch(user_id);

    std::vector<model::UserUrl> urls;
    try {
      urls = ctx_.repository->GetURLsByUserID(ctx, user_id);
    } catch (const util::Cancelled&) {
      throw;
    } catch (const std::exception& ex) {
      throw util::StorageError("error listing URLs for user " + user_id + ": " + ex.what());
    }

    for (auto& url : urls) url.short_url = ShortUrl(url.short_url);

    ctx_.cache->PutIfUnchanged(user_id, urls, epoch);
    return urls;
  });
}

void ShortenerService::DeleteURLs(const util::CancellationToken& ctx, const std::vector<std::string>& short_ids,
                                  const std::string& user_id) {
  ObserveCall("DeleteURLs", user_id, [&] {
    EnsureActive(ctx, "delete urls");

    ctx_.cache->Invalidate(user_id);

    auto ticket = ctx_.deletions->Submit(short_ids, user_id, ctx);
    SHORTENER_LOG_INFO("delete batch accepted",
                       {StringField("user_id", user_id), IntField("count", static_cast<std::int64_t>(short_ids.size()))});

    ctx.WaitUntil([&] { return ticket->Dispatched(); });
  });
}

db::Result ShortenerService::Ping(const util::CancellationToken& ctx) {
  return ctx_.repository->Ping(ctx);
}

}
