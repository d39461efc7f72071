#include "user_url_cache.hpp"

#include <mutex>

namespace shortener::cache {

std::optional<UserUrlCache::Snapshot> UserUrlCache::Get(const std::string& user_id) const {
    std::shared_lock lock(mutex_);

    auto it = cache_.find(user_id);
    if (it == cache_.end())
        return std::nullopt;

    return it->second;
}

uint64_t UserUrlCache::Epoch(const std::string& user_id) const {
    std::shared_lock lock(mutex_);

    auto it = epochs_.find(user_id);
    return it == epochs_.end() ? 0 : it->second;
}

bool UserUrlCache::PutIfUnchanged(const std::string& user_id, Snapshot snapshot, uint64_t epoch) {
    std::unique_lock lock(mutex_);

    auto it = epochs_.find(user_id);
    const uint64_t current = it == epochs_.end() ? 0 : it->second;
    if (epoch != current)
        return false;

    cache_[user_id] = std::move(snapshot);
    return true;
}

void UserUrlCache::Invalidate(const std::string& user_id) {
    std::unique_lock lock(mutex_);
    cache_.erase(user_id);
    ++epochs_[user_id];
}

} // namespace shortener::cache
