#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/url.hpp"

namespace shortener::cache {

/*
  Per-user snapshot of listed urls.

  One reader-writer lock over the whole map. Entries have no TTL: they are
  dropped, never patched, whenever the owning user writes.

  Fills are guarded by a per-user invalidation epoch: a reader takes
  Epoch(user_id) before fetching from storage and stores with
  PutIfUnchanged(). If that user was invalidated in between, the fetched
  snapshot may predate the write and is discarded. Writes by other users
  never discard a fill.
*/
class UserUrlCache {
 public:
  using Snapshot = std::vector<model::UserUrl>;

  std::optional<Snapshot> Get(const std::string& user_id) const;

  uint64_t Epoch(const std::string& user_id) const;

  // Returns false (and stores nothing) when user_id was invalidated after epoch was read.
  bool PutIfUnchanged(const std::string& user_id, Snapshot snapshot, uint64_t epoch);

  void Invalidate(const std::string& user_id);

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Snapshot> cache_;
  // only users that have been invalidated at least once have an entry
  std::unordered_map<std::string, uint64_t> epochs_;
};

} // namespace shortener::cache
