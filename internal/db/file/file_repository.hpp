#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "internal/db/api/url_repository.hpp"
#include "internal/db/model/url_record.hpp"

namespace shortener::db::file {

/*
  FileRepository

  In-memory map mirrored to a JSON document on disk.

  Design notes:
  -------------
  - Mutations update the map under mutex_ and return; the rewrite happens on
    a background flusher thread.
  - Requests that arrive while a rewrite is in progress coalesce into one
    follow-up rewrite.
  - Rewrites go to "<path>.tmp" and are renamed over <path>, serialized by
    flush_mutex_.
  - A crash between a mutation and its flush loses that mutation.

  Lock order: mutex_ is never held while waiting on flush_mutex_.
*/
class FileRepository final : public db::UrlRepository {
public:
  // Loads <path> if it exists, otherwise creates it empty.
  // Throws std::runtime_error when the file cannot be read, parsed or created.
  explicit FileRepository(std::string path);
  ~FileRepository() override;

  FileRepository(const FileRepository&)            = delete;
  FileRepository& operator=(const FileRepository&) = delete;

  const char* Name() const override {
    return "file";
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

  // Synchronous rewrite of the current state.
  Result Flush();

  // Blocks until every requested background flush has finished.
  void WaitForPendingFlushes();

  const std::string& Path() const {
    return path_;
  }

private:
  void Load();
  void RequestFlush();
  void RunFlusher();

  std::string path_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, model::UrlRecord> urls_;
  uint64_t generation_ = 0;

  std::mutex flush_mutex_;
  uint64_t   flushed_generation_ = 0;

  std::mutex              flusher_mutex_;
  std::condition_variable flusher_cv_;
  bool                    flush_requested_ = false;
  bool                    flushing_        = false;
  bool                    stop_            = false;
  std::thread             flusher_;
};

} // namespace shortener::db::file
