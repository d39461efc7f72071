#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/url_repository.hpp"
#include "internal/deletion/delete_scheduler.hpp"
#include "internal/deletion/delete_task.hpp"

namespace shortener::deletion {

/*
  Bounded fan-out for DeleteURLs.

  One dispatcher splits each submitted batch into per-id tasks on an
  unbounded task queue, so dispatch never waits on a deletion. Concurrency
  is capped by the N workers that execute the tasks against the
  repository; they report outcomes to a supervisor, which logs failures
  and tracks completion.

  Work runs under the pool's own token: cancelling a submitter never aborts
  a deletion that has been accepted.
*/
class DeleteWorkerPool {
 public:
  DeleteWorkerPool(std::shared_ptr<db::UrlRepository> repository, std::size_t workers);
  ~DeleteWorkerPool();

  DeleteWorkerPool(const DeleteWorkerPool&)            = delete;
  DeleteWorkerPool& operator=(const DeleteWorkerPool&) = delete;

  // Queues ids for deletion. The ticket flips to dispatched once every id
  // has entered the worker queue; `caller` is notified at that point.
  // Throws util::StorageError after Stop().
  std::shared_ptr<DeleteTicket> Submit(std::vector<std::string> short_ids, std::string user_id,
                                       const util::CancellationToken& caller);

  // Blocks until every accepted id has been executed.
  void WaitIdle();

  // Drains queued work and joins all threads. Idempotent.
  void Stop();

  std::size_t Workers() const {
    return workers_.size();
  }

  // Ids not yet executed, plus one per batch still being dispatched.
  std::size_t Pending() const;

 private:
  void RunDispatcher();
  void RunWorker();
  void RunSupervisor();
  void Release();

  std::shared_ptr<db::UrlRepository> repository_;
  util::CancellationToken            token_;

  BlockingQueue<DeleteBatch>   batches_;
  DeleteScheduler              tasks_;
  BlockingQueue<DeleteOutcome> outcomes_;

  std::thread              dispatcher_;
  std::vector<std::thread> workers_;
  std::thread              supervisor_;

  mutable std::mutex      idle_mutex_;
  std::condition_variable idle_cv_;
  std::size_t             pending_ = 0;

  std::mutex        stop_mutex_;
  std::atomic<bool> stopped_{false};
};

} // namespace shortener::deletion
