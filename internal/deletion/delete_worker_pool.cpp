#include "delete_worker_pool.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shortener::deletion {

using observability::StringField;

DeleteWorkerPool::DeleteWorkerPool(std::shared_ptr<db::UrlRepository> repository, std::size_t workers)
    : repository_(std::move(repository)) {
  if (!repository_) throw util::InvalidArgument("delete pool requires a repository");
  if (workers == 0) throw util::InvalidArgument("delete pool requires at least one worker");

  dispatcher_ = std::thread(&DeleteWorkerPool::RunDispatcher, this);
  workers_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) workers_.emplace_back(&DeleteWorkerPool::RunWorker, this);
  supervisor_ = std::thread(&DeleteWorkerPool::RunSupervisor, this);
}

DeleteWorkerPool::~DeleteWorkerPool() {
  Stop();
}

std::shared_ptr<DeleteTicket> DeleteWorkerPool::Submit(std::vector<std::string> short_ids, std::string user_id,
                                                       const util::CancellationToken& caller) {
  auto ticket = std::make_shared<DeleteTicket>(caller);
  if (short_ids.empty()) {
    ticket->dispatched = true;
    return ticket;
  }

  // one unit per id plus one released when the batch is fully dispatched
  const auto count = short_ids.size() + 1;
  {
    std::lock_guard lock(idle_mutex_);
    pending_ += count;
  }

  if (!batches_.Enqueue(DeleteBatch{std::move(short_ids), std::move(user_id), ticket})) {
    {
      std::lock_guard lock(idle_mutex_);
      pending_ -= count;
    }
    idle_cv_.notify_all();
    throw util::StorageError("delete pool is stopped");
  }
  return ticket;
}

void DeleteWorkerPool::WaitIdle() {
  std::unique_lock lock(idle_mutex_);
  idle_cv_.wait(lock, [&] { return pending_ == 0; });
}

std::size_t DeleteWorkerPool::Pending() const {
  std::lock_guard lock(idle_mutex_);
  return pending_;
}

void DeleteWorkerPool::Stop() {
  std::lock_guard lock(stop_mutex_);
  if (stopped_) return;
  stopped_ = true;

  // upstream first so every stage drains before its consumer exits
  batches_.Shutdown();
  if (dispatcher_.joinable()) dispatcher_.join();

  tasks_.Shutdown();
  for (auto& worker : workers_)
    if (worker.joinable()) worker.join();

  outcomes_.Shutdown();
  if (supervisor_.joinable()) supervisor_.join();
}

void DeleteWorkerPool::RunDispatcher() {
  while (auto batch = batches_.Dequeue()) {
    for (auto& id : batch->short_ids) {
      // tasks_ is only shut down after the dispatcher has exited
      tasks_.Enqueue(DeleteTask{std::move(id), batch->user_id});
    }
    batch->ticket->dispatched = true;
    batch->ticket->waiter.Notify();
    Release();
  }
}

void DeleteWorkerPool::RunWorker() {
  while (auto task = tasks_.Dequeue()) {
    db::Result result;
    try {
      result = repository_->DeleteURLs(token_, {task->short_id}, task->user_id);
    } catch (const std::exception& e) {
      result = db::Result::Err(db::ErrorCode::InternalError, e.what());
    }
    outcomes_.Enqueue(DeleteOutcome{std::move(*task), std::move(result)});
  }
}

void DeleteWorkerPool::RunSupervisor() {
  while (auto outcome = outcomes_.Dequeue()) {
    if (!outcome->result) {
      SHORTENER_LOG_WARN("delete failed", {StringField("short_id", outcome->task.short_id),
                                           StringField("user_id", outcome->task.user_id),
                                           StringField("error", outcome->result.Describe())});
    }

    Release();
  }
}

void DeleteWorkerPool::Release() {
  {
    std::lock_guard lock(idle_mutex_);
    --pending_;
  }
  idle_cv_.notify_all();
}

} // namespace shortener::deletion
