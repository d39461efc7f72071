#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "delete_task.hpp"

namespace shortener::deletion {

/*
  Thread-safe blocking queue shared by the delete dispatcher, workers and
  supervisor.

  Unbounded: Enqueue never blocks. After Shutdown() Enqueue refuses new
  items and Dequeue drains what is left, then returns nullopt.
*/
template <typename T>
class BlockingQueue {
 public:
  bool Enqueue(T item) {
    {
      std::lock_guard lock(mutex_);
      if (shutdown_) return false;
      queue_.push(std::move(item));
    }
    not_empty_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Dequeue() {
    std::unique_lock lock(mutex_);

    not_empty_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop();
    return item;
  }

  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    not_empty_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable not_empty_;
  std::queue<T>           queue_;
  bool                    shutdown_ = false;
};

// Per-id work queue between the dispatcher and the workers.
using DeleteScheduler = BlockingQueue<DeleteTask>;

} // namespace shortener::deletion
