#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/util/cancellation.hpp"

namespace shortener::deletion {

/*
  Tracks dispatch of one DeleteURLs request.

  dispatched flips once every id has been handed to the worker queue; the
  submitter's token is notified at that point so a waiter blocked on it
  wakes up.
*/
struct DeleteTicket {
  explicit DeleteTicket(util::CancellationToken token) : waiter(std::move(token)) {
  }

  bool Dispatched() const {
    return dispatched.load();
  }

  std::atomic<bool>       dispatched{false};
  util::CancellationToken waiter;
};

// A whole request, queued for the dispatcher.
struct DeleteBatch {
  std::vector<std::string>      short_ids;
  std::string                   user_id;
  std::shared_ptr<DeleteTicket> ticket;
};

// One id, executed by a worker.
struct DeleteTask {
  std::string short_id;
  std::string user_id;
};

struct DeleteOutcome {
  DeleteTask task;
  db::Result result;
};

} // namespace shortener::deletion
