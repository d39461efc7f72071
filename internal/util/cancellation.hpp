#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

namespace shortener::util {

/*
  Cancellation-aware request context.

  Copies share one state. Cancel() is sticky and wakes every waiter.
  A default constructed token is never cancelled unless Cancel() is called.
*/
class CancellationToken {
 public:
  CancellationToken();

  void Cancel();
  bool IsCancelled() const;

  // Blocks until ready() returns true or the token is cancelled.
  // ready() is evaluated under the token's internal lock; Notify() must be
  // called after the state it observes changes.
  // Returns ready() at wake-up.
  bool WaitUntil(const std::function<bool()>& ready) const;

  // Wakes waiters so they re-check their predicate.
  void Notify() const;

  static CancellationToken None();

 private:
  struct State {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    cancelled = false;
  };

  std::shared_ptr<State> state_;
};

} // namespace shortener::util
