#include "cancellation.hpp"

namespace shortener::util {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {
}

CancellationToken CancellationToken::None() {
  return CancellationToken();
}

void CancellationToken::Cancel() {
  {
    std::lock_guard lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

bool CancellationToken::WaitUntil(const std::function<bool()>& ready) const {
  std::unique_lock lock(state_->mutex);
  state_->cv.wait(lock, [&] { return state_->cancelled || ready(); });
  return ready();
}

void CancellationToken::Notify() const {
  {
    // pairs with the predicate check in WaitUntil so a wake-up is not lost
    std::lock_guard lock(state_->mutex);
  }
  state_->cv.notify_all();
}

} // namespace shortener::util
