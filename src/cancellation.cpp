#include "roomba_base/cancellation.hpp"

#include <utility>

namespace roomba_base {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken CancellationToken::withDeadline(Clock::time_point deadline) {
  CancellationToken token;
  token.state_->deadline = deadline;
  return token;
}

CancellationToken CancellationToken::withTimeout(Clock::duration timeout) {
  return withDeadline(Clock::now() + timeout);
}

void CancellationToken::cancel() {
  std::map<std::size_t, Callback> callbacks;
  {
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->cancelled) return;
    state_->cancelled = true;
    callbacks.swap(state_->callbacks);
  }
  // Run outside the lock so a callback may touch this token.
  for (auto& kv : callbacks) {
    kv.second();
  }
}

bool CancellationToken::isCancelled() const {
  std::lock_guard<std::mutex> lk(state_->mtx);
  return state_->cancelled;
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::deadline() const {
  std::lock_guard<std::mutex> lk(state_->mtx);
  return state_->deadline;
}

std::size_t CancellationToken::subscribe(Callback cb) {
  {
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (!state_->cancelled) {
      const std::size_t id = state_->next_id++;
      state_->callbacks.emplace(id, std::move(cb));
      return id;
    }
  }
  cb();
  return 0;
}

void CancellationToken::unsubscribe(std::size_t id) {
  std::lock_guard<std::mutex> lk(state_->mtx);
  state_->callbacks.erase(id);
}

}  // namespace roomba_base
