#include "net/cancellation_token.h"

namespace promptgate {

CancellationToken::CancellationToken(Clock::time_point deadline)
    : has_deadline_(true), deadline_(deadline) {}

void CancellationToken::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(true);
  }
  cv_.notify_all();
}

bool CancellationToken::IsCancelled() const {
  if (cancelled_.load()) {
    return true;
  }
  return has_deadline_ && Clock::now() >= deadline_;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
  auto until = Clock::now() + duration;
  bool deadline_first = has_deadline_ && deadline_ < until;
  if (deadline_first) {
    until = deadline_;
  }
  std::unique_lock<std::mutex> lock(mutex_);
  bool woke = cv_.wait_until(lock, until, [this] { return cancelled_.load(); });
  if (woke) {
    return false;
  }
  return !deadline_first;
}

void CancellationToken::ThrowIfCancelled(const std::string& stage) const {
  if (!IsCancelled()) {
    return;
  }
  if (cancelled_.load()) {
    throw RequestCancelled("request cancelled during " + stage);
  }
  throw RequestCancelled("request deadline exceeded during " + stage);
}

}  // namespace promptgate
