#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>

namespace promptgate {

class RequestCancelled : public std::runtime_error {
 public:
  explicit RequestCancelled(const std::string& what) : std::runtime_error(what) {}
};

// Per-request cancellation signal. A token is cancelled explicitly through
// Cancel() or implicitly once its deadline passes. Waiters block on a
// condition variable, so a cancelled request wakes immediately.
//
// Thread safety: all methods may be called concurrently.
class CancellationToken {
 public:
  using Clock = std::chrono::steady_clock;

  CancellationToken() = default;
  explicit CancellationToken(Clock::time_point deadline);
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  static Clock::time_point DeadlineAfter(std::chrono::milliseconds timeout) {
    return Clock::now() + timeout;
  }

  void Cancel();
  bool IsCancelled() const;
  bool HasDeadline() const { return has_deadline_; }
  Clock::time_point Deadline() const { return deadline_; }

  // Sleeps for `duration` or until cancellation, whichever comes first.
  // Returns true when the full duration elapsed.
  bool WaitFor(std::chrono::milliseconds duration) const;

  // Throws RequestCancelled naming `stage` if the token is cancelled.
  void ThrowIfCancelled(const std::string& stage) const;

 private:
  std::atomic<bool> cancelled_{false};
  bool has_deadline_{false};
  Clock::time_point deadline_{};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

}  // namespace promptgate
