#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace bsync {
namespace sync {

/**
 * Shared cancellation flag. cancel() may be called from a signal handler
 * thread; workers poll is_cancelled() and sleep through wait_for() so a
 * pending backoff wakes up as soon as the run is cancelled.
 */
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_.store(true);
    }
    cv_.notify_all();
  }

  bool is_cancelled() const { return cancelled_.load(); }

  // Sleeps for the duration or until cancelled. Returns true if cancelled.
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
  }

private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace sync
} // namespace bsync
