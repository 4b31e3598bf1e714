#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace conversion_service {

// Per-job cancellation flag. Stages poll cancelled(); loops that would otherwise
// sleep use waitFor() so a cancel wakes them immediately.
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel() {
    {
      std::lock_guard<std::mutex> lock{mtx_};
      cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  bool cancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Returns true when cancelled before the timeout elapsed.
  template <class Rep, class Period>
  bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock<std::mutex> lock{mtx_};
    return cv_.wait_for(lock, timeout, [this]() { return cancelled(); });
  }

private:
  std::atomic_bool cancelled_{false};
  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
};

} // namespace conversion_service
