#ifndef ARMGUARD_CORE_CANCELLATION_HPP_
#define ARMGUARD_CORE_CANCELLATION_HPP_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace armguard::core {

// Cooperative stop flag shared between a worker and its controller.
//
// `Cancel()` wakes any thread parked in `WaitFor`/`WaitUntil`.
// `CancelFromSignal()` only performs a lock-free store, so it is safe inside a
// POSIX signal handler; sleepers notice it within one poll slice.
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  void CancelFromSignal() noexcept {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Returns true when cancelled before `deadline`.
  bool WaitUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mu_);
    while (!IsCancelled()) {
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return false;
      }
      const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kPollSlice);
      cv_.wait_for(lock, slice);
    }
    return true;
  }

  bool WaitFor(std::chrono::steady_clock::duration timeout) {
    return WaitUntil(std::chrono::steady_clock::now() + timeout);
  }

private:
  static constexpr std::chrono::milliseconds kPollSlice{20};

  std::atomic<bool> cancelled_{false};
  std::mutex mu_;
  std::condition_variable cv_;
};

} // namespace armguard::core

#endif // ARMGUARD_CORE_CANCELLATION_HPP_
