#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace exporter {

/**
 * @brief Process-wide cancellation signal shared by the reader and the HTTP server.
 *
 * request_stop() is async-signal-safe (a single atomic store). Threads sleeping in
 * wait_for() are woken by the signal handler only at their next poll of the flag, so
 * waits are sliced.
 */
class StopFlag {
public:
  void request_stop() noexcept { stop_.store(true, std::memory_order_release); }
  bool stop_requested() const noexcept { return stop_.load(std::memory_order_acquire); }

  // Wakes waiters right away. Not for use from a signal handler.
  void request_stop_and_notify() {
    request_stop();
    std::scoped_lock lk(mtx_);
    cv_.notify_all();
  }

  /// Sleep up to @p d. Returns true if a stop was requested meanwhile.
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> d) {
    constexpr auto kSlice = std::chrono::milliseconds(100);
    const auto deadline = std::chrono::steady_clock::now() + d;

    std::unique_lock lk(mtx_);
    while (!stop_requested()) {
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) return false;
      const auto next = (deadline - now < kSlice) ? deadline : now + kSlice;
      cv_.wait_until(lk, next);
    }
    return true;
  }

private:
  std::atomic<bool> stop_{false};
  std::mutex mtx_;
  std::condition_variable cv_;
};

} // namespace exporter
