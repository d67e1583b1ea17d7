#pragma once
/**
 * @file backoff.hpp
 * @brief Exponential retry delay for reconnect loops.
 *
 * Delay n is initial * multiplier^n, capped at max_interval. There is no limit on the
 * number of attempts or on the total time spent retrying; the caller decides when to
 * give up (here: only on shutdown).
 */
#include <algorithm>
#include <chrono>
#include <cstdint>

namespace utils {

struct BackoffParams {
  std::chrono::milliseconds initial_interval{500};
  double multiplier{1.5};
  std::chrono::milliseconds max_interval{5000};
};

/**
 * Usage:
 *   utils::ExponentialBackoff bo;
 *   while (!connect()) sleep(bo.next_delay());
 *   bo.reset();
 */
class ExponentialBackoff {
public:
  ExponentialBackoff() = default;
  explicit ExponentialBackoff(BackoffParams p) : p_(p) { reset(); }

  void reset() noexcept {
    current_ = p_.initial_interval;
    attempts_ = 0;
  }

  /// Delay to wait before the next attempt, then grow the interval.
  std::chrono::milliseconds next_delay() noexcept {
    const auto d = std::min(current_, p_.max_interval);
    ++attempts_;

    const double grown = static_cast<double>(current_.count()) * std::max(p_.multiplier, 1.0);
    const double cap = static_cast<double>(p_.max_interval.count());
    current_ = std::chrono::milliseconds(static_cast<int64_t>(std::min(grown, cap)));
    return d;
  }

  std::uint64_t attempts() const noexcept { return attempts_; }
  const BackoffParams& params() const noexcept { return p_; }

private:
  BackoffParams p_{};
  std::chrono::milliseconds current_{p_.initial_interval};
  std::uint64_t attempts_{0};
};

} // namespace utils
