#pragma once
/**
 * @file rate_limiter.hpp
 * @brief Fixed-rate schedule for loops that also wait on a socket.
 *
 * The schedule is a monotonic "next tick" (steady_clock). If the loop runs
 * late by a full period or more, missed ticks are skipped rather than
 * replayed in a burst.
 */
#include <chrono>
#include <cstdint>

namespace utils {

/**
 * Usage:
 *   utils::RateLimiter rl;
 *   rl.set_period(interval);
 *   rl.reset();
 *   while (...) {
 *     if (rl.due()) { ... periodic work ...; rl.advance(); continue; }
 *     wait_for_io(rl.time_until_deadline());
 *   }
 */
class RateLimiter {
public:
  using clock = std::chrono::steady_clock;

  void set_period(std::chrono::duration<double> period) noexcept {
    period_ = std::chrono::duration_cast<clock::duration>(
      period.count() > 0.0 ? period : std::chrono::duration<double>(1.0));
  }

  /// First tick is due immediately.
  void reset() noexcept {
    next_ = clock::now();
    skipped_ticks_ = 0;
  }

  bool due() const noexcept { return clock::now() >= next_; }

  clock::duration time_until_deadline() const noexcept {
    const auto now = clock::now();
    return (now >= next_) ? clock::duration::zero() : next_ - now;
  }

  void advance() noexcept {
    next_ += period_;
    const auto now = clock::now();
    if (now > next_) {
      skipped_ticks_ += static_cast<std::uint64_t>((now - next_) / period_) + 1;
      next_ = now + period_;
    }
  }

  /// Ticks dropped because the loop overran.
  std::uint64_t skipped_ticks() const noexcept { return skipped_ticks_; }

private:
  clock::duration period_{std::chrono::seconds(1)};
  clock::time_point next_{};
  std::uint64_t skipped_ticks_{0};
};

} // namespace utils
