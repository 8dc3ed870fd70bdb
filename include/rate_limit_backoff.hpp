/**
 * @file rate_limit_backoff.hpp
 * @brief Local backoff state driven by upstream rate-limit headers.
 *
 * Once upstream reports that the request budget is exhausted, every outbound
 * call fails fast until the advertised reset instant. The state is cleared
 * lazily by the first call made at or after that instant.
 */
#ifndef GITHUBREADCACHE_RATE_LIMIT_BACKOFF_HPP
#define GITHUBREADCACHE_RATE_LIMIT_BACKOFF_HPP

#include <chrono>
#include <functional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ghrc {

/**
 * Two-state machine (Active / InBackoff) guarded by its own lock.
 */
class RateLimitBackoff {
public:
  using TimePoint = std::chrono::system_clock::time_point;
  /// Source of the current wall-clock time.
  using Clock = std::function<TimePoint()>;

  /// Point-in-time copy of the backoff state.
  struct State {
    bool active{false};
    TimePoint reset_at{};
  };

  /**
   * @param clock Time source; the system clock is used when empty.
   */
  explicit RateLimitBackoff(Clock clock = {});

  /**
   * Decide whether an outbound call must be rejected.
   *
   * Clears the backoff when the reset instant has been reached.
   *
   * @return `true` while in backoff and before the reset instant.
   */
  bool should_fail_fast();

  /**
   * Update the state from the headers of an upstream response.
   *
   * A `x-ratelimit-remaining` of zero enters backoff until the epoch-seconds
   * instant in `x-ratelimit-reset`. While already in backoff the reset instant
   * only moves forward.
   *
   * @param headers Response headers as `Name: value` strings.
   */
  void observe(const std::vector<std::string> &headers);

  /// Current state snapshot.
  State state() const;

  /// Current time according to the configured clock.
  TimePoint now() const { return clock_(); }

private:
  Clock clock_;
  mutable std::shared_mutex mutex_;
  State state_;
};

} // namespace ghrc

#endif // GITHUBREADCACHE_RATE_LIMIT_BACKOFF_HPP
