#include "rate_limit_backoff.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "util/timestamp.hpp"

#include <mutex>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ghrc {

namespace {

std::shared_ptr<spdlog::logger> backoff_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("backoff");
  }();
  return logger;
}

bool parse_long(const std::string &text, long long &out) {
  try {
    std::size_t idx = 0;
    long long value = std::stoll(text, &idx, 10);
    if (idx != text.size()) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

} // namespace

RateLimitBackoff::RateLimitBackoff(Clock clock) : clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

bool RateLimitBackoff::should_fail_fast() {
  State current;
  {
    std::shared_lock lock(mutex_);
    current = state_;
  }
  if (!current.active) {
    return false;
  }
  TimePoint now = clock_();
  if (now < current.reset_at) {
    return true;
  }
  std::unique_lock lock(mutex_);
  // Another response may have pushed the reset instant forward meanwhile.
  if (state_.active && now >= state_.reset_at) {
    state_.active = false;
    backoff_log()->info("Rate limit backoff ended");
  }
  return state_.active;
}

void RateLimitBackoff::observe(const std::vector<std::string> &headers) {
  auto remaining_header = find_header(headers, "x-ratelimit-remaining");
  if (!remaining_header) {
    return;
  }
  long long remaining = 0;
  if (!parse_long(*remaining_header, remaining)) {
    backoff_log()->warn("Error parsing x-ratelimit-remaining '{}'",
                        *remaining_header);
    return;
  }
  if (remaining != 0) {
    return;
  }
  auto reset_header = find_header(headers, "x-ratelimit-reset");
  long long reset_epoch = 0;
  if (!reset_header || !parse_long(*reset_header, reset_epoch)) {
    backoff_log()->warn("Error parsing x-ratelimit-reset '{}'",
                        reset_header.value_or(""));
    return;
  }
  TimePoint reset_at{std::chrono::seconds(reset_epoch)};
  std::unique_lock lock(mutex_);
  if (state_.active && reset_at <= state_.reset_at) {
    return;
  }
  bool entering = !state_.active;
  state_.active = true;
  state_.reset_at = reset_at;
  lock.unlock();
  if (entering) {
    backoff_log()->warn("Rate limited by upstream, entering backoff until {}",
                        format_timestamp(reset_at));
  } else {
    backoff_log()->info("Backoff extended until {}",
                        format_timestamp(reset_at));
  }
}

RateLimitBackoff::State RateLimitBackoff::state() const {
  std::shared_lock lock(mutex_);
  return state_;
}

} // namespace ghrc
