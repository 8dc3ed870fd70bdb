#include "rate_limit_backoff.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace ghrc;
using namespace std::chrono;

namespace {

struct ManualClock {
  std::shared_ptr<RateLimitBackoff::TimePoint> now =
      std::make_shared<RateLimitBackoff::TimePoint>(seconds(1'700'000'000));

  RateLimitBackoff::Clock fn() const {
    auto p = now;
    return [p] { return *p; };
  }
  void advance(seconds s) { *now += s; }
  long long epoch() const {
    return duration_cast<seconds>(now->time_since_epoch()).count();
  }
};

std::vector<std::string> exhausted(long long reset_epoch) {
  return {"X-RateLimit-Remaining: 0",
          "X-RateLimit-Reset: " + std::to_string(reset_epoch)};
}

} // namespace

TEST_CASE("backoff starts active") {
  ManualClock clock;
  RateLimitBackoff backoff(clock.fn());
  CHECK_FALSE(backoff.should_fail_fast());
  CHECK_FALSE(backoff.state().active);
}

TEST_CASE("remaining budget does not enter backoff") {
  ManualClock clock;
  RateLimitBackoff backoff(clock.fn());
  backoff.observe({"x-ratelimit-remaining: 12",
                   "x-ratelimit-reset: " + std::to_string(clock.epoch() + 60)});
  CHECK_FALSE(backoff.state().active);
  CHECK_FALSE(backoff.should_fail_fast());
}

TEST_CASE("exhausted budget fails fast until reset") {
  ManualClock clock;
  RateLimitBackoff backoff(clock.fn());
  long long reset = clock.epoch() + 60;
  backoff.observe(exhausted(reset));

  auto state = backoff.state();
  REQUIRE(state.active);
  CHECK(state.reset_at == RateLimitBackoff::TimePoint(seconds(reset)));
  CHECK(backoff.should_fail_fast());

  clock.advance(seconds(59));
  CHECK(backoff.should_fail_fast());

  clock.advance(seconds(1));
  CHECK_FALSE(backoff.should_fail_fast());
  CHECK_FALSE(backoff.state().active);
}

TEST_CASE("reset instant only moves forward while in backoff") {
  ManualClock clock;
  RateLimitBackoff backoff(clock.fn());
  long long reset = clock.epoch() + 120;
  backoff.observe(exhausted(reset));
  backoff.observe(exhausted(reset - 60));
  CHECK(backoff.state().reset_at ==
        RateLimitBackoff::TimePoint(seconds(reset)));

  backoff.observe(exhausted(reset + 60));
  CHECK(backoff.state().reset_at ==
        RateLimitBackoff::TimePoint(seconds(reset + 60)));
}

TEST_CASE("malformed rate limit headers are ignored") {
  ManualClock clock;
  RateLimitBackoff backoff(clock.fn());
  backoff.observe({"x-ratelimit-remaining: zero"});
  CHECK_FALSE(backoff.state().active);
  backoff.observe({"x-ratelimit-remaining: 0", "x-ratelimit-reset: soon"});
  CHECK_FALSE(backoff.state().active);
  backoff.observe({"x-ratelimit-remaining: 0"});
  CHECK_FALSE(backoff.state().active);
  backoff.observe({});
  CHECK_FALSE(backoff.state().active);
}

TEST_CASE("a reset already in the past clears on the next check") {
  ManualClock clock;
  RateLimitBackoff backoff(clock.fn());
  backoff.observe(exhausted(clock.epoch() - 5));
  CHECK(backoff.state().active);
  CHECK_FALSE(backoff.should_fail_fast());
  CHECK_FALSE(backoff.state().active);
}
