#include "wscore/rate_limiter.hpp"

#include <catch2/catch.hpp>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace wscore;
using namespace std::chrono_literals;

namespace {

RateLimitConfig five_per_minute() {
  RateLimitConfig cfg;
  cfg.capacity = 5;
  cfg.window = 60000ms;
  return cfg;
}

}  // namespace

TEST_CASE("RateLimiter - burst up to capacity, then deny", "[rate]") {
  RateLimiter limiter(five_per_minute());
  const auto t0 = RateLimiter::Clock::now();

  for (int i = 0; i < 5; ++i) {
    auto d = limiter.try_acquire("10.0.0.1", t0);
    REQUIRE(d.allowed);
  }
  auto denied = limiter.try_acquire("10.0.0.1", t0);
  REQUIRE_FALSE(denied.allowed);
  REQUIRE(denied.reason == ErrorCode::kRateLimited);
  // One token per 12 seconds.
  REQUIRE(denied.retry_after >= 11999ms);
  REQUIRE(denied.retry_after <= 12001ms);
}

TEST_CASE("RateLimiter - tokens refill over time", "[rate]") {
  RateLimiter limiter(five_per_minute());
  const auto t0 = RateLimiter::Clock::now();
  for (int i = 0; i < 5; ++i) REQUIRE(limiter.try_acquire("a", t0).allowed);

  auto half = limiter.try_acquire("a", t0 + 6000ms);
  REQUIRE_FALSE(half.allowed);
  REQUIRE(half.retry_after >= 5999ms);
  REQUIRE(half.retry_after <= 6001ms);

  REQUIRE(limiter.try_acquire("a", t0 + 12001ms).allowed);
  REQUIRE_FALSE(limiter.try_acquire("a", t0 + 12001ms).allowed);

  // Refill never exceeds capacity.
  const auto later = t0 + 3600s;
  for (int i = 0; i < 5; ++i) REQUIRE(limiter.try_acquire("a", later).allowed);
  REQUIRE_FALSE(limiter.try_acquire("a", later).allowed);
}

TEST_CASE("RateLimiter - sources are independent", "[rate]") {
  RateLimiter limiter(five_per_minute());
  const auto t0 = RateLimiter::Clock::now();
  for (int i = 0; i < 5; ++i) REQUIRE(limiter.try_acquire("a", t0).allowed);
  REQUIRE_FALSE(limiter.try_acquire("a", t0).allowed);
  REQUIRE(limiter.try_acquire("b", t0).allowed);
  REQUIRE(limiter.tracked_sources() == 2);
}

TEST_CASE("RateLimiter - explicit refill rate", "[rate]") {
  RateLimitConfig cfg;
  cfg.capacity = 1;
  cfg.refill_rate = 10.0;
  REQUIRE(cfg.effective_refill_rate() == 10.0);
  RateLimiter limiter(cfg);
  const auto t0 = RateLimiter::Clock::now();
  REQUIRE(limiter.try_acquire("x", t0).allowed);
  auto d = limiter.try_acquire("x", t0);
  REQUIRE_FALSE(d.allowed);
  REQUIRE(d.retry_after >= 99ms);
  REQUIRE(d.retry_after <= 101ms);
  REQUIRE(limiter.try_acquire("x", t0 + 101ms).allowed);
}

TEST_CASE("RateLimiter - per-source connection cap", "[rate]") {
  auto cfg = five_per_minute();
  cfg.max_connections_per_source = 2;
  RateLimiter limiter(cfg);
  const auto t0 = RateLimiter::Clock::now();

  SourceLease a;
  SourceLease b;
  REQUIRE(limiter.try_acquire_connection("h", a, t0).allowed);
  REQUIRE(limiter.try_acquire_connection("h", b, t0).allowed);
  REQUIRE(a.valid());
  REQUIRE(limiter.connections("h") == 2);

  SourceLease c;
  auto d = limiter.try_acquire_connection("h", c, t0);
  REQUIRE_FALSE(d.allowed);
  REQUIRE(d.reason == ErrorCode::kMaxConnectionsExceeded);
  REQUIRE_FALSE(c.valid());

  a.release();
  REQUIRE(limiter.connections("h") == 1);
  REQUIRE(limiter.try_acquire_connection("h", c, t0).allowed);

  // A denial by the cap did not spend a token: 3 used, 2 left.
  REQUIRE(limiter.stats().allowed == 3);
}

TEST_CASE("RateLimiter - lease releases on destruction and move", "[rate]") {
  RateLimiter limiter(five_per_minute());
  {
    SourceLease lease;
    REQUIRE(limiter.try_acquire_connection("m", lease).allowed);
    SourceLease moved(std::move(lease));
    REQUIRE_FALSE(lease.valid());
    REQUIRE(moved.valid());
    REQUIRE(moved.source() == "m");
    REQUIRE(limiter.connections("m") == 1);
  }
  REQUIRE(limiter.connections("m") == 0);
}

TEST_CASE("RateLimiter - idle buckets are swept", "[rate]") {
  auto cfg = five_per_minute();
  cfg.idle_eviction = 1000ms;
  RateLimiter limiter(cfg);
  const auto t0 = RateLimiter::Clock::now();

  SourceLease held;
  REQUIRE(limiter.try_acquire_connection("busy", held, t0).allowed);
  REQUIRE(limiter.try_acquire("idle", t0).allowed);
  REQUIRE(limiter.tracked_sources() == 2);

  REQUIRE(limiter.sweep(t0 + 500ms) == 0);
  // Buckets with live connections stay.
  REQUIRE(limiter.sweep(t0 + 2000ms) == 1);
  REQUIRE(limiter.tracked_sources() == 1);
  REQUIRE(limiter.stats().evicted == 1);
}

TEST_CASE("RateLimiter - config validation", "[rate]") {
  REQUIRE(five_per_minute().validate().has_value());

  RateLimitConfig bad = five_per_minute();
  bad.capacity = 0;
  REQUIRE(bad.validate().get_error() == ErrorCode::kInvalidConfig);

  bad = five_per_minute();
  bad.window = 0ms;
  REQUIRE_FALSE(bad.validate().has_value());

  bad = five_per_minute();
  bad.shards = 0;
  REQUIRE_FALSE(bad.validate().has_value());
}

TEST_CASE("RateLimiter - concurrent sources", "[rate]") {
  RateLimitConfig cfg;
  cfg.capacity = 50;
  cfg.window = 60000ms;
  RateLimiter limiter(cfg);
  const auto t0 = RateLimiter::Clock::now();

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&limiter, t0] {
      for (int i = 0; i < 100; ++i) {
        limiter.try_acquire("shared", t0);
      }
    });
  }
  for (auto& th : threads) th.join();

  auto s = limiter.stats();
  REQUIRE(s.allowed == 50);
  REQUIRE(s.denied == 350);
}
