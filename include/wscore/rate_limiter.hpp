#ifndef WSCORE_RATE_LIMITER_HPP_
#define WSCORE_RATE_LIMITER_HPP_

#include "wscore/vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace wscore {

struct RateLimitConfig {
  double capacity = 100.0;                     // bucket size (max burst)
  double refill_rate = 0.0;                    // tokens per second; 0: capacity / window
  std::chrono::milliseconds window{60000};
  std::chrono::milliseconds idle_eviction{0};  // 0: 2 x window
  std::chrono::milliseconds sweep_interval{60000};
  size_t max_connections_per_source = 0;       // 0: unlimited
  size_t shards = 16;

  double effective_refill_rate() const;
  std::chrono::milliseconds effective_idle_eviction() const;
  expected<void, ErrorCode> validate() const;
};

struct RateDecision {
  bool allowed = false;
  std::chrono::milliseconds retry_after{0};  // set when denied by the bucket
  ErrorCode reason = ErrorCode::kOk;         // kRateLimited or kMaxConnectionsExceeded

  explicit operator bool() const { return allowed; }
};

struct RateLimitStats {
  size_t tracked_sources = 0;
  uint64_t allowed = 0;
  uint64_t denied = 0;
  uint64_t evicted = 0;
};

class RateLimiter;

/**
 * @brief Holds one live-connection slot for a source; releases it on
 *        destruction. Move-only.
 */
class SourceLease {
 public:
  SourceLease() = default;
  ~SourceLease() { release(); }

  SourceLease(SourceLease&& other) noexcept
      : limiter_(other.limiter_), source_(std::move(other.source_)) {
    other.limiter_ = nullptr;
  }

  SourceLease& operator=(SourceLease&& other) noexcept {
    if (this != &other) {
      release();
      limiter_ = other.limiter_;
      source_ = std::move(other.source_);
      other.limiter_ = nullptr;
    }
    return *this;
  }

  SourceLease(const SourceLease&) = delete;
  SourceLease& operator=(const SourceLease&) = delete;

  bool valid() const { return limiter_ != nullptr; }
  const std::string& source() const { return source_; }
  void release();

 private:
  friend class RateLimiter;
  SourceLease(RateLimiter* limiter, std::string source)
      : limiter_(limiter), source_(std::move(source)) {}

  RateLimiter* limiter_ = nullptr;
  std::string source_;
};

class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  explicit RateLimiter(const RateLimitConfig& config = RateLimitConfig());

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  RateDecision try_acquire(const std::string& source) {
    return try_acquire(source, Clock::now());
  }
  RateDecision try_acquire(const std::string& source, TimePoint now);

  /**
   * @brief Token check plus per-source connection cap in one step.
   *
   * On success lease owns one connection slot. On denial neither a token
   * nor a slot is taken.
   */
  RateDecision try_acquire_connection(const std::string& source, SourceLease& lease,
                                      TimePoint now);
  RateDecision try_acquire_connection(const std::string& source, SourceLease& lease) {
    return try_acquire_connection(source, lease, Clock::now());
  }

  size_t connections(const std::string& source) const;

  /// Drop buckets idle longer than the eviction window with no live
  /// connections. Returns the number removed.
  size_t sweep(TimePoint now);

  size_t tracked_sources() const;
  RateLimitStats stats() const;
  const RateLimitConfig& config() const { return config_; }

 private:
  friend class SourceLease;

  struct Bucket {
    double tokens;
    TimePoint last_refill;
    TimePoint last_seen;
    size_t connections;
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, Bucket> buckets;
    TimePoint last_sweep;
    uint64_t allowed = 0;
    uint64_t denied = 0;
    uint64_t evicted = 0;
  };

  Shard& shard_for(const std::string& source) const;
  RateDecision acquire_locked(Shard& shard, const std::string& source, TimePoint now,
                              bool take_connection);
  size_t sweep_locked(Shard& shard, TimePoint now);
  void release_connection(const std::string& source);

  RateLimitConfig config_;
  double refill_rate_;
  std::chrono::milliseconds idle_eviction_;
  std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace wscore

#endif  // WSCORE_RATE_LIMITER_HPP_
