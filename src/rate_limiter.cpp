#include "wscore/rate_limiter.hpp"

#include "wscore/log.hpp"

#include <cmath>

#include <algorithm>
#include <functional>

namespace wscore {

// ============================================================================
// RateLimitConfig
// ============================================================================

double RateLimitConfig::effective_refill_rate() const {
  if (refill_rate > 0.0) return refill_rate;
  const double seconds = std::chrono::duration<double>(window).count();
  return seconds > 0.0 ? capacity / seconds : 0.0;
}

std::chrono::milliseconds RateLimitConfig::effective_idle_eviction() const {
  return idle_eviction.count() > 0 ? idle_eviction : window * 2;
}

expected<void, ErrorCode> RateLimitConfig::validate() const {
  if (capacity < 1.0 || window.count() <= 0 || shards == 0 || refill_rate < 0.0) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidConfig);
  }
  return expected<void, ErrorCode>::success();
}

// ============================================================================
// SourceLease
// ============================================================================

void SourceLease::release() {
  if (limiter_ != nullptr) {
    limiter_->release_connection(source_);
    limiter_ = nullptr;
  }
}

// ============================================================================
// RateLimiter
// ============================================================================

RateLimiter::RateLimiter(const RateLimitConfig& config)
    : config_(config),
      refill_rate_(config.effective_refill_rate()),
      idle_eviction_(config.effective_idle_eviction()) {
  const size_t n = std::max<size_t>(config_.shards, 1);
  shards_.reserve(n);
  const TimePoint now = Clock::now();
  for (size_t i = 0; i < n; ++i) {
    shards_.push_back(std::make_unique<Shard>());
    shards_.back()->last_sweep = now;
  }
}

RateLimiter::Shard& RateLimiter::shard_for(const std::string& source) const {
  return *shards_[std::hash<std::string>{}(source) % shards_.size()];
}

size_t RateLimiter::sweep_locked(Shard& shard, TimePoint now) {
  size_t removed = 0;
  for (auto it = shard.buckets.begin(); it != shard.buckets.end();) {
    if (it->second.connections == 0 && (now - it->second.last_seen) > idle_eviction_) {
      it = shard.buckets.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  shard.last_sweep = now;
  shard.evicted += removed;
  return removed;
}

RateDecision RateLimiter::acquire_locked(Shard& shard, const std::string& source,
                                         TimePoint now, bool take_connection) {
  if (now - shard.last_sweep > config_.sweep_interval) {
    sweep_locked(shard, now);
  }

  RateDecision decision;
  auto it = shard.buckets.find(source);
  if (it == shard.buckets.end()) {
    it = shard.buckets.emplace(source, Bucket{config_.capacity, now, now, 0}).first;
  }
  Bucket& b = it->second;

  if (now > b.last_refill) {
    const double elapsed = std::chrono::duration<double>(now - b.last_refill).count();
    b.tokens = std::min(config_.capacity, b.tokens + elapsed * refill_rate_);
    b.last_refill = now;
  }
  b.last_seen = std::max(b.last_seen, now);

  if (take_connection && config_.max_connections_per_source != 0 &&
      b.connections >= config_.max_connections_per_source) {
    ++shard.denied;
    decision.reason = ErrorCode::kMaxConnectionsExceeded;
    return decision;
  }

  if (b.tokens >= 1.0) {
    b.tokens -= 1.0;
    if (take_connection) ++b.connections;
    ++shard.allowed;
    decision.allowed = true;
    return decision;
  }

  ++shard.denied;
  decision.reason = ErrorCode::kRateLimited;
  if (refill_rate_ > 0.0) {
    const double wait_s = (1.0 - b.tokens) / refill_rate_;
    decision.retry_after =
        std::chrono::milliseconds(static_cast<int64_t>(std::ceil(wait_s * 1000.0)));
  }
  return decision;
}

RateDecision RateLimiter::try_acquire(const std::string& source, TimePoint now) {
  Shard& shard = shard_for(source);
  std::lock_guard<std::mutex> lock(shard.mutex);
  return acquire_locked(shard, source, now, false);
}

RateDecision RateLimiter::try_acquire_connection(const std::string& source,
                                                 SourceLease& lease, TimePoint now) {
  RateDecision decision;
  {
    Shard& shard = shard_for(source);
    std::lock_guard<std::mutex> lock(shard.mutex);
    decision = acquire_locked(shard, source, now, true);
  }
  if (decision.allowed) {
    lease = SourceLease(this, source);
  } else {
    WSCORE_LOG_DEBUG("rate limiter: denied " + source + " (" +
                     error_name(decision.reason) + ")");
  }
  return decision;
}

void RateLimiter::release_connection(const std::string& source) {
  Shard& shard = shard_for(source);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.buckets.find(source);
  if (it != shard.buckets.end() && it->second.connections > 0) {
    --it->second.connections;
    it->second.last_seen = std::max(it->second.last_seen, Clock::now());
  }
}

size_t RateLimiter::connections(const std::string& source) const {
  Shard& shard = shard_for(source);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.buckets.find(source);
  return it == shard.buckets.end() ? 0 : it->second.connections;
}

size_t RateLimiter::sweep(TimePoint now) {
  size_t removed = 0;
  for (auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    removed += sweep_locked(*shard, now);
  }
  return removed;
}

size_t RateLimiter::tracked_sources() const {
  size_t n = 0;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    n += shard->buckets.size();
  }
  return n;
}

RateLimitStats RateLimiter::stats() const {
  RateLimitStats s;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    s.tracked_sources += shard->buckets.size();
    s.allowed += shard->allowed;
    s.denied += shard->denied;
    s.evicted += shard->evicted;
  }
  return s;
}

}  // namespace wscore
