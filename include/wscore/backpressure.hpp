#ifndef WSCORE_BACKPRESSURE_HPP_
#define WSCORE_BACKPRESSURE_HPP_

#include "wscore/vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace wscore {

enum class BackpressurePolicy : uint8_t {
  kBuffer,      // refuse when full
  kDropOldest,  // evict the oldest non-critical entry
  kBlock,       // wait for room up to block_timeout
};

const char* policy_name(BackpressurePolicy policy);

struct BackpressureConfig {
  BackpressurePolicy policy = BackpressurePolicy::kBuffer;
  size_t capacity = 1024;                       // outbound entries
  std::chrono::milliseconds block_timeout{0};   // kBlock: 0 waits until closed
  size_t high_watermark = 0;                    // 0: 75% of capacity
  size_t low_watermark = 0;                     // 0: 25% of capacity
  size_t inbound_capacity = 256;                // delivered-but-unread messages
};

/// One encoded outbound message: all of its frames, ready for the wire.
struct OutboundItem {
  std::vector<uint8_t> wire;
  bool critical = false;  // control frames: never evicted
  bool is_close = false;  // the Close frame; nothing follows it
};

/**
 * @brief Per-connection outbound queue with a single consumer (the write
 *        loop).
 *
 * Critical entries are admitted past capacity into a small reserve so a
 * full queue of data never blocks Pong or Close.
 */
class BackpressureQueue {
 public:
  static constexpr size_t kCriticalReserve = 16;

  explicit BackpressureQueue(const BackpressureConfig& config);

  BackpressureQueue(const BackpressureQueue&) = delete;
  BackpressureQueue& operator=(const BackpressureQueue&) = delete;

  /// kBackpressureExceeded when the policy refuses the entry,
  /// kConnectionClosed after close().
  expected<void, ErrorCode> push(OutboundItem item);

  /// Wait up to timeout for an entry. false on timeout, or when closed and
  /// drained.
  bool pop(OutboundItem& out, std::chrono::milliseconds timeout);

  /// Refuse new entries; whatever is queued can still be popped.
  void close();

  /// Refuse new entries and drop everything queued.
  void abort();

  size_t size() const;
  bool empty() const { return size() == 0; }
  bool is_closed() const;
  uint64_t dropped() const;
  size_t high_watermark() const { return high_; }
  size_t low_watermark() const { return low_; }

  // Fired once when the queue climbs to the high watermark, and once when it
  // drains back to the low watermark. Called without the queue lock held.
  std::function<void()> on_backpressure;
  std::function<void()> on_drain;

 private:
  bool evict_oldest_locked();

  BackpressureConfig config_;
  size_t high_;
  size_t low_;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<OutboundItem> queue_;
  bool closed_ = false;
  bool above_high_ = false;
  uint64_t dropped_ = 0;
};

// ============================================================================
// BoundedChannel<T> - blocking FIFO between the read loop and the application
// ============================================================================

template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  /// Blocks while full. false once the channel is closed.
  bool push(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) return false;
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  /// Wait up to timeout. Items queued before close() are still returned.
  optional<T> pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) return optional<T>();
    optional<T> out(std::move(items_.front()));
    items_.pop_front();
    not_full_.notify_one();
    return out;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  /// Closed and nothing left to read.
  bool is_drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && items_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

 private:
  size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_ = false;
};

}  // namespace wscore

#endif  // WSCORE_BACKPRESSURE_HPP_
