#include "wscore/backpressure.hpp"

namespace wscore {

const char* policy_name(BackpressurePolicy policy) {
  switch (policy) {
    case BackpressurePolicy::kBuffer: return "buffer";
    case BackpressurePolicy::kDropOldest: return "drop-oldest";
    case BackpressurePolicy::kBlock: return "block";
  }
  return "unknown";
}

BackpressureQueue::BackpressureQueue(const BackpressureConfig& config)
    : config_(config),
      high_(config.high_watermark != 0 ? config.high_watermark
                                       : config.capacity * 3 / 4),
      low_(config.low_watermark != 0 ? config.low_watermark : config.capacity / 4) {}

bool BackpressureQueue::evict_oldest_locked() {
  for (auto it = queue_.begin(); it != queue_.end(); ++it) {
    if (!it->critical) {
      queue_.erase(it);
      ++dropped_;
      return true;
    }
  }
  return false;
}

expected<void, ErrorCode> BackpressureQueue::push(OutboundItem item) {
  bool fire_high = false;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
      return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }

    if (item.critical) {
      if (queue_.size() >= config_.capacity + kCriticalReserve) {
        return expected<void, ErrorCode>::error(ErrorCode::kBackpressureExceeded);
      }
    } else if (queue_.size() >= config_.capacity) {
      switch (config_.policy) {
        case BackpressurePolicy::kBuffer:
          return expected<void, ErrorCode>::error(ErrorCode::kBackpressureExceeded);

        case BackpressurePolicy::kDropOldest:
          if (!evict_oldest_locked()) {
            return expected<void, ErrorCode>::error(ErrorCode::kBackpressureExceeded);
          }
          break;

        case BackpressurePolicy::kBlock: {
          auto has_room = [this] { return closed_ || queue_.size() < config_.capacity; };
          if (config_.block_timeout.count() > 0) {
            if (!not_full_.wait_for(lock, config_.block_timeout, has_room)) {
              return expected<void, ErrorCode>::error(
                  ErrorCode::kBackpressureExceeded);
            }
          } else {
            not_full_.wait(lock, has_room);
          }
          if (closed_) {
            return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
          }
          break;
        }
      }
    }

    queue_.push_back(std::move(item));
    if (!above_high_ && high_ != 0 && queue_.size() >= high_) {
      above_high_ = true;
      fire_high = true;
    }
    not_empty_.notify_one();
  }

  if (fire_high && on_backpressure) on_backpressure();
  return expected<void, ErrorCode>::success();
}

bool BackpressureQueue::pop(OutboundItem& out, std::chrono::milliseconds timeout) {
  bool fire_low = false;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) return false;

    out = std::move(queue_.front());
    queue_.pop_front();
    if (above_high_ && queue_.size() <= low_) {
      above_high_ = false;
      fire_low = true;
    }
    not_full_.notify_one();
  }

  if (fire_low && on_drain) on_drain();
  return true;
}

void BackpressureQueue::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  not_empty_.notify_all();
  not_full_.notify_all();
}

void BackpressureQueue::abort() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  queue_.clear();
  not_empty_.notify_all();
  not_full_.notify_all();
}

size_t BackpressureQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool BackpressureQueue::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

uint64_t BackpressureQueue::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

}  // namespace wscore
