#ifndef WSCORE_TESTS_PIPE_TRANSPORT_HPP_
#define WSCORE_TESTS_PIPE_TRANSPORT_HPP_

#include "wscore/transport.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace wscore {
namespace testing {

// One direction of the pipe.
class PipeBuffer {
 public:
  bool write(const uint8_t* data, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    bytes_.insert(bytes_.end(), data, data + len);
    cv_.notify_all();
    return true;
  }

  // -1 on timeout, 0 at end of stream.
  long read(uint8_t* buf, size_t max_len, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return closed_ || !bytes_.empty(); };
    if (timeout.count() > 0) {
      if (!cv_.wait_for(lock, timeout, ready)) return -1;
    } else {
      cv_.wait(lock, ready);
    }
    const size_t n = std::min(max_len, bytes_.size());
    std::copy(bytes_.begin(), bytes_.begin() + static_cast<long>(n), buf);
    bytes_.erase(bytes_.begin(), bytes_.begin() + static_cast<long>(n));
    return static_cast<long>(n);
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<uint8_t> bytes_;
  bool closed_ = false;
};

class PipeTransport : public Transport {
 public:
  PipeTransport(std::shared_ptr<PipeBuffer> in, std::shared_ptr<PipeBuffer> out,
                std::string peer)
      : in_(std::move(in)), out_(std::move(out)), peer_(std::move(peer)) {}

  expected<size_t, ErrorCode> read(uint8_t* buf, size_t max_len) override {
    long n = in_->read(buf, max_len, timeout_);
    if (n < 0) return expected<size_t, ErrorCode>::error(ErrorCode::kTimeout);
    return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
  }

  expected<void, ErrorCode> write(const uint8_t* data, size_t len) override {
    if (!out_->write(data, len)) {
      return expected<void, ErrorCode>::error(ErrorCode::kTransportError);
    }
    return expected<void, ErrorCode>::success();
  }

  void shutdown() override {
    in_->close();
    out_->close();
  }

  void close() override { shutdown(); }

  expected<void, ErrorCode> set_read_timeout(std::chrono::milliseconds timeout) override {
    timeout_ = timeout;
    return expected<void, ErrorCode>::success();
  }

  std::string peer_address() const override { return peer_; }

  // Helpers for the test side of the pipe.
  bool send_raw(const std::string& s) {
    return write(reinterpret_cast<const uint8_t*>(s.data()), s.size()).has_value();
  }

  bool send_raw(const std::vector<uint8_t>& v) { return write(v.data(), v.size()).has_value(); }

  // Read until at least min_len bytes arrived, end of stream, or timeout.
  std::string receive_raw(size_t min_len,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    std::string out;
    uint8_t buf[4096];
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (out.size() < min_len) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) break;
      long n = in_->read(buf, sizeof(buf), left);
      if (n <= 0) break;
      out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(n));
    }
    return out;
  }

  // Read an HTTP head up to and including the blank line.
  std::string receive_head(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    std::string out;
    uint8_t byte = 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (out.find("\r\n\r\n") == std::string::npos) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) break;
      if (in_->read(&byte, 1, left) <= 0) break;
      out.push_back(static_cast<char>(byte));
    }
    return out;
  }

 private:
  std::shared_ptr<PipeBuffer> in_;
  std::shared_ptr<PipeBuffer> out_;
  std::string peer_;
  std::chrono::milliseconds timeout_{0};
};

/// Two connected ends: whatever one writes, the other reads.
inline std::pair<std::unique_ptr<PipeTransport>, std::unique_ptr<PipeTransport>> make_pipe() {
  auto a_to_b = std::make_shared<PipeBuffer>();
  auto b_to_a = std::make_shared<PipeBuffer>();
  return {std::make_unique<PipeTransport>(b_to_a, a_to_b, "pipe:b"),
          std::make_unique<PipeTransport>(a_to_b, b_to_a, "pipe:a")};
}

}  // namespace testing
}  // namespace wscore

#endif  // WSCORE_TESTS_PIPE_TRANSPORT_HPP_
