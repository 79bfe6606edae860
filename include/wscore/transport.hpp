#ifndef WSCORE_TRANSPORT_HPP_
#define WSCORE_TRANSPORT_HPP_

#include "wscore/vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <chrono>
#include <mutex>
#include <sockpp/tcp_socket.h>
#include <string>

namespace wscore {

/**
 * @brief Reliable, ordered byte stream.
 *
 * read() and write() may be called concurrently from one reader and one
 * writer thread. shutdown() must unblock a pending read().
 */
class Transport {
 public:
  virtual ~Transport() = default;

  /// Bytes read, 0 at end of stream. kTimeout when a read timeout is set and
  /// expires, kTransportError otherwise.
  virtual expected<size_t, ErrorCode> read(uint8_t* buf, size_t max_len) = 0;

  /// Write all of data or fail with kTransportError.
  virtual expected<void, ErrorCode> write(const uint8_t* data, size_t len) = 0;

  /// Stop both directions; pending reads return end of stream.
  virtual void shutdown() = 0;

  /// Release the underlying resource.
  virtual void close() = 0;

  /// 0 clears the timeout.
  virtual expected<void, ErrorCode> set_read_timeout(std::chrono::milliseconds timeout) {
    (void)timeout;
    return expected<void, ErrorCode>::success();
  }

  virtual std::string peer_address() const { return std::string(); }
};

// ============================================================================
// TcpTransport - blocking sockpp socket
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = false;
  bool tcp_quickack = false;
  bool so_keepalive = false;
  int keepalive_idle_s = 60;
  int keepalive_interval_s = 10;
  int keepalive_count = 5;
};

class TcpTransport : public Transport {
 public:
  explicit TcpTransport(sockpp::tcp_socket&& sock, std::string peer = std::string());
  explicit TcpTransport(int fd, std::string peer = std::string());
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  expected<size_t, ErrorCode> read(uint8_t* buf, size_t max_len) override;
  expected<void, ErrorCode> write(const uint8_t* data, size_t len) override;
  void shutdown() override;
  void close() override;
  expected<void, ErrorCode> set_read_timeout(std::chrono::milliseconds timeout) override;
  std::string peer_address() const override { return peer_; }

  void apply_tuning(const TcpTuning& tuning);
  int get_fd() const { return socket_.handle(); }

 private:
  sockpp::tcp_socket socket_;
  std::string peer_;
  std::mutex close_mutex_;
  bool shut_down_ = false;
};

}  // namespace wscore

#endif  // WSCORE_TRANSPORT_HPP_
