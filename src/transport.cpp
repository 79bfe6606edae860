#include "wscore/transport.hpp"

#include "wscore/log.hpp"

#include <cerrno>
#include <cstring>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace wscore {

TcpTransport::TcpTransport(sockpp::tcp_socket&& sock, std::string peer)
    : socket_(std::move(sock)), peer_(std::move(peer)) {}

TcpTransport::TcpTransport(int fd, std::string peer) : socket_(fd), peer_(std::move(peer)) {}

TcpTransport::~TcpTransport() { close(); }

expected<size_t, ErrorCode> TcpTransport::read(uint8_t* buf, size_t max_len) {
  for (;;) {
    ssize_t n = ::recv(socket_.handle(), buf, max_len, 0);
    if (n >= 0) return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kTimeout);
    }
    WSCORE_LOG_DEBUG(std::string("recv failed: ") + std::strerror(errno));
    return expected<size_t, ErrorCode>::error(ErrorCode::kTransportError);
  }
}

expected<void, ErrorCode> TcpTransport::write(const uint8_t* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::send(socket_.handle(), data + sent, len - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      WSCORE_LOG_DEBUG(std::string("send failed: ") + std::strerror(errno));
      return expected<void, ErrorCode>::error(ErrorCode::kTransportError);
    }
    sent += static_cast<size_t>(n);
  }
  return expected<void, ErrorCode>::success();
}

void TcpTransport::shutdown() {
  std::lock_guard<std::mutex> lock(close_mutex_);
  if (shut_down_ || !socket_.is_open()) return;
  shut_down_ = true;
  ::shutdown(socket_.handle(), SHUT_RDWR);
}

void TcpTransport::close() {
  std::lock_guard<std::mutex> lock(close_mutex_);
  if (socket_.is_open()) {
    socket_.close();
  }
}

expected<void, ErrorCode> TcpTransport::set_read_timeout(std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (setsockopt(socket_.handle(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
    return expected<void, ErrorCode>::error(ErrorCode::kTransportError);
  }
  return expected<void, ErrorCode>::success();
}

void TcpTransport::apply_tuning(const TcpTuning& tuning) {
  const int fd = socket_.handle();
  int opt = 1;

  if (tuning.tcp_nodelay) {
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
  }

#ifdef TCP_QUICKACK
  if (tuning.tcp_quickack) {
    setsockopt(fd, IPPROTO_TCP, TCP_QUICKACK, &opt, sizeof(opt));
  }
#endif

  if (tuning.so_keepalive) {
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));

#ifdef TCP_KEEPIDLE
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &tuning.keepalive_idle_s,
               sizeof(tuning.keepalive_idle_s));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &tuning.keepalive_interval_s,
               sizeof(tuning.keepalive_interval_s));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &tuning.keepalive_count,
               sizeof(tuning.keepalive_count));
#endif
  }
}

}  // namespace wscore
