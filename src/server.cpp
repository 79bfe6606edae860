#include "wscore/server.hpp"

#include "wscore/log.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define WSCORE_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define WSCORE_THROW(ex)          \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

namespace wscore {

Server::Server(uint16_t port, const std::string& bind_addr) : port_(port), bind_addr_(bind_addr) {
  // Create socket
  server_sock_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_sock_ < 0) {
    WSCORE_THROW(std::runtime_error("Failed to create socket"));
  }

  int reuse = 1;
  setsockopt(server_sock_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  // Bind
  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  addr.sin_addr.s_addr = bind_addr_.empty() ? htonl(INADDR_ANY) : inet_addr(bind_addr_.c_str());

  if (bind(server_sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(server_sock_);
    WSCORE_THROW(std::runtime_error("Failed to bind port " + std::to_string(port_) + ": " +
                                    strerror(err)));
  }

  // Listen
  if (listen(server_sock_, 128) < 0) {
    ::close(server_sock_);
    WSCORE_THROW(std::runtime_error("Failed to listen"));
  }

  // Resolve an ephemeral port
  socklen_t addr_len = sizeof(addr);
  if (getsockname(server_sock_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) == 0) {
    port_ = ntohs(addr.sin_port);
  }

  fcntl(server_sock_, F_SETFL, O_NONBLOCK);

  WSCORE_LOG_INFO("Server initialized on " + (bind_addr_.empty() ? "0.0.0.0" : bind_addr_) +
                  ":" + std::to_string(port_));
}

Server::~Server() {
  is_running_ = false;
  close_all_connections();
  if (server_sock_ >= 0) {
    ::close(server_sock_);
  }
}

#ifdef WSCORE_WITH_TLS
Server& Server::set_tls(const TlsConfig& config) {
  auto ctx = std::make_shared<TlsContext>();
  auto r = ctx->init(config);
  if (!r) {
    WSCORE_THROW(std::runtime_error("Failed to initialize TLS from " + config.cert_path));
  }
  tls_ = std::move(ctx);
  return *this;
}
#endif

void Server::run() {
  auto valid = engine_config_.validate();
  if (!valid) {
    WSCORE_THROW(std::runtime_error("Invalid engine configuration"));
  }

  is_running_ = true;
  WSCORE_LOG_INFO("Server starting...");

  while (is_running_) {
    pollfd pfd{server_sock_, POLLIN, 0};
    int ret = ::poll(&pfd, 1, poll_timeout_ms_);
    if (ret < 0) {
      if (errno == EINTR) continue;
      WSCORE_LOG_ERROR(std::string("Poll error: ") + strerror(errno));
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      break;
    }

    if (ret > 0 && (pfd.revents & POLLIN)) {
      accept_connection();
    }
    reap_workers(false);
  }

  is_running_ = false;
  close_all_connections();
  WSCORE_LOG_INFO("Server stopped");
}

void Server::accept_connection() {
  struct sockaddr_in client_addr;
  socklen_t client_addr_len = sizeof(client_addr);
  int client_sock =
      accept(server_sock_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_addr_len);

  if (client_sock < 0) {
    int err = errno;
    if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
      WSCORE_LOG_ERROR(std::string("Accept error: ") + strerror(err));
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
    }
    return;
  }

  char ip[INET_ADDRSTRLEN] = {0};
  inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
  const std::string source(ip);
  std::string peer = source + ":" + std::to_string(ntohs(client_addr.sin_port));

  // Overload protection
  if (stats_.active_connections.load(std::memory_order_relaxed) >= max_connections_) {
    WSCORE_LOG_WARN("Max connections reached, rejecting " + peer);
    stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
    reject(client_sock, build_error_response(503, "Service Unavailable"));
    if (on_error) on_error(peer, ErrorCode::kMaxConnectionsExceeded);
    return;
  }

  SourceLease lease;
  if (rate_limiter_) {
    RateDecision decision = rate_limiter_->try_acquire_connection(source, lease);
    if (!decision) {
      stats_.rate_limited.fetch_add(1, std::memory_order_relaxed);
      stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
      WSCORE_LOG_DEBUG("Rate limited " + peer + " (" + error_name(decision.reason) + ")");

      const int64_t retry_s =
          std::max<int64_t>(1, (decision.retry_after.count() + 999) / 1000);
      reject(client_sock,
             build_error_response(429, "Too Many Requests",
                                  "Retry-After: " + std::to_string(retry_s) + "\r\n"));
      if (on_rejected) on_rejected(peer, decision);
      return;
    }
  }

  stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
  stats_.active_connections.fetch_add(1, std::memory_order_relaxed);

  auto done = std::make_shared<std::atomic<bool>>(false);
  Worker worker;
  worker.done = done;
  worker.thread = std::thread([this, client_sock, peer, done](SourceLease held) mutable {
    ScopeGuard finished([this, flag = done.get()]() {
      stats_.active_connections.fetch_sub(1, std::memory_order_relaxed);
      flag->store(true);
    });
    serve(client_sock, std::move(peer), std::move(held));
  }, std::move(lease));

  std::lock_guard<std::mutex> lock(workers_mutex_);
  workers_.push_back(std::move(worker));
}

void Server::reject(int fd, const std::string& response) {
  TcpTransport transport(fd);
  auto w = transport.write(reinterpret_cast<const uint8_t*>(response.data()), response.size());
  if (!w) WSCORE_LOG_DEBUG("Rejection response not delivered");
  transport.shutdown();
}

std::unique_ptr<Transport> Server::make_transport(int fd, const std::string& peer) {
  auto tcp = std::make_unique<TcpTransport>(fd, peer);
  tcp->apply_tuning(tcp_tuning_);

#ifdef WSCORE_WITH_TLS
  if (tls_) {
    auto bounded = tcp->set_read_timeout(engine_config_.handshake_timeout);
    if (!bounded) return nullptr;
    auto tls = std::make_unique<TlsTransport>(tls_, std::move(tcp));
    auto hs = tls->handshake();
    if (!hs) {
      WSCORE_LOG_WARN("TLS handshake failed for " + peer);
      return nullptr;
    }
    return tls;
  }
#endif

  return tcp;
}

void Server::serve(int fd, std::string peer, SourceLease lease) {
  auto transport = make_transport(fd, peer);
  if (!transport) {
    stats_.handshake_errors.fetch_add(1, std::memory_order_relaxed);
    if (on_error) on_error(peer, ErrorCode::kHandshakeFailed);
    return;
  }

  // perform() bounds the whole request head by handshake_timeout.
  ServerHandshake handshake(validator_);
  auto result = handshake.perform(*transport, engine_config_);
  if (!result) {
    stats_.handshake_errors.fetch_add(1, std::memory_order_relaxed);
    WSCORE_LOG_DEBUG("Handshake with " + peer + " failed: " + error_name(result.get_error()));
    if (on_error) on_error(peer, result.get_error());
    transport->close();
    return;
  }

  auto unbounded = transport->set_read_timeout(std::chrono::milliseconds(0));
  if (!unbounded) {
    stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  EngineConfig config = engine_config_;
  config.role = Role::kServer;
  config.compression = result.value().compression;

  auto conn = std::make_shared<Connection>(std::move(transport), config);
  conn->on_message = [this](const ConnPtr& c, const Message& msg) {
    stats_.total_messages_in.fetch_add(1, std::memory_order_relaxed);
    stats_.total_bytes_in.fetch_add(msg.size(), std::memory_order_relaxed);
    if (on_message) on_message(c, msg);
  };
  conn->on_close = [this](const ConnPtr& c, const CloseInfo& info) {
    if (info.error == ErrorCode::kTransportError) {
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (info.error != ErrorCode::kOk && info.error != ErrorCode::kConnectionClosed) {
      stats_.protocol_errors.fetch_add(1, std::memory_order_relaxed);
    }
    if (on_close) on_close(c, info);
  };
  conn->on_backpressure = on_backpressure;
  conn->on_drain = on_drain;

  {
    std::lock_guard<std::mutex> lock(conns_mutex_);
    connections_[conn->get_id()] = conn;
  }

  auto started = conn->start(std::move(result.value().leftover));
  if (!started) {
    WSCORE_LOG_ERROR("Connection " + std::to_string(conn->get_id()) + " failed to start");
    conn->abort();
  } else if (on_connect) {
    on_connect(conn);
  }

  // The lease (and the worker) live as long as the connection.
  while (!conn->wait_closed(std::chrono::milliseconds(500))) {
    // Handshake finished after stop() swept the connection table.
    if (!is_running_) conn->shutdown(close_code::kGoingAway, engine_config_.close_handshake_timeout);
  }
  conn->join();

  std::lock_guard<std::mutex> lock(conns_mutex_);
  connections_.erase(conn->get_id());
}

void Server::close_all_connections() {
  std::vector<ConnPtr> snapshot;
  {
    std::lock_guard<std::mutex> lock(conns_mutex_);
    for (auto& entry : connections_) snapshot.push_back(entry.second);
  }

  for (auto& conn : snapshot) {
    auto r = conn->close(close_code::kGoingAway, "server shutdown");
    if (!r) conn->abort();
  }

  // One deadline for all closing handshakes, then force.
  const auto deadline =
      std::chrono::steady_clock::now() + engine_config_.close_handshake_timeout;
  for (auto& conn : snapshot) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);
    if (!conn->wait_closed(remaining)) conn->abort();
  }

  reap_workers(true);
}

void Server::reap_workers(bool wait_all) {
  std::list<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (wait_all || it->done->load()) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& worker : finished) {
    if (worker.thread.joinable()) worker.thread.join();
  }
}

size_t Server::get_connection_count() const {
  std::lock_guard<std::mutex> lock(conns_mutex_);
  return connections_.size();
}

}  // namespace wscore
