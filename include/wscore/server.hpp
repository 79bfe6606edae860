#ifndef WSCORE_SERVER_HPP_
#define WSCORE_SERVER_HPP_

#include "wscore/config.hpp"
#include "wscore/connection.hpp"
#include "wscore/handshake.hpp"
#include "wscore/rate_limiter.hpp"
#include "wscore/tls.hpp"
#include "wscore/transport.hpp"
#include "wscore/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace wscore {

// ============================================================================
// ServerStats - Atomic counters
// ============================================================================

struct ServerStats {
  // Throughput counters
  std::atomic<uint64_t> total_messages_in{0};
  std::atomic<uint64_t> total_bytes_in{0};

  // Connection counters
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> rejected_connections{0};
  std::atomic<uint64_t> rate_limited{0};

  // Error counters
  std::atomic<uint64_t> handshake_errors{0};
  std::atomic<uint64_t> socket_errors{0};
  std::atomic<uint64_t> protocol_errors{0};

  void reset() {
    total_messages_in = 0;
    total_bytes_in = 0;
    total_connections = 0;
    active_connections = 0;
    rejected_connections = 0;
    rate_limited = 0;
    handshake_errors = 0;
    socket_errors = 0;
    protocol_errors = 0;
  }
};

// ============================================================================
// Server (acceptor + one worker per connection)
// ============================================================================

/**
 * @brief Blocking WebSocket server.
 *
 * run() polls the listening socket; each accepted socket gets a worker that
 * performs the opening handshake and then owns the Connection until it
 * closes. New sockets pass the rate limiter (if one is set) before any bytes
 * are read.
 */
class Server {
 public:
  using ConnPtr = Connection::ConnPtr;

  /// Port 0 binds an ephemeral port; see port().
  explicit Server(uint16_t port, const std::string& bind_addr = "");
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Accept loop (blocking). Returns after stop(), once every connection
  // has closed.
  void run();

  // Stop the server (any thread)
  void stop() { is_running_ = false; }

  bool is_running() const { return is_running_.load(); }
  uint16_t port() const { return port_; }

  // Configuration
  Server& set_engine_config(const EngineConfig& config) {
    engine_config_ = config;
    return *this;
  }

  Server& set_rate_limiter(std::shared_ptr<RateLimiter> limiter) {
    rate_limiter_ = std::move(limiter);
    return *this;
  }

  Server& set_max_connections(size_t max) {
    max_connections_ = max;
    return *this;
  }

  Server& set_poll_timeout_ms(int timeout) {
    poll_timeout_ms_ = timeout;
    return *this;
  }

  Server& set_tcp_tuning(const TcpTuning& tuning) {
    tcp_tuning_ = tuning;
    return *this;
  }

  Server& set_upgrade_validator(ServerHandshake::Validator validator) {
    validator_ = std::move(validator);
    return *this;
  }

#ifdef WSCORE_WITH_TLS
  /// Throws when the certificate or key cannot be loaded.
  Server& set_tls(const TlsConfig& config);
#endif

  // Callbacks
  std::function<void(const ConnPtr&)> on_connect;
  std::function<void(const ConnPtr&, const Message&)> on_message;
  std::function<void(const ConnPtr&, const CloseInfo&)> on_close;
  std::function<void(const std::string& peer, ErrorCode)> on_error;
  std::function<void(const std::string& peer, const RateDecision&)> on_rejected;
  std::function<void(const ConnPtr&)> on_backpressure;
  std::function<void(const ConnPtr&)> on_drain;

  // Status
  size_t get_connection_count() const;
  const EngineConfig& engine_config() const { return engine_config_; }

  // Monitoring
  const ServerStats& stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void accept_connection();
  void reject(int fd, const std::string& response);
  void serve(int fd, std::string peer, SourceLease lease);
  std::unique_ptr<Transport> make_transport(int fd, const std::string& peer);
  void close_all_connections();
  void reap_workers(bool wait_all);

  uint16_t port_;
  std::string bind_addr_;
  int server_sock_ = -1;
  std::atomic<bool> is_running_{false};

  EngineConfig engine_config_;
  std::shared_ptr<RateLimiter> rate_limiter_;
  ServerHandshake::Validator validator_;
  size_t max_connections_ = 1024;
  int poll_timeout_ms_ = 100;
  TcpTuning tcp_tuning_;
#ifdef WSCORE_WITH_TLS
  std::shared_ptr<TlsContext> tls_;
#endif

  mutable std::mutex conns_mutex_;
  std::unordered_map<uint64_t, ConnPtr> connections_;

  std::mutex workers_mutex_;
  std::list<Worker> workers_;

  ServerStats stats_;
};

}  // namespace wscore

#endif  // WSCORE_SERVER_HPP_
