#ifndef WSCORE_TLS_HPP_
#define WSCORE_TLS_HPP_

// ============================================================================
// TLS transport
// ============================================================================
//
// Optional TLS support via mbedTLS. Enable with CMake option WSCORE_WITH_TLS=ON.
//
// Usage:
//   wscore::TlsConfig tls;
//   tls.cert_path = "/path/to/cert.pem";
//   tls.key_path = "/path/to/key.pem";
//   server.set_tls(tls);
//

#include "wscore/transport.hpp"
#include "wscore/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#ifdef WSCORE_WITH_TLS

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/net_sockets.h>
#include <mbedtls/ssl.h>
#include <mbedtls/x509_crt.h>

#endif  // WSCORE_WITH_TLS

namespace wscore {

struct TlsConfig {
  std::string cert_path;  // Server certificate (PEM)
  std::string key_path;   // Server private key (PEM)
  std::string ca_path;    // CA certificate for client auth (optional)
  bool require_client_cert = false;
};

#ifdef WSCORE_WITH_TLS

// ============================================================================
// TlsContext (one per server: certificates, RNG, ssl config)
// ============================================================================

class TlsContext {
 public:
  TlsContext();
  ~TlsContext();

  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;

  /// kInvalidConfig when a certificate or key fails to load.
  expected<void, ErrorCode> init(const TlsConfig& config);

  bool is_initialized() const { return initialized_; }
  const mbedtls_ssl_config* config() const { return &conf_; }

 private:
  mbedtls_ssl_config conf_;
  mbedtls_x509_crt srvcert_;
  mbedtls_pk_context pkey_;
  mbedtls_entropy_context entropy_;
  mbedtls_ctr_drbg_context ctr_drbg_;
  bool initialized_ = false;
};

// ============================================================================
// TlsTransport (one per connection)
// ============================================================================

/**
 * @brief Transport over an mbedTLS session on an accepted TCP socket.
 *
 * The socket runs non-blocking so the reader can wait in poll() without
 * holding the ssl lock, leaving the writer free to send.
 */
class TlsTransport : public Transport {
 public:
  TlsTransport(std::shared_ptr<const TlsContext> ctx, std::unique_ptr<TcpTransport> tcp);
  ~TlsTransport() override;

  TlsTransport(const TlsTransport&) = delete;
  TlsTransport& operator=(const TlsTransport&) = delete;

  /// Run the TLS handshake. kHandshakeFailed on any mbedTLS error.
  expected<void, ErrorCode> handshake();

  expected<size_t, ErrorCode> read(uint8_t* buf, size_t max_len) override;
  expected<void, ErrorCode> write(const uint8_t* data, size_t len) override;
  void shutdown() override;
  void close() override;
  expected<void, ErrorCode> set_read_timeout(std::chrono::milliseconds timeout) override;
  std::string peer_address() const override { return tcp_->peer_address(); }

 private:
  bool wait_fd(short events, int timeout_ms) const;

  std::shared_ptr<const TlsContext> ctx_;
  std::unique_ptr<TcpTransport> tcp_;
  mbedtls_ssl_context ssl_;
  mbedtls_net_context net_;
  std::mutex ssl_mutex_;
  std::atomic<bool> shut_down_{false};
  std::atomic<int> read_timeout_ms_{0};
};

#endif  // WSCORE_WITH_TLS

}  // namespace wscore

#endif  // WSCORE_TLS_HPP_
