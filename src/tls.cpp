#include "wscore/tls.hpp"

#ifdef WSCORE_WITH_TLS

#include <poll.h>

#include <cstring>
#include <string>

#include "wscore/log.hpp"

namespace wscore {

namespace {

constexpr int kPollSliceMs = 100;

std::string mbedtls_error(int ret) { return "mbedtls error -0x" + std::to_string(-ret); }

}  // namespace

// ============================================================================
// TlsContext
// ============================================================================

TlsContext::TlsContext() {
  mbedtls_ssl_config_init(&conf_);
  mbedtls_x509_crt_init(&srvcert_);
  mbedtls_pk_init(&pkey_);
  mbedtls_entropy_init(&entropy_);
  mbedtls_ctr_drbg_init(&ctr_drbg_);
}

TlsContext::~TlsContext() {
  mbedtls_ssl_config_free(&conf_);
  mbedtls_x509_crt_free(&srvcert_);
  mbedtls_pk_free(&pkey_);
  mbedtls_entropy_free(&entropy_);
  mbedtls_ctr_drbg_free(&ctr_drbg_);
}

expected<void, ErrorCode> TlsContext::init(const TlsConfig& config) {
  const char* pers = "wscore_tls";
  auto fail = [](const char* what, int ret) {
    WSCORE_LOG_ERROR(std::string("TLS init: ") + what + ": " + mbedtls_error(ret));
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidConfig);
  };

  int ret = mbedtls_ctr_drbg_seed(&ctr_drbg_, mbedtls_entropy_func, &entropy_,
                                  reinterpret_cast<const unsigned char*>(pers),
                                  std::strlen(pers));
  if (ret != 0) return fail("seed", ret);

  ret = mbedtls_x509_crt_parse_file(&srvcert_, config.cert_path.c_str());
  if (ret != 0) return fail("certificate", ret);

  if (!config.ca_path.empty()) {
    ret = mbedtls_x509_crt_parse_file(&srvcert_, config.ca_path.c_str());
    if (ret != 0) return fail("ca", ret);
  }

  ret = mbedtls_pk_parse_keyfile(&pkey_, config.key_path.c_str(), nullptr,
                                 mbedtls_ctr_drbg_random, &ctr_drbg_);
  if (ret != 0) return fail("private key", ret);

  ret = mbedtls_ssl_config_defaults(&conf_, MBEDTLS_SSL_IS_SERVER,
                                    MBEDTLS_SSL_TRANSPORT_STREAM,
                                    MBEDTLS_SSL_PRESET_DEFAULT);
  if (ret != 0) return fail("config defaults", ret);

  mbedtls_ssl_conf_rng(&conf_, mbedtls_ctr_drbg_random, &ctr_drbg_);
  mbedtls_ssl_conf_ca_chain(&conf_, srvcert_.next, nullptr);
  ret = mbedtls_ssl_conf_own_cert(&conf_, &srvcert_, &pkey_);
  if (ret != 0) return fail("own cert", ret);

  mbedtls_ssl_conf_authmode(&conf_, config.require_client_cert
                                        ? MBEDTLS_SSL_VERIFY_REQUIRED
                                        : MBEDTLS_SSL_VERIFY_NONE);
  mbedtls_ssl_conf_min_tls_version(&conf_, MBEDTLS_SSL_VERSION_TLS1_2);

  initialized_ = true;
  return expected<void, ErrorCode>::success();
}

// ============================================================================
// TlsTransport
// ============================================================================

TlsTransport::TlsTransport(std::shared_ptr<const TlsContext> ctx,
                           std::unique_ptr<TcpTransport> tcp)
    : ctx_(std::move(ctx)), tcp_(std::move(tcp)) {
  mbedtls_ssl_init(&ssl_);
  mbedtls_net_init(&net_);
  net_.fd = tcp_->get_fd();
}

TlsTransport::~TlsTransport() {
  // The fd belongs to tcp_.
  net_.fd = -1;
  mbedtls_ssl_free(&ssl_);
  mbedtls_net_free(&net_);
}

bool TlsTransport::wait_fd(short events, int timeout_ms) const {
  pollfd pfd{net_.fd, events, 0};
  return ::poll(&pfd, 1, timeout_ms) > 0;
}

expected<void, ErrorCode> TlsTransport::handshake() {
  if (ctx_ == nullptr || !ctx_->is_initialized()) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidConfig);
  }
  int ret = mbedtls_ssl_setup(&ssl_, ctx_->config());
  if (ret != 0) {
    WSCORE_LOG_ERROR("TLS setup: " + mbedtls_error(ret));
    return expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  }
  mbedtls_ssl_set_bio(&ssl_, &net_, mbedtls_net_send, mbedtls_net_recv, nullptr);

  // Blocking handshake; the caller bounds it with a read timeout.
  while ((ret = mbedtls_ssl_handshake(&ssl_)) != 0) {
    if (ret != MBEDTLS_ERR_SSL_WANT_READ && ret != MBEDTLS_ERR_SSL_WANT_WRITE) {
      WSCORE_LOG_WARN("TLS handshake: " + mbedtls_error(ret));
      return expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
    }
  }

  if (mbedtls_net_set_nonblock(&net_) != 0) {
    return expected<void, ErrorCode>::error(ErrorCode::kTransportError);
  }
  return expected<void, ErrorCode>::success();
}

expected<size_t, ErrorCode> TlsTransport::read(uint8_t* buf, size_t max_len) {
  int waited_ms = 0;
  for (;;) {
    if (shut_down_.load()) return expected<size_t, ErrorCode>::success(0);

    int ret = 0;
    {
      std::lock_guard<std::mutex> lock(ssl_mutex_);
      ret = mbedtls_ssl_read(&ssl_, buf, max_len);
    }
    if (ret > 0) return expected<size_t, ErrorCode>::success(static_cast<size_t>(ret));
    if (ret == 0 || ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY) {
      return expected<size_t, ErrorCode>::success(0);
    }
    if (ret != MBEDTLS_ERR_SSL_WANT_READ && ret != MBEDTLS_ERR_SSL_WANT_WRITE) {
      WSCORE_LOG_DEBUG("TLS read: " + mbedtls_error(ret));
      return expected<size_t, ErrorCode>::error(ErrorCode::kTransportError);
    }

    const int limit = read_timeout_ms_.load();
    if (limit > 0 && waited_ms >= limit) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kTimeout);
    }
    wait_fd(POLLIN, kPollSliceMs);
    waited_ms += kPollSliceMs;
  }
}

expected<void, ErrorCode> TlsTransport::write(const uint8_t* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    if (shut_down_.load()) {
      return expected<void, ErrorCode>::error(ErrorCode::kTransportError);
    }
    int ret = 0;
    {
      std::lock_guard<std::mutex> lock(ssl_mutex_);
      ret = mbedtls_ssl_write(&ssl_, data + sent, len - sent);
    }
    if (ret > 0) {
      sent += static_cast<size_t>(ret);
      continue;
    }
    if (ret != MBEDTLS_ERR_SSL_WANT_READ && ret != MBEDTLS_ERR_SSL_WANT_WRITE) {
      WSCORE_LOG_DEBUG("TLS write: " + mbedtls_error(ret));
      return expected<void, ErrorCode>::error(ErrorCode::kTransportError);
    }
    wait_fd(POLLOUT, kPollSliceMs);
  }
  return expected<void, ErrorCode>::success();
}

void TlsTransport::shutdown() {
  if (shut_down_.exchange(true)) return;
  {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    mbedtls_ssl_close_notify(&ssl_);
  }
  tcp_->shutdown();
}

void TlsTransport::close() {
  shutdown();
  tcp_->close();
}

expected<void, ErrorCode> TlsTransport::set_read_timeout(std::chrono::milliseconds timeout) {
  read_timeout_ms_.store(static_cast<int>(timeout.count()));
  return tcp_->set_read_timeout(timeout);
}

}  // namespace wscore

#endif  // WSCORE_WITH_TLS
