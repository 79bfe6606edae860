#ifndef WSCORE_HANDSHAKE_HPP_
#define WSCORE_HANDSHAKE_HPP_

#include "wscore/bytes.hpp"
#include "wscore/compression.hpp"
#include "wscore/config.hpp"
#include "wscore/transport.hpp"
#include "wscore/vocabulary.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wscore {

constexpr size_t kMaxHandshakeSize = 8192;

struct HttpHeaders {
  std::vector<std::pair<std::string, std::string>> fields;

  /// Case-insensitive lookup; repeated fields are joined with ", ".
  std::string get(std::string_view name) const;
  bool has_token(std::string_view name, std::string_view token) const;
};

struct UpgradeRequest {
  std::string method;
  std::string resource;
  HttpHeaders headers;

  std::string key() const { return headers.get("Sec-WebSocket-Key"); }
};

struct UpgradeResponse {
  int status = 0;
  HttpHeaders headers;
};

/// Accept value for a client key: base64(sha1(key + GUID)).
std::string generate_accept_key(std::string_view client_key);

/// Fresh random Sec-WebSocket-Key.
std::string generate_client_key();

/**
 * @brief Parse the request head at the front of data.
 * @return Bytes consumed, 0 when the head is incomplete, kHandshakeFailed
 *         when malformed or larger than kMaxHandshakeSize.
 */
expected<size_t, ErrorCode> parse_upgrade_request(std::string_view data, UpgradeRequest& out);

expected<size_t, ErrorCode> parse_upgrade_response(std::string_view data,
                                                   UpgradeResponse& out);

/// Check the WebSocket-specific parts of a parsed request.
expected<void, ErrorCode> validate_upgrade_request(const UpgradeRequest& req);

/**
 * @brief Answer a permessage-deflate offer.
 *
 * negotiated.enabled is false when the offer is absent, unacceptable or
 * compression is disabled locally. response_value is the
 * Sec-WebSocket-Extensions value to send back (empty when declined).
 */
void negotiate_deflate(std::string_view offer, const CompressionConfig& local,
                       CompressionConfig& negotiated, std::string& response_value);

/// Client side: the permessage-deflate offer for local.
std::string build_deflate_offer(const CompressionConfig& local);

/// Client side: apply the server's extension response to our offer.
expected<void, ErrorCode> accept_deflate_response(std::string_view response,
                                                  const CompressionConfig& offered,
                                                  CompressionConfig& negotiated);

std::string build_upgrade_response(std::string_view accept_key,
                                   std::string_view extensions);
std::string build_upgrade_request(std::string_view host, std::string_view resource,
                                  std::string_view key, std::string_view extensions);
std::string build_error_response(int status, std::string_view reason,
                                 std::string_view extra_headers = {});

struct HandshakeResult {
  UpgradeRequest request;           // server side only
  CompressionConfig compression;    // negotiated
  Bytes leftover;                   // bytes after the HTTP head (first frames)
};

/**
 * @brief Pluggable opening handshake.
 *
 * The engine only needs the negotiated compression parameters and any bytes
 * read past the HTTP head.
 */
class HandshakeHandler {
 public:
  virtual ~HandshakeHandler() = default;
  virtual expected<HandshakeResult, ErrorCode> perform(Transport& transport,
                                                       const EngineConfig& config) = 0;
};

/// Server side of the RFC 6455 handshake.
class ServerHandshake : public HandshakeHandler {
 public:
  using Validator = std::function<bool(const UpgradeRequest&)>;

  ServerHandshake() = default;
  explicit ServerHandshake(Validator validator) : validator_(std::move(validator)) {}

  expected<HandshakeResult, ErrorCode> perform(Transport& transport,
                                               const EngineConfig& config) override;

 private:
  Validator validator_;
};

/// Client side of the RFC 6455 handshake.
class ClientHandshake : public HandshakeHandler {
 public:
  ClientHandshake(std::string host, std::string resource)
      : host_(std::move(host)), resource_(std::move(resource)) {}

  expected<HandshakeResult, ErrorCode> perform(Transport& transport,
                                               const EngineConfig& config) override;

 private:
  std::string host_;
  std::string resource_;
};

}  // namespace wscore

#endif  // WSCORE_HANDSHAKE_HPP_
