#include "wscore/handshake.hpp"

#include "wscore/crypto.hpp"
#include "wscore/log.hpp"

#include <cctype>
#include <cstdio>
#include <cstring>

#include <algorithm>
#include <chrono>
#include <random>

namespace wscore {

namespace {

constexpr std::string_view kWsGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr std::string_view kHeadEnd = "\r\n\r\n";
constexpr std::string_view kDeflateName = "permessage-deflate";

using SizeResult = expected<size_t, ErrorCode>;
using VoidResult = expected<void, ErrorCode>;
using HandshakeOutcome = expected<HandshakeResult, ErrorCode>;

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

// Split on sep, trimming each part. Empty parts are kept.
std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  for (;;) {
    size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(trim(s.substr(start)));
      return parts;
    }
    parts.push_back(trim(s.substr(start, pos - start)));
    start = pos + 1;
  }
}

// Header lines after the start line. Returns false on a malformed line.
bool parse_header_lines(std::string_view block, HttpHeaders& headers) {
  size_t pos = 0;
  while (pos < block.size()) {
    size_t eol = block.find("\r\n", pos);
    if (eol == std::string_view::npos) eol = block.size();
    std::string_view line = block.substr(pos, eol - pos);
    pos = eol + 2;
    if (line.empty()) continue;

    size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) return false;
    std::string_view name = line.substr(0, colon);
    if (name.back() == ' ' || name.back() == '\t') return false;
    headers.fields.emplace_back(std::string(name), std::string(trim(line.substr(colon + 1))));
  }
  return true;
}

// Locate the head terminator, enforcing the size ceiling.
SizeResult find_head(std::string_view data) {
  size_t end = data.find(kHeadEnd);
  if (end == std::string_view::npos) {
    if (data.size() > kMaxHandshakeSize) {
      return SizeResult::error(ErrorCode::kHandshakeFailed);
    }
    return SizeResult::success(0);
  }
  size_t consumed = end + kHeadEnd.size();
  if (consumed > kMaxHandshakeSize) {
    return SizeResult::error(ErrorCode::kHandshakeFailed);
  }
  return SizeResult::success(consumed);
}

struct ExtensionParam {
  std::string_view name;
  std::string_view value;
  bool has_value = false;
};

struct ExtensionOffer {
  std::string_view name;
  std::vector<ExtensionParam> params;
};

std::vector<ExtensionOffer> parse_extensions(std::string_view header) {
  std::vector<ExtensionOffer> offers;
  for (std::string_view item : split(header, ',')) {
    if (item.empty()) continue;
    auto parts = split(item, ';');
    ExtensionOffer offer;
    offer.name = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
      ExtensionParam p;
      size_t eq = parts[i].find('=');
      if (eq == std::string_view::npos) {
        p.name = parts[i];
      } else {
        p.name = trim(parts[i].substr(0, eq));
        p.value = trim(parts[i].substr(eq + 1));
        if (p.value.size() >= 2 && p.value.front() == '"' && p.value.back() == '"') {
          p.value = p.value.substr(1, p.value.size() - 2);
        }
        p.has_value = true;
      }
      offer.params.push_back(p);
    }
    offers.push_back(std::move(offer));
  }
  return offers;
}

// 8..15, or -1 when the value is not a window size.
int parse_window_bits(std::string_view v) {
  if (v.empty() || v.size() > 2) return -1;
  int bits = 0;
  for (char c : v) {
    if (c < '0' || c > '9') return -1;
    bits = bits * 10 + (c - '0');
  }
  return (bits >= 8 && bits <= 15) ? bits : -1;
}

struct DeflateParams {
  bool server_no_context_takeover = false;
  bool client_no_context_takeover = false;
  int server_max_window_bits = 0;   // 0: absent
  int client_max_window_bits = 0;   // 0: absent, 15 when offered without a value
  bool client_max_window_bits_offered = false;
};

// False for unknown, duplicate or out-of-range parameters.
bool read_deflate_params(const ExtensionOffer& offer, DeflateParams& out) {
  bool seen[4] = {false, false, false, false};
  for (const auto& p : offer.params) {
    int slot = -1;
    if (p.name == "server_no_context_takeover") {
      if (p.has_value) return false;
      out.server_no_context_takeover = true;
      slot = 0;
    } else if (p.name == "client_no_context_takeover") {
      if (p.has_value) return false;
      out.client_no_context_takeover = true;
      slot = 1;
    } else if (p.name == "server_max_window_bits") {
      out.server_max_window_bits = parse_window_bits(p.value);
      if (out.server_max_window_bits < 0) return false;
      slot = 2;
    } else if (p.name == "client_max_window_bits") {
      out.client_max_window_bits_offered = true;
      if (p.has_value) {
        out.client_max_window_bits = parse_window_bits(p.value);
        if (out.client_max_window_bits < 0) return false;
      } else {
        out.client_max_window_bits = 15;
      }
      slot = 3;
    } else {
      return false;
    }
    if (seen[slot]) return false;
    seen[slot] = true;
  }
  return true;
}

// Read from the transport until a full HTTP head is buffered. One deadline
// covers the whole head, however slowly it trickles in.
expected<std::string, ErrorCode> read_head(Transport& transport, std::chrono::milliseconds timeout,
                                           size_t& head_len) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + timeout;
  std::string buf;
  uint8_t chunk[2048];
  for (;;) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (left.count() <= 0) {
      return expected<std::string, ErrorCode>::error(ErrorCode::kHandshakeTimeout);
    }
    auto bounded = transport.set_read_timeout(left);
    if (!bounded) return expected<std::string, ErrorCode>::error(ErrorCode::kTransportError);

    auto n = transport.read(chunk, sizeof(chunk));
    if (!n) {
      ErrorCode err = n.get_error() == ErrorCode::kTimeout ? ErrorCode::kHandshakeTimeout
                                                           : ErrorCode::kTransportError;
      return expected<std::string, ErrorCode>::error(err);
    }
    if (n.value() == 0) {
      return expected<std::string, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
    buf.append(reinterpret_cast<const char*>(chunk), n.value());

    auto head = find_head(buf);
    if (!head) return expected<std::string, ErrorCode>::error(head.get_error());
    if (head.value() != 0) {
      head_len = head.value();
      return expected<std::string, ErrorCode>::success(std::move(buf));
    }
  }
}

VoidResult send_text(Transport& transport, const std::string& text) {
  return transport.write(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

// Best effort: the connection is dropped either way.
void reject(Transport& transport, const std::string& response) {
  auto r = send_text(transport, response);
  if (!r) WSCORE_LOG_DEBUG("handshake: rejection not delivered");
}

}  // namespace

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::get(std::string_view name) const {
  std::string result;
  for (const auto& field : fields) {
    if (!iequals(field.first, name)) continue;
    if (!result.empty()) result += ", ";
    result += field.second;
  }
  return result;
}

bool HttpHeaders::has_token(std::string_view name, std::string_view token) const {
  std::string value = get(name);
  for (std::string_view part : split(value, ',')) {
    if (iequals(part, token)) return true;
  }
  return false;
}

// ============================================================================
// Keys
// ============================================================================

std::string generate_accept_key(std::string_view client_key) {
  std::string combined;
  combined.reserve(client_key.size() + kWsGuid.size());
  combined.append(client_key);
  combined.append(kWsGuid);
  auto hash = SHA1::compute(reinterpret_cast<const uint8_t*>(combined.data()),
                            combined.size());
  return Base64::encode(hash.data(), hash.size());
}

std::string generate_client_key() {
  thread_local std::mt19937 rng{std::random_device{}()};
  uint8_t nonce[16];
  for (auto& b : nonce) b = static_cast<uint8_t>(rng() & 0xFF);
  return Base64::encode(nonce, sizeof(nonce));
}

// ============================================================================
// Parsing
// ============================================================================

SizeResult parse_upgrade_request(std::string_view data, UpgradeRequest& out) {
  auto head = find_head(data);
  if (!head || head.value() == 0) return head;
  const size_t consumed = head.value();

  size_t line_end = data.find("\r\n");
  std::string_view start_line = data.substr(0, line_end);
  auto tokens = split(start_line, ' ');
  if (tokens.size() != 3 || tokens[0].empty() || tokens[1].empty() ||
      tokens[2].substr(0, 5) != "HTTP/") {
    return SizeResult::error(ErrorCode::kHandshakeFailed);
  }

  out = UpgradeRequest();
  out.method = std::string(tokens[0]);
  out.resource = std::string(tokens[1]);
  std::string_view block = data.substr(line_end + 2, consumed - kHeadEnd.size() - line_end);
  if (!parse_header_lines(block, out.headers)) {
    return SizeResult::error(ErrorCode::kHandshakeFailed);
  }
  return SizeResult::success(consumed);
}

SizeResult parse_upgrade_response(std::string_view data, UpgradeResponse& out) {
  auto head = find_head(data);
  if (!head || head.value() == 0) return head;
  const size_t consumed = head.value();

  size_t line_end = data.find("\r\n");
  std::string_view status_line = data.substr(0, line_end);
  if (status_line.substr(0, 5) != "HTTP/") {
    return SizeResult::error(ErrorCode::kHandshakeFailed);
  }
  size_t sp = status_line.find(' ');
  if (sp == std::string_view::npos || status_line.size() < sp + 4) {
    return SizeResult::error(ErrorCode::kHandshakeFailed);
  }
  int status = 0;
  for (size_t i = sp + 1; i < sp + 4; ++i) {
    char c = status_line[i];
    if (c < '0' || c > '9') return SizeResult::error(ErrorCode::kHandshakeFailed);
    status = status * 10 + (c - '0');
  }

  out = UpgradeResponse();
  out.status = status;
  std::string_view block = data.substr(line_end + 2, consumed - kHeadEnd.size() - line_end);
  if (!parse_header_lines(block, out.headers)) {
    return SizeResult::error(ErrorCode::kHandshakeFailed);
  }
  return SizeResult::success(consumed);
}

VoidResult validate_upgrade_request(const UpgradeRequest& req) {
  if (req.method != "GET") {
    return VoidResult::error(ErrorCode::kHandshakeFailed);
  }
  if (!req.headers.has_token("Upgrade", "websocket") ||
      !req.headers.has_token("Connection", "Upgrade")) {
    return VoidResult::error(ErrorCode::kHandshakeFailed);
  }
  if (req.headers.get("Sec-WebSocket-Version") != "13") {
    return VoidResult::error(ErrorCode::kHandshakeFailed);
  }
  auto nonce = Base64::decode(req.key());
  if (!nonce || nonce.value().size() != 16) {
    return VoidResult::error(ErrorCode::kHandshakeFailed);
  }
  return VoidResult::success();
}

// ============================================================================
// permessage-deflate negotiation
// ============================================================================

void negotiate_deflate(std::string_view offer, const CompressionConfig& local,
                       CompressionConfig& negotiated, std::string& response_value) {
  negotiated = local;
  negotiated.enabled = false;
  response_value.clear();
  if (!local.enabled) return;

  for (const auto& ext : parse_extensions(offer)) {
    if (ext.name != kDeflateName) continue;
    DeflateParams params;
    if (!read_deflate_params(ext, params)) continue;

    // The first acceptable offer wins.
    int bits = local.window_bits;
    if (params.server_max_window_bits != 0) {
      bits = std::min(bits, params.server_max_window_bits);
    }
    negotiated.enabled = true;
    negotiated.window_bits = static_cast<uint8_t>(bits);
    negotiated.context_takeover = local.context_takeover && !params.server_no_context_takeover;
    negotiated.peer_context_takeover = !params.client_no_context_takeover;

    response_value = std::string(kDeflateName);
    if (!negotiated.context_takeover) response_value += "; server_no_context_takeover";
    if (params.client_no_context_takeover) response_value += "; client_no_context_takeover";
    if (bits < 15) response_value += "; server_max_window_bits=" + std::to_string(bits);
    return;
  }
}

std::string build_deflate_offer(const CompressionConfig& local) {
  std::string offer(kDeflateName);
  offer += "; client_max_window_bits";
  if (!local.context_takeover) offer += "; client_no_context_takeover";
  return offer;
}

VoidResult accept_deflate_response(std::string_view response,
                                   const CompressionConfig& offered,
                                   CompressionConfig& negotiated) {
  negotiated = offered;
  negotiated.enabled = false;
  if (trim(response).empty()) return VoidResult::success();

  auto exts = parse_extensions(response);
  if (exts.size() != 1 || exts[0].name != kDeflateName || !offered.enabled) {
    return VoidResult::error(ErrorCode::kHandshakeFailed);
  }
  DeflateParams params;
  if (!read_deflate_params(exts[0], params)) {
    return VoidResult::error(ErrorCode::kHandshakeFailed);
  }

  int bits = offered.window_bits;
  if (params.client_max_window_bits_offered) {
    bits = std::min(bits, params.client_max_window_bits);
  }
  negotiated.enabled = true;
  negotiated.window_bits = static_cast<uint8_t>(bits);
  negotiated.context_takeover = offered.context_takeover && !params.client_no_context_takeover;
  negotiated.peer_context_takeover = !params.server_no_context_takeover;
  return VoidResult::success();
}

// ============================================================================
// Responses
// ============================================================================

std::string build_upgrade_response(std::string_view accept_key, std::string_view extensions) {
  char buf[256];
  int len = std::snprintf(buf, sizeof(buf),
                          "HTTP/1.1 101 Switching Protocols\r\n"
                          "Upgrade: websocket\r\n"
                          "Connection: Upgrade\r\n"
                          "Sec-WebSocket-Accept: %.*s\r\n",
                          static_cast<int>(accept_key.size()), accept_key.data());
  std::string response(buf, static_cast<size_t>(std::max(len, 0)));
  if (!extensions.empty()) {
    response += "Sec-WebSocket-Extensions: ";
    response.append(extensions);
    response += "\r\n";
  }
  response += "\r\n";
  return response;
}

std::string build_upgrade_request(std::string_view host, std::string_view resource,
                                  std::string_view key, std::string_view extensions) {
  std::string request = "GET ";
  request.append(resource.empty() ? std::string_view("/") : resource);
  request += " HTTP/1.1\r\nHost: ";
  request.append(host);
  request +=
      "\r\nUpgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "Sec-WebSocket-Version: 13\r\n"
      "Sec-WebSocket-Key: ";
  request.append(key);
  request += "\r\n";
  if (!extensions.empty()) {
    request += "Sec-WebSocket-Extensions: ";
    request.append(extensions);
    request += "\r\n";
  }
  request += "\r\n";
  return request;
}

std::string build_error_response(int status, std::string_view reason,
                                 std::string_view extra_headers) {
  std::string response = "HTTP/1.1 " + std::to_string(status) + " ";
  response.append(reason);
  response += "\r\nContent-Length: 0\r\nConnection: close\r\n";
  response.append(extra_headers);
  response += "\r\n";
  return response;
}

// ============================================================================
// Handshake handlers
// ============================================================================

HandshakeOutcome ServerHandshake::perform(Transport& transport, const EngineConfig& config) {
  size_t head_len = 0;
  auto buffered = read_head(transport, config.handshake_timeout, head_len);
  if (!buffered) {
    if (buffered.get_error() == ErrorCode::kHandshakeFailed) {
      reject(transport, build_error_response(431, "Request Header Fields Too Large"));
    }
    return HandshakeOutcome::error(buffered.get_error());
  }
  const std::string& data = buffered.value();

  HandshakeResult result;
  auto parsed = parse_upgrade_request(data, result.request);
  if (!parsed || !validate_upgrade_request(result.request)) {
    WSCORE_LOG_WARN("handshake: invalid upgrade request from " + transport.peer_address());
    if (parsed && result.request.headers.get("Sec-WebSocket-Version") != "13") {
      reject(transport, build_error_response(426, "Upgrade Required",
                                             "Sec-WebSocket-Version: 13\r\n"));
    } else {
      reject(transport, build_error_response(400, "Bad Request"));
    }
    return HandshakeOutcome::error(ErrorCode::kHandshakeFailed);
  }

  if (validator_ && !validator_(result.request)) {
    reject(transport, build_error_response(403, "Forbidden"));
    return HandshakeOutcome::error(ErrorCode::kHandshakeFailed);
  }

  std::string ext_response;
  negotiate_deflate(result.request.headers.get("Sec-WebSocket-Extensions"),
                    config.compression, result.compression, ext_response);

  auto sent = send_text(transport,
                        build_upgrade_response(generate_accept_key(result.request.key()),
                                               ext_response));
  if (!sent) return HandshakeOutcome::error(sent.get_error());

  if (data.size() > head_len) {
    result.leftover = Bytes::copy_from(data.data() + head_len, data.size() - head_len);
  }
  WSCORE_LOG_DEBUG("handshake: upgraded " + transport.peer_address() + " " +
                   result.request.resource +
                   (result.compression.enabled ? " (permessage-deflate)" : ""));
  return HandshakeOutcome::success(std::move(result));
}

HandshakeOutcome ClientHandshake::perform(Transport& transport, const EngineConfig& config) {
  const std::string key = generate_client_key();
  const std::string offer =
      config.compression.enabled ? build_deflate_offer(config.compression) : std::string();

  auto sent = send_text(transport, build_upgrade_request(host_, resource_, key, offer));
  if (!sent) return HandshakeOutcome::error(sent.get_error());

  size_t head_len = 0;
  auto buffered = read_head(transport, config.handshake_timeout, head_len);
  if (!buffered) return HandshakeOutcome::error(buffered.get_error());
  const std::string& data = buffered.value();

  UpgradeResponse response;
  auto parsed = parse_upgrade_response(data, response);
  if (!parsed || response.status != 101 ||
      !response.headers.has_token("Upgrade", "websocket") ||
      !response.headers.has_token("Connection", "Upgrade") ||
      response.headers.get("Sec-WebSocket-Accept") != generate_accept_key(key)) {
    WSCORE_LOG_WARN("handshake: server rejected upgrade (status " +
                    std::to_string(response.status) + ")");
    return HandshakeOutcome::error(ErrorCode::kHandshakeFailed);
  }

  HandshakeResult result;
  auto ext = accept_deflate_response(response.headers.get("Sec-WebSocket-Extensions"),
                                     config.compression, result.compression);
  if (!ext) return HandshakeOutcome::error(ext.get_error());

  if (data.size() > head_len) {
    result.leftover = Bytes::copy_from(data.data() + head_len, data.size() - head_len);
  }
  return HandshakeOutcome::success(std::move(result));
}

}  // namespace wscore
