#include "wscore/handshake.hpp"

#include "pipe_transport.hpp"
#include "wscore/crypto.hpp"

#include <atomic>
#include <catch2/catch.hpp>
#include <chrono>
#include <string>
#include <thread>

using namespace wscore;
using wscore::testing::make_pipe;

namespace {

const std::string kSampleKey = "dGhlIHNhbXBsZSBub25jZQ==";

std::string sample_request(const std::string& extra_headers = "") {
  return "GET /chat HTTP/1.1\r\n"
         "Host: server.example.com\r\n"
         "Upgrade: websocket\r\n"
         "Connection: keep-alive, Upgrade\r\n"
         "Sec-WebSocket-Key: " +
         kSampleKey +
         "\r\n"
         "Sec-WebSocket-Version: 13\r\n" +
         extra_headers + "\r\n";
}

UpgradeRequest parsed(const std::string& raw) {
  UpgradeRequest req;
  auto r = parse_upgrade_request(raw, req);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == raw.size());
  return req;
}

CompressionConfig deflate_on() {
  CompressionConfig cfg;
  cfg.enabled = true;
  return cfg;
}

}  // namespace

// ============================================================================
// Keys
// ============================================================================

TEST_CASE("Handshake - accept key for the RFC sample", "[handshake]") {
  REQUIRE(generate_accept_key(kSampleKey) == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_CASE("Handshake - client keys are 16 random bytes", "[handshake]") {
  auto a = generate_client_key();
  auto b = generate_client_key();
  REQUIRE(a.size() == 24);
  REQUIRE(a != b);
  auto raw = Base64::decode(a);
  REQUIRE(raw.has_value());
  REQUIRE(raw.value().size() == 16);
}

// ============================================================================
// Request parsing
// ============================================================================

TEST_CASE("Handshake - parse a complete request", "[handshake]") {
  auto req = parsed(sample_request());
  REQUIRE(req.method == "GET");
  REQUIRE(req.resource == "/chat");
  REQUIRE(req.key() == kSampleKey);
  REQUIRE(req.headers.get("host") == "server.example.com");
  REQUIRE(req.headers.has_token("Connection", "upgrade"));
  REQUIRE(validate_upgrade_request(req).has_value());
}

TEST_CASE("Handshake - incomplete request needs more data", "[handshake]") {
  std::string raw = sample_request();
  UpgradeRequest req;
  auto r = parse_upgrade_request(std::string_view(raw).substr(0, raw.size() - 2), req);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 0);
}

TEST_CASE("Handshake - bytes after the head are not consumed", "[handshake]") {
  std::string raw = sample_request() + "\x81\x80trailing";
  UpgradeRequest req;
  auto r = parse_upgrade_request(raw, req);
  REQUIRE(r.value() == sample_request().size());
}

TEST_CASE("Handshake - repeated headers are joined", "[handshake]") {
  auto req = parsed(sample_request("Sec-WebSocket-Extensions: foo\r\n"
                                   "Sec-WebSocket-Extensions: permessage-deflate\r\n"));
  REQUIRE(req.headers.get("sec-websocket-extensions") == "foo, permessage-deflate");
}

TEST_CASE("Handshake - malformed heads", "[handshake]") {
  UpgradeRequest req;
  REQUIRE_FALSE(parse_upgrade_request("GARBAGE\r\n\r\n", req).has_value());
  REQUIRE_FALSE(parse_upgrade_request("GET / HTTP/1.1\r\nNoColon\r\n\r\n", req).has_value());

  std::string huge = "GET / HTTP/1.1\r\nX-Pad: " + std::string(kMaxHandshakeSize, 'a');
  auto r = parse_upgrade_request(huge, req);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ErrorCode::kHandshakeFailed);
}

TEST_CASE("Handshake - request validation", "[handshake]") {
  SECTION("wrong method") {
    std::string raw = sample_request();
    raw.replace(0, 3, "PUT");
    REQUIRE_FALSE(validate_upgrade_request(parsed(raw)).has_value());
  }
  SECTION("missing upgrade token") {
    auto req = parsed(
        "GET / HTTP/1.1\r\nConnection: Upgrade\r\nSec-WebSocket-Version: 13\r\n"
        "Sec-WebSocket-Key: " + kSampleKey + "\r\n\r\n");
    REQUIRE_FALSE(validate_upgrade_request(req).has_value());
  }
  SECTION("wrong version") {
    auto req = parsed(
        "GET / HTTP/1.1\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
        "Sec-WebSocket-Version: 8\r\nSec-WebSocket-Key: " + kSampleKey + "\r\n\r\n");
    REQUIRE_FALSE(validate_upgrade_request(req).has_value());
  }
  SECTION("key of the wrong length") {
    auto req = parsed(
        "GET / HTTP/1.1\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
        "Sec-WebSocket-Version: 13\r\nSec-WebSocket-Key: c2hvcnQ=\r\n\r\n");
    auto r = validate_upgrade_request(req);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == ErrorCode::kHandshakeFailed);
  }
}

TEST_CASE("Handshake - response parsing", "[handshake]") {
  std::string raw = build_upgrade_response("s3pPLMBiTxaQ9kYGzzhZRbK+xOo=", "permessage-deflate");
  UpgradeResponse resp;
  auto r = parse_upgrade_response(raw, resp);
  REQUIRE(r.value() == raw.size());
  REQUIRE(resp.status == 101);
  REQUIRE(resp.headers.get("Sec-WebSocket-Accept") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
  REQUIRE(resp.headers.get("Sec-WebSocket-Extensions") == "permessage-deflate");
}

TEST_CASE("Handshake - error responses", "[handshake]") {
  auto resp = build_error_response(429, "Too Many Requests", "Retry-After: 12\r\n");
  REQUIRE(resp.rfind("HTTP/1.1 429 Too Many Requests\r\n", 0) == 0);
  REQUIRE(resp.find("Retry-After: 12\r\n") != std::string::npos);
  REQUIRE(resp.find("Connection: close\r\n") != std::string::npos);
  REQUIRE(resp.size() >= 4);
  REQUIRE(resp.compare(resp.size() - 4, 4, "\r\n\r\n") == 0);
}

// ============================================================================
// permessage-deflate negotiation
// ============================================================================

TEST_CASE("Negotiation - plain offer is accepted", "[handshake][deflate]") {
  CompressionConfig out;
  std::string response;
  negotiate_deflate("permessage-deflate; client_max_window_bits", deflate_on(), out, response);
  REQUIRE(out.enabled);
  REQUIRE(out.window_bits == 15);
  REQUIRE(out.context_takeover);
  REQUIRE(out.peer_context_takeover);
  REQUIRE(response == "permessage-deflate");
}

TEST_CASE("Negotiation - no offer or disabled locally", "[handshake][deflate]") {
  CompressionConfig out;
  std::string response;
  negotiate_deflate("", deflate_on(), out, response);
  REQUIRE_FALSE(out.enabled);
  REQUIRE(response.empty());

  negotiate_deflate("permessage-deflate", CompressionConfig(), out, response);
  REQUIRE_FALSE(out.enabled);
  REQUIRE(response.empty());

  negotiate_deflate("x-webkit-deflate-frame", deflate_on(), out, response);
  REQUIRE_FALSE(out.enabled);
}

TEST_CASE("Negotiation - takeover and window parameters", "[handshake][deflate]") {
  CompressionConfig out;
  std::string response;
  negotiate_deflate(
      "permessage-deflate; server_no_context_takeover; client_no_context_takeover; "
      "server_max_window_bits=10",
      deflate_on(), out, response);
  REQUIRE(out.enabled);
  REQUIRE(out.window_bits == 10);
  REQUIRE_FALSE(out.context_takeover);
  REQUIRE_FALSE(out.peer_context_takeover);
  REQUIRE(response ==
          "permessage-deflate; server_no_context_takeover; client_no_context_takeover; "
          "server_max_window_bits=10");
}

TEST_CASE("Negotiation - bad offers fall through to the next", "[handshake][deflate]") {
  CompressionConfig out;
  std::string response;
  negotiate_deflate(
      "permessage-deflate; unknown_param, "
      "permessage-deflate; server_max_window_bits=7, "
      "permessage-deflate; server_no_context_takeover; server_no_context_takeover, "
      "permessage-deflate; server_max_window_bits=12",
      deflate_on(), out, response);
  REQUIRE(out.enabled);
  REQUIRE(out.window_bits == 12);
  REQUIRE(response == "permessage-deflate; server_max_window_bits=12");
}

TEST_CASE("Negotiation - client side", "[handshake][deflate]") {
  auto local = deflate_on();
  REQUIRE(build_deflate_offer(local) == "permessage-deflate; client_max_window_bits");

  local.context_takeover = false;
  REQUIRE(build_deflate_offer(local) ==
          "permessage-deflate; client_max_window_bits; client_no_context_takeover");

  CompressionConfig out;
  REQUIRE(accept_deflate_response(
              "permessage-deflate; server_no_context_takeover; client_max_window_bits=11",
              deflate_on(), out)
              .has_value());
  REQUIRE(out.enabled);
  REQUIRE(out.window_bits == 11);
  REQUIRE(out.context_takeover);
  REQUIRE_FALSE(out.peer_context_takeover);

  REQUIRE(accept_deflate_response("", deflate_on(), out).has_value());
  REQUIRE_FALSE(out.enabled);

  auto unrequested = accept_deflate_response("permessage-deflate", CompressionConfig(), out);
  REQUIRE_FALSE(unrequested.has_value());
  REQUIRE(unrequested.get_error() == ErrorCode::kHandshakeFailed);

  REQUIRE_FALSE(accept_deflate_response("foo", deflate_on(), out).has_value());
}

// ============================================================================
// Handshake over a transport
// ============================================================================

TEST_CASE("ServerHandshake - upgrades and keeps early frames", "[handshake]") {
  auto ends = make_pipe();
  auto& server = ends.first;
  auto& client = ends.second;

  const std::string early = "\x81\x80\x01\x02\x03\x04";
  REQUIRE(client->send_raw(sample_request() + early));

  EngineConfig cfg;
  ServerHandshake handshake;
  auto result = handshake.perform(*server, cfg);
  REQUIRE(result.has_value());
  REQUIRE(result.value().request.resource == "/chat");
  REQUIRE_FALSE(result.value().compression.enabled);
  REQUIRE(result.value().leftover.to_string() == early);

  std::string head = client->receive_head();
  REQUIRE(head.rfind("HTTP/1.1 101 Switching Protocols\r\n", 0) == 0);
  REQUIRE(head.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n") !=
          std::string::npos);
  REQUIRE(head.find("Sec-WebSocket-Extensions") == std::string::npos);
}

TEST_CASE("ServerHandshake - negotiates compression", "[handshake]") {
  auto ends = make_pipe();
  REQUIRE(ends.second->send_raw(
      sample_request("Sec-WebSocket-Extensions: permessage-deflate; client_max_window_bits\r\n")));

  EngineConfig cfg;
  cfg.compression.enabled = true;
  ServerHandshake handshake;
  auto result = handshake.perform(*ends.first, cfg);
  REQUIRE(result.has_value());
  REQUIRE(result.value().compression.enabled);
  REQUIRE(ends.second->receive_head().find("Sec-WebSocket-Extensions: permessage-deflate\r\n") !=
          std::string::npos);
}

TEST_CASE("ServerHandshake - rejections", "[handshake]") {
  auto ends = make_pipe();
  EngineConfig cfg;

  SECTION("bad version gets 426") {
    REQUIRE(ends.second->send_raw(
        "GET / HTTP/1.1\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
        "Sec-WebSocket-Version: 8\r\nSec-WebSocket-Key: " + kSampleKey + "\r\n\r\n"));
    ServerHandshake handshake;
    auto r = handshake.perform(*ends.first, cfg);
    REQUIRE(r.get_error() == ErrorCode::kHandshakeFailed);
    std::string head = ends.second->receive_head();
    REQUIRE(head.rfind("HTTP/1.1 426", 0) == 0);
    REQUIRE(head.find("Sec-WebSocket-Version: 13\r\n") != std::string::npos);
  }

  SECTION("plain HTTP gets 400") {
    REQUIRE(ends.second->send_raw("GET / HTTP/1.1\r\nHost: x\r\nSec-WebSocket-Version: 13\r\n\r\n"));
    ServerHandshake handshake;
    REQUIRE_FALSE(handshake.perform(*ends.first, cfg).has_value());
    REQUIRE(ends.second->receive_head().rfind("HTTP/1.1 400", 0) == 0);
  }

  SECTION("validator refusal gets 403") {
    REQUIRE(ends.second->send_raw(sample_request()));
    ServerHandshake handshake([](const UpgradeRequest& req) { return req.resource == "/admin"; });
    REQUIRE_FALSE(handshake.perform(*ends.first, cfg).has_value());
    REQUIRE(ends.second->receive_head().rfind("HTTP/1.1 403", 0) == 0);
  }

  SECTION("oversized head gets 431") {
    REQUIRE(ends.second->send_raw("GET / HTTP/1.1\r\nX-Pad: " + std::string(kMaxHandshakeSize, 'a')));
    ServerHandshake handshake;
    auto r = handshake.perform(*ends.first, cfg);
    REQUIRE(r.get_error() == ErrorCode::kHandshakeFailed);
    REQUIRE(ends.second->receive_head().rfind("HTTP/1.1 431", 0) == 0);
  }

  SECTION("peer hangs up") {
    REQUIRE(ends.second->send_raw("GET / HTTP/1.1\r\n"));
    ends.second->shutdown();
    ServerHandshake handshake;
    auto r = handshake.perform(*ends.first, cfg);
    REQUIRE(r.get_error() == ErrorCode::kConnectionClosed);
  }

  SECTION("silent peer times out") {
    cfg.handshake_timeout = std::chrono::milliseconds(20);
    ServerHandshake handshake;
    auto r = handshake.perform(*ends.first, cfg);
    REQUIRE(r.get_error() == ErrorCode::kHandshakeTimeout);
  }
}

TEST_CASE("ServerHandshake - one deadline for a trickling request", "[handshake]") {
  auto ends = make_pipe();
  EngineConfig cfg;
  cfg.handshake_timeout = std::chrono::milliseconds(150);

  // One byte every 30 ms: each read succeeds well inside the timeout.
  std::atomic<bool> done{false};
  std::thread trickler([&] {
    const std::string request = sample_request();
    for (char c : request) {
      if (done.load() || !ends.second->send_raw(std::string(1, c))) return;
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
    }
  });

  const auto started = std::chrono::steady_clock::now();
  ServerHandshake handshake;
  auto r = handshake.perform(*ends.first, cfg);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  done = true;
  trickler.join();

  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ErrorCode::kHandshakeTimeout);
  REQUIRE(elapsed < std::chrono::seconds(1));
}

TEST_CASE("ClientHandshake - against ServerHandshake", "[handshake]") {
  auto ends = make_pipe();
  EngineConfig server_cfg;
  server_cfg.compression.enabled = true;
  EngineConfig client_cfg = server_cfg;
  client_cfg.role = Role::kClient;

  expected<HandshakeResult, ErrorCode> server_result =
      expected<HandshakeResult, ErrorCode>::error(ErrorCode::kInternalError);
  std::thread server_thread([&] {
    ServerHandshake handshake;
    server_result = handshake.perform(*ends.first, server_cfg);
  });

  ClientHandshake client("localhost", "/echo");
  auto client_result = client.perform(*ends.second, client_cfg);
  server_thread.join();

  REQUIRE(client_result.has_value());
  REQUIRE(server_result.has_value());
  REQUIRE(server_result.value().request.resource == "/echo");
  REQUIRE(server_result.value().request.headers.get("Host") == "localhost");
  REQUIRE(client_result.value().compression.enabled);
  REQUIRE(server_result.value().compression.enabled);
}

TEST_CASE("ClientHandshake - wrong accept value", "[handshake]") {
  auto ends = make_pipe();
  std::thread fake_server([&] {
    if (!ends.first->receive_head().empty()) {
      ends.first->send_raw(build_upgrade_response("bm90IHRoZSByaWdodCBrZXk=", ""));
    }
  });

  ClientHandshake client("localhost", "/");
  auto r = client.perform(*ends.second, EngineConfig());
  fake_server.join();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ErrorCode::kHandshakeFailed);
}
