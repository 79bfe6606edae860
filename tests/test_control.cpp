#include "wscore/control_handler.hpp"

#include <catch2/catch.hpp>
#include <chrono>
#include <string>
#include <vector>

using namespace wscore;
using namespace std::chrono_literals;

namespace {

struct Fixture {
  using Clock = ControlFrameHandler::Clock;

  Fixture() : t0(Clock::now()), handler(sm, config, t0) {}

  void open() {
    REQUIRE(sm.transition_to(ConnectionState::kOpen).has_value());
    handler.note_open(t0);
  }

  ws::Frame close_frame(uint16_t code, const std::string& reason = "") {
    return ws::Frame::close(Bytes(build_close_payload(code, reason)));
  }

  EngineConfig config;
  StateMachine sm;
  Clock::time_point t0;
  ControlFrameHandler handler;
};

}  // namespace

// ============================================================================
// Ping / Pong
// ============================================================================

TEST_CASE("Control - ping is answered with a matching pong", "[control]") {
  Fixture f;
  f.open();
  auto r = f.handler.handle(ws::Frame::ping(Bytes::from_string("abc")), f.t0);
  REQUIRE(r.has_value());
  REQUIRE(r.value().reply.has_value());
  REQUIRE(r.value().reply.value().opcode == ws::OpCode::kPong);
  REQUIRE(r.value().reply.value().payload.to_string() == "abc");
  REQUIRE_FALSE(r.value().reply_is_close);
}

TEST_CASE("Control - pongs are surfaced only when asked", "[control]") {
  Fixture f;
  f.open();
  auto quiet = f.handler.handle(ws::Frame::pong(Bytes::from_string("x")), f.t0);
  REQUIRE(quiet.has_value());
  REQUIRE_FALSE(quiet.value().surfaced.has_value());
  REQUIRE_FALSE(quiet.value().reply.has_value());

  f.config.surface_pongs = true;
  auto loud = f.handler.handle(ws::Frame::pong(Bytes::from_string("x")), f.t0);
  REQUIRE(loud.value().surfaced.has_value());
  REQUIRE(loud.value().surfaced.value().type() == MessageType::kPong);
}

TEST_CASE("Control - no pong after our close went out", "[control]") {
  Fixture f;
  f.open();
  REQUIRE(f.handler.initiate_close(1000, "bye", f.t0).has_value());
  auto r = f.handler.handle(ws::Frame::ping(), f.t0);
  REQUIRE(r.has_value());
  REQUIRE_FALSE(r.value().reply.has_value());
}

TEST_CASE("Control - frames before Open", "[control]") {
  Fixture f;
  auto r = f.handler.handle(ws::Frame::ping(), f.t0);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ErrorCode::kInvalidState);

  f.open();
  auto data = f.handler.handle(ws::Frame::text("x"), f.t0);
  REQUIRE_FALSE(data.has_value());
  REQUIRE(data.get_error() == ErrorCode::kInvalidArgument);
}

// ============================================================================
// Close handshake
// ============================================================================

TEST_CASE("Control - remote close is echoed", "[control]") {
  Fixture f;
  f.open();
  auto r = f.handler.handle(f.close_frame(1001, "going"), f.t0);
  REQUIRE(r.has_value());
  REQUIRE(f.sm.get_state() == ConnectionState::kClosingRemote);
  REQUIRE(r.value().reply_is_close);
  REQUIRE(r.value().reply.value().opcode == ws::OpCode::kClose);

  auto echo = parse_close_payload(r.value().reply.value().payload);
  REQUIRE(echo.value().code == 1001);

  auto closed = f.handler.on_echo_sent();
  REQUIRE(closed.has_value());
  REQUIRE(closed.value().code == 1001);
  REQUIRE(closed.value().reason == "going");
  REQUIRE(closed.value().origin == CloseOrigin::kRemote);
  REQUIRE(closed.value().error == ErrorCode::kOk);
  REQUIRE(f.sm.is_closed());
}

TEST_CASE("Control - empty close is echoed empty", "[control]") {
  Fixture f;
  f.open();
  auto r = f.handler.handle(ws::Frame::close(), f.t0);
  REQUIRE(r.has_value());
  REQUIRE(r.value().reply.value().payload.empty());
  auto closed = f.handler.on_echo_sent();
  REQUIRE(closed.value().code == close_code::kNoStatus);
}

TEST_CASE("Control - close with an illegal code", "[control]") {
  Fixture f;
  f.open();
  auto r = f.handler.handle(f.close_frame(1005), f.t0);
  REQUIRE(r.has_value());
  auto echo = parse_close_payload(r.value().reply.value().payload);
  REQUIRE(echo.value().code == close_code::kProtocolError);

  auto closed = f.handler.on_echo_sent();
  REQUIRE(closed.value().error == ErrorCode::kProtocolViolation);
}

TEST_CASE("Control - local close completes on the peer's echo", "[control]") {
  Fixture f;
  f.open();
  auto frame = f.handler.initiate_close(1000, "done", f.t0);
  REQUIRE(frame.has_value());
  REQUIRE(f.sm.get_state() == ConnectionState::kClosingLocal);
  REQUIRE(f.handler.close_sent());

  auto r = f.handler.handle(f.close_frame(1000), f.t0 + 10ms);
  REQUIRE(r.has_value());
  REQUIRE_FALSE(r.value().reply.has_value());
  REQUIRE(r.value().closed.has_value());
  REQUIRE(r.value().closed.value().origin == CloseOrigin::kLocal);
  REQUIRE(r.value().closed.value().reason == "done");
  REQUIRE(f.sm.is_closed());
}

TEST_CASE("Control - initiate_close argument checks", "[control]") {
  Fixture f;
  auto early = f.handler.initiate_close(1000, "", f.t0);
  REQUIRE(early.get_error() == ErrorCode::kInvalidState);

  f.open();
  auto bad = f.handler.initiate_close(1006, "", f.t0);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.get_error() == ErrorCode::kInvalidArgument);
  REQUIRE(f.sm.get_state() == ConnectionState::kOpen);

  REQUIRE(f.handler.initiate_close(4000, "", f.t0).has_value());
  auto twice = f.handler.initiate_close(1000, "", f.t0);
  REQUIRE(twice.get_error() == ErrorCode::kInvalidState);
}

TEST_CASE("Control - fail sends a close with the mapped code", "[control]") {
  Fixture f;
  f.open();
  auto r = f.handler.fail(ErrorCode::kMessageTooLarge);
  REQUIRE(r.reply.has_value());
  auto body = parse_close_payload(r.reply.value().payload);
  REQUIRE(body.value().code == close_code::kMessageTooBig);
  REQUIRE(r.closed.value().error == ErrorCode::kMessageTooLarge);
  REQUIRE(f.sm.is_closed());

  // Nothing more once closed.
  auto again = f.handler.fail(ErrorCode::kProtocolViolation);
  REQUIRE_FALSE(again.closed.has_value());
}

TEST_CASE("Control - compression failures use the configured code", "[control]") {
  Fixture f;
  f.config.compression_error_close_code = 1002;
  f.open();
  auto r = f.handler.fail(ErrorCode::kCompressionError);
  auto body = parse_close_payload(r.reply.value().payload);
  REQUIRE(body.value().code == 1002);
}

TEST_CASE("Control - transport error closes abnormally", "[control]") {
  Fixture f;
  f.open();
  auto info = f.handler.on_transport_error();
  REQUIRE(info.has_value());
  REQUIRE(info.value().code == close_code::kAbnormal);
  REQUIRE(info.value().error == ErrorCode::kTransportError);
  REQUIRE_FALSE(f.handler.on_transport_error().has_value());
}

// ============================================================================
// Timers
// ============================================================================

TEST_CASE("Control - handshake timeout", "[control][timer]") {
  Fixture f;
  f.config.handshake_timeout = 100ms;
  REQUIRE(f.handler.poll(f.t0 + 50ms).expired == ErrorCode::kOk);
  auto r = f.handler.poll(f.t0 + 100ms);
  REQUIRE(r.expired == ErrorCode::kHandshakeTimeout);
  REQUIRE(r.closed.value().timed_out);
  REQUIRE(f.sm.is_closed());
}

TEST_CASE("Control - idle timeout resets on activity", "[control][timer]") {
  Fixture f;
  f.config.idle_timeout = 1000ms;
  f.open();
  f.handler.note_activity(f.t0 + 900ms);
  REQUIRE(f.handler.poll(f.t0 + 1500ms).expired == ErrorCode::kOk);
  auto r = f.handler.poll(f.t0 + 1900ms);
  REQUIRE(r.expired == ErrorCode::kIdleTimeout);
  REQUIRE(r.closed.value().error == ErrorCode::kIdleTimeout);
}

TEST_CASE("Control - keepalive pings", "[control][timer]") {
  Fixture f;
  f.config.idle_timeout = 0ms;
  f.config.ping_interval = 100ms;
  f.open();
  REQUIRE_FALSE(f.handler.poll(f.t0 + 50ms).ping.has_value());
  auto r = f.handler.poll(f.t0 + 100ms);
  REQUIRE(r.ping.has_value());
  REQUIRE(r.ping.value().opcode == ws::OpCode::kPing);
  // Not again until another interval has passed.
  REQUIRE_FALSE(f.handler.poll(f.t0 + 150ms).ping.has_value());
  REQUIRE(f.handler.poll(f.t0 + 200ms).ping.has_value());
}

TEST_CASE("Control - close handshake timeout", "[control][timer]") {
  Fixture f;
  f.config.close_handshake_timeout = 200ms;
  f.open();
  REQUIRE(f.handler.initiate_close(1000, "bye", f.t0).has_value());
  REQUIRE(f.handler.poll(f.t0 + 100ms).expired == ErrorCode::kOk);
  auto r = f.handler.poll(f.t0 + 200ms);
  REQUIRE(r.expired == ErrorCode::kCloseTimeout);
  REQUIRE(r.closed.value().code == 1000);
  REQUIRE(r.closed.value().timed_out);
  REQUIRE(f.sm.is_closed());
}
