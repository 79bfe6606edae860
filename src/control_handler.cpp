#include "wscore/control_handler.hpp"

#include "wscore/log.hpp"

namespace wscore {

using HandleResult = expected<ControlFrameHandler::Result, ErrorCode>;
using CloseFrameResult = expected<ws::Frame, ErrorCode>;

ControlFrameHandler::ControlFrameHandler(StateMachine& state, const EngineConfig& config,
                                         TimePoint now)
    : state_(state),
      config_(config),
      created_at_(now),
      last_activity_(now),
      last_ping_(now),
      close_deadline_(now) {}

void ControlFrameHandler::note_open(TimePoint now) {
  last_activity_ = now;
  last_ping_ = now;
}

optional<CloseInfo> ControlFrameHandler::close_now(CloseInfo info) {
  if (!state_.transition_to(ConnectionState::kClosed)) {
    return optional<CloseInfo>();
  }
  return optional<CloseInfo>(std::move(info));
}

// ============================================================================
// Inbound control frames
// ============================================================================

HandleResult ControlFrameHandler::handle(const ws::Frame& frame, TimePoint now) {
  if (!frame.is_control()) return HandleResult::error(ErrorCode::kInvalidArgument);

  const ConnectionState state = state_.get_state();
  if (state == ConnectionState::kHandshaking) {
    return HandleResult::error(ErrorCode::kInvalidState);
  }

  Result result;
  if (state == ConnectionState::kClosed) return HandleResult::success(std::move(result));
  note_activity(now);

  switch (frame.opcode) {
    case ws::OpCode::kPing:
      // No Pong once our Close is out.
      if (state == ConnectionState::kOpen) {
        result.reply = ws::Frame::pong(frame.payload);
      }
      break;

    case ws::OpCode::kPong:
      if (state == ConnectionState::kOpen && config_.surface_pongs) {
        result.surfaced = Message::pong(frame.payload);
      }
      break;

    case ws::OpCode::kClose: {
      if (state == ConnectionState::kClosingLocal) {
        CloseInfo info;
        info.code = local_code_;
        info.reason = local_reason_;
        info.origin = CloseOrigin::kLocal;
        result.closed = close_now(std::move(info));
        break;
      }
      if (state != ConnectionState::kOpen) break;  // duplicate Close

      auto parsed = parse_close_payload(frame.payload);
      const bool violation =
          !parsed.has_value() ||
          (parsed.value().has_code && !is_valid_close_code(parsed.value().code));

      CloseInfo info;
      info.origin = CloseOrigin::kRemote;
      std::vector<uint8_t> echo;
      if (violation) {
        WSCORE_LOG_WARN("peer sent a malformed close frame");
        info.code = close_code::kProtocolError;
        info.error = ErrorCode::kProtocolViolation;
        echo = build_close_payload(close_code::kProtocolError, {});
      } else if (parsed.value().has_code) {
        info.code = parsed.value().code;
        info.reason = parsed.value().reason;
        echo = build_close_payload(info.code, {});
      } else {
        info.code = close_code::kNoStatus;
      }

      auto t = state_.transition_to(ConnectionState::kClosingRemote);
      if (!t) return HandleResult::error(t.get_error());
      remote_close_ = std::move(info);
      close_sent_ = true;
      close_deadline_ = now + config_.close_handshake_timeout;
      result.reply = ws::Frame::close(Bytes(std::move(echo)));
      result.reply_is_close = true;
      break;
    }

    default:
      return HandleResult::error(ErrorCode::kInvalidArgument);
  }
  return HandleResult::success(std::move(result));
}

// ============================================================================
// Local close / failure paths
// ============================================================================

CloseFrameResult ControlFrameHandler::initiate_close(uint16_t code, std::string_view reason,
                                                     TimePoint now) {
  if (!is_valid_close_code(code)) {
    return CloseFrameResult::error(ErrorCode::kInvalidArgument);
  }
  if (state_.get_state() != ConnectionState::kOpen) {
    return CloseFrameResult::error(ErrorCode::kInvalidState);
  }
  auto t = state_.transition_to(ConnectionState::kClosingLocal);
  if (!t) return CloseFrameResult::error(t.get_error());

  local_code_ = code;
  local_reason_ = std::string(truncate_close_reason(reason));
  close_sent_ = true;
  close_deadline_ = now + config_.close_handshake_timeout;
  return CloseFrameResult::success(
      ws::Frame::close(Bytes(build_close_payload(code, local_reason_))));
}

ControlFrameHandler::Result ControlFrameHandler::fail(ErrorCode err) {
  Result result;
  const ConnectionState state = state_.get_state();
  if (state == ConnectionState::kClosed) return result;

  uint16_t code = close_code_for(err);
  if (err == ErrorCode::kCompressionError) code = config_.compression_error_close_code;

  if (!close_sent_ && state != ConnectionState::kHandshaking && is_valid_close_code(code)) {
    result.reply = ws::Frame::close(Bytes(build_close_payload(code, error_name(err))));
    close_sent_ = true;
  }

  CloseInfo info;
  info.code = code;
  info.origin = CloseOrigin::kLocal;
  info.error = err;
  result.closed = close_now(std::move(info));
  return result;
}

optional<CloseInfo> ControlFrameHandler::on_echo_sent() {
  if (state_.get_state() != ConnectionState::kClosingRemote) return optional<CloseInfo>();
  return close_now(remote_close_);
}

optional<CloseInfo> ControlFrameHandler::on_transport_error() {
  if (state_.is_closed()) return optional<CloseInfo>();
  CloseInfo info;
  info.code = close_code::kAbnormal;
  info.origin = CloseOrigin::kRemote;
  info.error = ErrorCode::kTransportError;
  return close_now(std::move(info));
}

// ============================================================================
// Timers
// ============================================================================

ControlFrameHandler::TimerResult ControlFrameHandler::poll(TimePoint now) {
  TimerResult result;
  CloseInfo info;
  info.timed_out = true;
  info.origin = CloseOrigin::kLocal;

  switch (state_.get_state()) {
    case ConnectionState::kHandshaking:
      if (now - created_at_ >= config_.handshake_timeout) {
        result.expired = ErrorCode::kHandshakeTimeout;
      }
      break;

    case ConnectionState::kOpen:
      if (config_.idle_timeout.count() > 0 &&
          now - last_activity_ >= config_.idle_timeout) {
        result.expired = ErrorCode::kIdleTimeout;
      } else if (config_.ping_interval.count() > 0 &&
                 now - last_activity_ >= config_.ping_interval &&
                 now - last_ping_ >= config_.ping_interval) {
        last_ping_ = now;
        result.ping = ws::Frame::ping();
      }
      break;

    case ConnectionState::kClosingLocal:
      if (now >= close_deadline_) {
        result.expired = ErrorCode::kCloseTimeout;
        info.code = local_code_;
        info.reason = local_reason_;
      }
      break;

    case ConnectionState::kClosingRemote:
      if (now >= close_deadline_) {
        result.expired = ErrorCode::kCloseTimeout;
        info = remote_close_;
        info.timed_out = true;
      }
      break;

    case ConnectionState::kClosed:
      break;
  }

  if (result.expired != ErrorCode::kOk) {
    WSCORE_LOG_WARN(std::string("connection timer expired: ") + error_name(result.expired));
    info.error = result.expired;
    result.closed = close_now(std::move(info));
  }
  return result;
}

}  // namespace wscore
