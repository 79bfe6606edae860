#include "wscore/session.hpp"

#include "wscore/log.hpp"

#include <algorithm>
#include <string>

namespace wscore {

using VoidResult = expected<void, ErrorCode>;
using ItemResult = expected<OutboundItem, ErrorCode>;

Session::Session(const EngineConfig& config, TimePoint now)
    : config_(config),
      control_(state_, config_, now),
      assembler_(config_.max_message_size),
      deflate_(config_.compression, config_.decompressed_limit()) {
  decode_opts_.role = config_.role;
  decode_opts_.max_frame_size = config_.max_frame_size;
  decode_opts_.allowed_rsv = config_.compression.enabled ? ws::kRsv1 : 0;
  decode_opts_.enforce_masking = config_.enforce_masking;
}

VoidResult Session::open(TimePoint now) {
  auto r = state_.transition_to(ConnectionState::kOpen);
  if (r) control_.note_open(now);
  return r;
}

// ============================================================================
// Inbound
// ============================================================================

VoidResult Session::receive(const Bytes& chunk, TimePoint now, SessionEvents& events) {
  if (failed_ || state_.is_closed()) {
    return VoidResult::error(ErrorCode::kConnectionClosed);
  }
  if (state_.get_state() == ConnectionState::kHandshaking) {
    return VoidResult::error(ErrorCode::kInvalidState);
  }
  if (chunk.empty()) return VoidResult::success();

  control_.note_activity(now);

  if (partial_.empty()) {
    pending_ = chunk;
  } else {
    partial_.insert(partial_.end(), chunk.begin(), chunk.end());
    if (partial_size_ != 0 && partial_.size() < partial_size_) {
      return VoidResult::success();
    }
    pending_ = Bytes(std::move(partial_));
    partial_.clear();
    partial_size_ = 0;
  }

  while (!pending_.empty()) {
    ws::Frame frame;
    auto decoded = ws::decode_frame(pending_, frame, decode_opts_);
    if (!decoded) {
      WSCORE_LOG_WARN(std::string("frame decode failed: ") +
                      error_name(decoded.get_error()));
      fail(decoded.get_error(), events);
      return VoidResult::error(decoded.get_error());
    }
    if (decoded.value() == 0) {
      // Keep the incomplete frame aside and append later reads to it.
      partial_.assign(pending_.begin(), pending_.end());
      partial_size_ = ws::peek_frame_size(partial_.data(), partial_.size());
      if (partial_size_ != 0) partial_.reserve(static_cast<size_t>(partial_size_));
      pending_ = Bytes();
      break;
    }
    pending_ = pending_.slice(decoded.value());

    auto handled = handle_frame(frame, now, events);
    if (!handled) {
      WSCORE_LOG_WARN(std::string("closing connection: ") + error_name(handled.get_error()));
      fail(handled.get_error(), events);
      return VoidResult::error(handled.get_error());
    }
    if (state_.is_closed()) {
      drop_input();
      break;
    }
  }
  return VoidResult::success();
}

void Session::apply(ControlFrameHandler::Result& result, SessionEvents& events) {
  if (result.reply) {
    events.outbound.push_back(encode_control(result.reply.value(), result.reply_is_close));
  }
  if (result.surfaced) events.messages.push_back(result.surfaced.value());
  if (result.closed) events.closed = result.closed;
}

VoidResult Session::handle_frame(const ws::Frame& frame, TimePoint now,
                                 SessionEvents& events) {
  if (frame.is_control()) {
    auto r = control_.handle(frame, now);
    if (!r) return VoidResult::error(r.get_error());
    apply(r.value(), events);
    return VoidResult::success();
  }

  // ClosingRemote and later: the peer promised no more data.
  if (!state_.can_receive_data()) return VoidResult::success();

  AssembledMessage msg;
  auto fed = assembler_.feed(frame, msg);
  if (!fed) return VoidResult::error(fed.get_error());
  if (!fed.value()) return VoidResult::success();

  // ClosingLocal: in-flight messages are decoded to keep the stream in sync
  // but not delivered.
  if (!state_.delivers_data()) return VoidResult::success();
  return deliver(msg, events);
}

VoidResult Session::deliver(const AssembledMessage& msg, SessionEvents& events) {
  Bytes payload = msg.payload;
  if (msg.compressed) {
    if (!deflate_.enabled()) return VoidResult::error(ErrorCode::kProtocolViolation);
    auto inflated = deflate_.decompress(payload.data(), payload.size());
    if (!inflated) return VoidResult::error(inflated.get_error());
    payload = Bytes(std::move(inflated.value()));
  }

  if (msg.opcode == ws::OpCode::kText) {
    if (!is_valid_utf8(payload.data(), payload.size())) {
      return VoidResult::error(ErrorCode::kInvalidPayload);
    }
    events.messages.push_back(Message::text(std::move(payload)));
  } else {
    events.messages.push_back(Message::binary(std::move(payload)));
  }
  return VoidResult::success();
}

// ============================================================================
// Outbound
// ============================================================================

OutboundItem Session::encode_control(const ws::Frame& frame, bool is_close) const {
  OutboundItem item;
  item.wire = ws::encode_frame(frame, config_.role);
  item.critical = true;
  item.is_close = is_close;
  return item;
}

ItemResult Session::encode_message(const Message& msg) {
  switch (msg.type()) {
    case MessageType::kPing:
    case MessageType::kPong: {
      if (msg.size() > ws::kMaxControlPayload) {
        return ItemResult::error(ErrorCode::kInvalidArgument);
      }
      ws::Frame f = msg.type() == MessageType::kPing ? ws::Frame::ping(msg.data())
                                                     : ws::Frame::pong(msg.data());
      return ItemResult::success(encode_control(f, false));
    }

    case MessageType::kClose: {
      Bytes body;
      if (msg.has_close_code()) {
        body = Bytes(build_close_payload(msg.close_code(), msg.close_reason()));
      }
      return ItemResult::success(encode_control(ws::Frame::close(std::move(body)), true));
    }

    case MessageType::kText:
      if (!is_valid_utf8(msg.data().data(), msg.size())) {
        return ItemResult::error(ErrorCode::kInvalidPayload);
      }
      break;

    case MessageType::kBinary:
      break;
  }

  Bytes payload = msg.data();
  uint8_t rsv = 0;
  if (deflate_.enabled()) {
    auto compressed = deflate_.compress(payload.data(), payload.size());
    if (!compressed) return ItemResult::error(compressed.get_error());
    payload = Bytes(std::move(compressed.value()));
    rsv = ws::kRsv1;
  }

  OutboundItem item;
  const size_t max_frame = std::max<size_t>(config_.max_frame_size, 1);
  size_t offset = 0;
  bool first = true;
  do {
    const size_t len = std::min(max_frame, payload.size() - offset);
    ws::Frame f;
    f.opcode = first ? (msg.is_text() ? ws::OpCode::kText : ws::OpCode::kBinary)
                     : ws::OpCode::kContinuation;
    f.rsv = first ? rsv : 0;
    f.payload = payload.slice(offset, len);
    offset += len;
    f.fin = (offset >= payload.size());

    auto wire = ws::encode_frame(f, config_.role);
    item.wire.insert(item.wire.end(), wire.begin(), wire.end());
    first = false;
  } while (offset < payload.size());

  return ItemResult::success(std::move(item));
}

VoidResult Session::send(const Message& msg, SessionEvents& events) {
  if (msg.type() == MessageType::kClose) {
    const uint16_t code = msg.has_close_code() ? msg.close_code() : close_code::kNormal;
    return close(code, msg.close_reason(), Clock::now(), events);
  }
  if (!state_.can_send_data()) {
    return VoidResult::error(state_.is_closed() ? ErrorCode::kConnectionClosed
                                                : ErrorCode::kInvalidState);
  }

  auto item = encode_message(msg);
  if (!item) {
    if (item.get_error() == ErrorCode::kCompressionError) {
      fail(ErrorCode::kCompressionError, events);
    }
    return VoidResult::error(item.get_error());
  }
  events.outbound.push_back(std::move(item.value()));
  return VoidResult::success();
}

VoidResult Session::close(uint16_t code, std::string_view reason, TimePoint now,
                          SessionEvents& events) {
  if (state_.is_closed()) return VoidResult::error(ErrorCode::kConnectionClosed);
  auto frame = control_.initiate_close(code, reason, now);
  if (!frame) return VoidResult::error(frame.get_error());
  events.outbound.push_back(encode_control(frame.value(), true));
  WSCORE_LOG_DEBUG("closing handshake started, code " + std::to_string(code));
  return VoidResult::success();
}

// ============================================================================
// Timers and lifecycle
// ============================================================================

void Session::poll(TimePoint now, SessionEvents& events) {
  auto t = control_.poll(now);
  if (t.ping) events.outbound.push_back(encode_control(t.ping.value(), false));
  if (t.closed) {
    events.closed = t.closed;
    events.error = t.expired;
    failed_ = true;
    drop_input();
    assembler_.reset();
  }
}

void Session::on_close_sent(SessionEvents& events) {
  auto closed = control_.on_echo_sent();
  if (closed) events.closed = closed;
}

void Session::on_transport_error(SessionEvents& events) {
  auto closed = control_.on_transport_error();
  if (closed) {
    events.closed = closed;
    events.error = ErrorCode::kTransportError;
  }
  failed_ = true;
  drop_input();
  assembler_.reset();
}

void Session::fail(ErrorCode err, SessionEvents& events) {
  auto r = control_.fail(err);
  apply(r, events);
  events.error = err;
  failed_ = true;
  drop_input();
  assembler_.reset();
}

void Session::drop_input() {
  pending_ = Bytes();
  partial_.clear();
  partial_size_ = 0;
}

}  // namespace wscore
