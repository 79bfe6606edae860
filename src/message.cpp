#include "wscore/message.hpp"

namespace wscore {

uint16_t close_code_for(ErrorCode err) {
  switch (err) {
    case ErrorCode::kOk:
      return close_code::kNormal;
    case ErrorCode::kProtocolViolation:
      return close_code::kProtocolError;
    case ErrorCode::kMessageTooLarge:
      return close_code::kMessageTooBig;
    case ErrorCode::kInvalidPayload:
      return close_code::kInvalidPayload;
    case ErrorCode::kCompressionError:
    case ErrorCode::kInternalError:
      return close_code::kInternalError;
    default:
      return close_code::kAbnormal;
  }
}

bool is_valid_utf8(const uint8_t* data, size_t len) {
  size_t i = 0;
  while (i < len) {
    const uint8_t c = data[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t extra = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;
    if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
      min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
      min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
      min_cp = 0x10000;
    } else {
      return false;
    }

    if (len - i <= extra) return false;
    for (size_t k = 1; k <= extra; ++k) {
      const uint8_t cc = data[i + k];
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;
    i += extra + 1;
  }
  return true;
}

std::string_view truncate_close_reason(std::string_view reason) {
  if (reason.size() <= kMaxCloseReason) return reason;
  size_t cut = kMaxCloseReason;
  // Back up over continuation bytes so no character is split.
  while (cut > 0 && (static_cast<uint8_t>(reason[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return reason.substr(0, cut);
}

// ============================================================================
// Message
// ============================================================================

const char* message_type_name(MessageType type) {
  switch (type) {
    case MessageType::kText: return "text";
    case MessageType::kBinary: return "binary";
    case MessageType::kPing: return "ping";
    case MessageType::kPong: return "pong";
    case MessageType::kClose: return "close";
  }
  return "unknown";
}

Message Message::text(std::string_view s) { return text(Bytes::from_string(s)); }

Message Message::text(Bytes utf8) {
  Message m;
  m.type_ = MessageType::kText;
  m.data_ = std::move(utf8);
  return m;
}

Message Message::binary(Bytes data) {
  Message m;
  m.type_ = MessageType::kBinary;
  m.data_ = std::move(data);
  return m;
}

Message Message::ping(Bytes data) {
  Message m;
  m.type_ = MessageType::kPing;
  m.data_ = std::move(data);
  return m;
}

Message Message::pong(Bytes data) {
  Message m;
  m.type_ = MessageType::kPong;
  m.data_ = std::move(data);
  return m;
}

Message Message::close(uint16_t code, std::string_view reason) {
  Message m;
  m.type_ = MessageType::kClose;
  m.has_code_ = true;
  m.code_ = code;
  m.reason_ = std::string(truncate_close_reason(reason));
  return m;
}

Message Message::close() {
  Message m;
  m.type_ = MessageType::kClose;
  return m;
}

bool Message::operator==(const Message& other) const {
  if (type_ != other.type_) return false;
  if (type_ == MessageType::kClose) {
    return has_code_ == other.has_code_ && code_ == other.code_ &&
           reason_ == other.reason_;
  }
  return data_ == other.data_;
}

// ============================================================================
// Close payload
// ============================================================================

expected<ClosePayload, ErrorCode> parse_close_payload(const Bytes& payload) {
  ClosePayload out;
  if (payload.empty()) {
    return expected<ClosePayload, ErrorCode>::success(std::move(out));
  }
  if (payload.size() == 1) {
    return expected<ClosePayload, ErrorCode>::error(ErrorCode::kProtocolViolation);
  }

  out.has_code = true;
  out.code = static_cast<uint16_t>((payload[0] << 8) | payload[1]);
  if (!is_valid_utf8(payload.data() + 2, payload.size() - 2)) {
    return expected<ClosePayload, ErrorCode>::error(ErrorCode::kProtocolViolation);
  }
  out.reason.assign(reinterpret_cast<const char*>(payload.data() + 2),
                    payload.size() - 2);
  return expected<ClosePayload, ErrorCode>::success(std::move(out));
}

std::vector<uint8_t> build_close_payload(uint16_t code, std::string_view reason) {
  reason = truncate_close_reason(reason);
  std::vector<uint8_t> out;
  out.reserve(2 + reason.size());
  out.push_back(static_cast<uint8_t>(code >> 8));
  out.push_back(static_cast<uint8_t>(code & 0xFF));
  out.insert(out.end(), reason.begin(), reason.end());
  return out;
}

}  // namespace wscore
