#include "wscore/frame.hpp"

#include <random>

namespace wscore {
namespace ws {

namespace {

using DecodeResult = expected<size_t, ErrorCode>;

inline DecodeResult violation() {
  return DecodeResult::error(ErrorCode::kProtocolViolation);
}

inline uint8_t mask_byte(uint32_t key, size_t i) {
  return static_cast<uint8_t>(key >> (8 * (3 - (i & 3))));
}

}  // namespace

const char* opcode_name(OpCode op) {
  switch (op) {
    case OpCode::kContinuation: return "continuation";
    case OpCode::kText: return "text";
    case OpCode::kBinary: return "binary";
    case OpCode::kClose: return "close";
    case OpCode::kPing: return "ping";
    case OpCode::kPong: return "pong";
  }
  return "reserved";
}

// ============================================================================
// Frame factories
// ============================================================================

Frame Frame::text(std::string_view s, bool fin) {
  Frame f;
  f.fin = fin;
  f.opcode = OpCode::kText;
  f.payload = Bytes::from_string(s);
  return f;
}

Frame Frame::binary(Bytes data, bool fin) {
  Frame f;
  f.fin = fin;
  f.opcode = OpCode::kBinary;
  f.payload = std::move(data);
  return f;
}

Frame Frame::continuation(Bytes data, bool fin) {
  Frame f;
  f.fin = fin;
  f.opcode = OpCode::kContinuation;
  f.payload = std::move(data);
  return f;
}

Frame Frame::ping(Bytes data) {
  Frame f;
  f.opcode = OpCode::kPing;
  f.payload = std::move(data);
  return f;
}

Frame Frame::pong(Bytes data) {
  Frame f;
  f.opcode = OpCode::kPong;
  f.payload = std::move(data);
  return f;
}

Frame Frame::close(Bytes payload) {
  Frame f;
  f.opcode = OpCode::kClose;
  f.payload = std::move(payload);
  return f;
}

bool Frame::operator==(const Frame& other) const {
  return fin == other.fin && rsv == other.rsv && opcode == other.opcode &&
         masked == other.masked && (!masked || mask_key == other.mask_key) &&
         payload == other.payload;
}

// ============================================================================
// Masking
// ============================================================================

void apply_mask(uint8_t* data, size_t len, uint32_t mask_key, size_t offset) {
  const uint8_t key[4] = {mask_byte(mask_key, 0), mask_byte(mask_key, 1),
                          mask_byte(mask_key, 2), mask_byte(mask_key, 3)};
  for (size_t i = 0; i < len; ++i) {
    data[i] ^= key[(offset + i) & 3];
  }
}

uint32_t generate_mask_key() {
  thread_local std::mt19937 rng{std::random_device{}()};
  return static_cast<uint32_t>(rng());
}

// ============================================================================
// Decoding
// ============================================================================

uint64_t peek_frame_size(const uint8_t* data, size_t len) {
  if (len < 2) return 0;
  const bool masked = (data[1] & 0x80) != 0;
  uint64_t payload = data[1] & 0x7F;
  uint64_t header = 2;
  if (payload == 126) {
    if (len < 4) return 0;
    payload = (static_cast<uint64_t>(data[2]) << 8) | data[3];
    header = 4;
  } else if (payload == 127) {
    if (len < 10) return 0;
    payload = 0;
    for (int i = 0; i < 8; ++i) payload = (payload << 8) | data[2 + i];
    header = 10;
  }
  if (masked) header += 4;
  return header + payload;
}

DecodeResult decode_frame(const Bytes& buffer, Frame& out,
                          const DecodeOptions& opts) {
  const uint8_t* data = buffer.data();
  const size_t avail = buffer.size();
  if (avail < 2) return DecodeResult::success(0);

  const uint8_t byte0 = data[0];
  const uint8_t byte1 = data[1];
  const bool fin = (byte0 & 0x80) != 0;
  const uint8_t rsv = (byte0 >> 4) & 0x7;
  const uint8_t op = byte0 & 0x0F;
  const bool masked = (byte1 & 0x80) != 0;
  uint64_t len = byte1 & 0x7F;

  // Everything decidable from the first two bytes fails fast.
  if (!is_known_opcode(op)) return violation();
  if ((rsv & ~opts.allowed_rsv) != 0) return violation();
  const bool control = is_control(static_cast<OpCode>(op));
  if (control && (!fin || len > kMaxControlPayload)) return violation();
  if (control && rsv != 0) return violation();
  if (opts.enforce_masking) {
    if (opts.role == Role::kServer && !masked) return violation();
    if (opts.role == Role::kClient && masked) return violation();
  }

  size_t header_size = 2;
  if (len == 126) {
    if (avail < 4) return DecodeResult::success(0);
    len = (static_cast<uint64_t>(data[2]) << 8) | data[3];
    header_size = 4;
  } else if (len == 127) {
    if (avail < 10) return DecodeResult::success(0);
    len = 0;
    for (int i = 0; i < 8; ++i) {
      len = (len << 8) | data[2 + i];
    }
    if ((len >> 63) != 0) return violation();
    header_size = 10;
  }

  if (len > opts.max_frame_size) return violation();

  uint32_t mask_key = 0;
  if (masked) {
    if (avail < header_size + 4) return DecodeResult::success(0);
    mask_key = (static_cast<uint32_t>(data[header_size]) << 24) |
               (static_cast<uint32_t>(data[header_size + 1]) << 16) |
               (static_cast<uint32_t>(data[header_size + 2]) << 8) |
               static_cast<uint32_t>(data[header_size + 3]);
    header_size += 4;
  }

  if (avail - header_size < len) return DecodeResult::success(0);
  const size_t payload_len = static_cast<size_t>(len);

  out.fin = fin;
  out.rsv = rsv;
  out.opcode = static_cast<OpCode>(op);
  out.masked = masked;
  out.mask_key = mask_key;
  if (masked) {
    std::vector<uint8_t> owned(data + header_size, data + header_size + payload_len);
    apply_mask(owned.data(), owned.size(), mask_key);
    out.payload = Bytes(std::move(owned));
  } else {
    out.payload = buffer.slice(header_size, payload_len);
  }
  return DecodeResult::success(header_size + payload_len);
}

// ============================================================================
// Encoding
// ============================================================================

size_t encode_frame_header(uint8_t* buf, const Frame& frame) {
  size_t pos = 0;
  buf[pos++] = static_cast<uint8_t>((frame.fin ? 0x80 : 0x00) |
                                    ((frame.rsv & 0x7) << 4) |
                                    static_cast<uint8_t>(frame.opcode));

  const uint8_t mask_bit = frame.masked ? 0x80 : 0x00;
  const uint64_t len = frame.payload.size();
  if (len < 126) {
    buf[pos++] = static_cast<uint8_t>(mask_bit | len);
  } else if (len <= 0xFFFF) {
    buf[pos++] = static_cast<uint8_t>(mask_bit | 126);
    buf[pos++] = static_cast<uint8_t>((len >> 8) & 0xFF);
    buf[pos++] = static_cast<uint8_t>(len & 0xFF);
  } else {
    buf[pos++] = static_cast<uint8_t>(mask_bit | 127);
    for (int i = 7; i >= 0; --i) {
      buf[pos++] = static_cast<uint8_t>((len >> (8 * i)) & 0xFF);
    }
  }

  if (frame.masked) {
    for (size_t i = 0; i < 4; ++i) {
      buf[pos++] = mask_byte(frame.mask_key, i);
    }
  }
  return pos;
}

std::vector<uint8_t> encode_frame(const Frame& frame) {
  uint8_t header[kMaxHeaderSize];
  const size_t header_len = encode_frame_header(header, frame);

  std::vector<uint8_t> out;
  out.reserve(header_len + frame.payload.size());
  out.insert(out.end(), header, header + header_len);
  out.insert(out.end(), frame.payload.begin(), frame.payload.end());
  if (frame.masked) {
    apply_mask(out.data() + header_len, frame.payload.size(), frame.mask_key);
  }
  return out;
}

std::vector<uint8_t> encode_frame(Frame frame, Role role) {
  frame.masked = (role == Role::kClient);
  if (frame.masked) frame.mask_key = generate_mask_key();
  return encode_frame(frame);
}

}  // namespace ws
}  // namespace wscore
