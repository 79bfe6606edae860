#ifndef WSCORE_FRAME_HPP_
#define WSCORE_FRAME_HPP_

#include "wscore/bytes.hpp"
#include "wscore/vocabulary.hpp"

#include <cstdint>

#include <string_view>
#include <vector>

namespace wscore {

/// Which end of the connection we are. Servers expect masked input and send
/// unmasked frames; clients do the opposite.
enum class Role : uint8_t { kServer, kClient };

namespace ws {

// Frame types
enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

constexpr uint8_t kRsv1 = 0x4;
constexpr uint8_t kRsv2 = 0x2;
constexpr uint8_t kRsv3 = 0x1;

constexpr size_t kMaxControlPayload = 125;
constexpr size_t kMaxHeaderSize = 14;

inline bool is_control(OpCode op) { return (static_cast<uint8_t>(op) & 0x8) != 0; }

inline bool is_known_opcode(uint8_t op) {
  return op <= 0x2 || (op >= 0x8 && op <= 0xA);
}

const char* opcode_name(OpCode op);

struct Frame {
  bool fin = true;
  uint8_t rsv = 0;  // 3-bit field, kRsv1 = 0x4
  OpCode opcode = OpCode::kText;
  bool masked = false;
  uint32_t mask_key = 0;  // meaningful only when masked
  Bytes payload;

  bool is_control() const { return ws::is_control(opcode); }
  bool compressed() const { return (rsv & kRsv1) != 0; }

  static Frame text(std::string_view s, bool fin = true);
  static Frame binary(Bytes data, bool fin = true);
  static Frame continuation(Bytes data, bool fin);
  static Frame ping(Bytes data = Bytes());
  static Frame pong(Bytes data = Bytes());
  static Frame close(Bytes payload = Bytes());

  bool operator==(const Frame& other) const;
  bool operator!=(const Frame& other) const { return !(*this == other); }
};

struct DecodeOptions {
  Role role = Role::kServer;
  uint64_t max_frame_size = 16 * 1024 * 1024;
  uint8_t allowed_rsv = 0;  // RSV bits claimed by negotiated extensions
  bool enforce_masking = true;
};

/**
 * @brief Parse one frame from the front of buffer.
 *
 * @return Bytes consumed, or 0 when the buffer does not yet hold a complete
 *         frame (call again with more data). kProtocolViolation when the
 *         bytes can never form a legal frame.
 *
 * Unmasked payloads are slices of buffer; masked payloads are unmasked into
 * one freshly owned buffer. out.mask_key keeps the key that was on the wire.
 */
expected<size_t, ErrorCode> decode_frame(const Bytes& buffer, Frame& out,
                                         const DecodeOptions& opts);

/// Encoded size of the frame starting at data (header plus payload), or 0
/// while the header itself is incomplete.
uint64_t peek_frame_size(const uint8_t* data, size_t len);

/// XOR data with the 4-byte key in place. offset is the payload position of
/// data[0], for masking a payload in pieces.
void apply_mask(uint8_t* data, size_t len, uint32_t mask_key, size_t offset = 0);

/// Fresh random masking key.
uint32_t generate_mask_key();

/// Write the header for frame into buf (at least kMaxHeaderSize bytes).
size_t encode_frame_header(uint8_t* buf, const Frame& frame);

/// Serialize a full frame. Masked frames are masked with frame.mask_key.
std::vector<uint8_t> encode_frame(const Frame& frame);

/// Serialize for the given role: clients mask with a fresh key, servers do not.
std::vector<uint8_t> encode_frame(Frame frame, Role role);

}  // namespace ws

}  // namespace wscore

#endif  // WSCORE_FRAME_HPP_
