#ifndef WSCORE_MESSAGE_HPP_
#define WSCORE_MESSAGE_HPP_

#include "wscore/bytes.hpp"
#include "wscore/vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>
#include <vector>

namespace wscore {

// ============================================================================
// Close codes (RFC 6455 section 7.4)
// ============================================================================

namespace close_code {
constexpr uint16_t kNormal = 1000;
constexpr uint16_t kGoingAway = 1001;
constexpr uint16_t kProtocolError = 1002;
constexpr uint16_t kUnsupportedData = 1003;
constexpr uint16_t kNoStatus = 1005;  // never on the wire
constexpr uint16_t kAbnormal = 1006;  // never on the wire
constexpr uint16_t kInvalidPayload = 1007;
constexpr uint16_t kPolicyViolation = 1008;
constexpr uint16_t kMessageTooBig = 1009;
constexpr uint16_t kMandatoryExtension = 1010;
constexpr uint16_t kInternalError = 1011;
}  // namespace close_code

constexpr size_t kMaxCloseReason = 123;

/// Codes a peer may legally put in a Close frame.
inline bool is_valid_close_code(uint16_t code) {
  return (code >= 1000 && code <= 1003) || (code >= 1007 && code <= 1011) ||
         (code >= 3000 && code <= 4999);
}

/// Close code that reports err to the peer. Errors that end the connection
/// without a close frame map to 1006.
uint16_t close_code_for(ErrorCode err);

/// Strict UTF-8 check: no overlongs, no surrogates, nothing above U+10FFFF.
bool is_valid_utf8(const uint8_t* data, size_t len);

inline bool is_valid_utf8(std::string_view s) {
  return is_valid_utf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// ============================================================================
// Message
// ============================================================================

enum class MessageType : uint8_t { kText, kBinary, kPing, kPong, kClose };

const char* message_type_name(MessageType type);

class Message {
 public:
  static Message text(std::string_view s);
  static Message text(Bytes utf8);
  static Message binary(Bytes data);
  static Message binary(std::string_view s) { return binary(Bytes::from_string(s)); }
  static Message ping(Bytes data = Bytes());
  static Message pong(Bytes data = Bytes());
  /// Close with a status code. The reason is cut to 123 bytes on a
  /// character boundary.
  static Message close(uint16_t code, std::string_view reason = {});
  /// Close without a status code.
  static Message close();

  MessageType type() const { return type_; }
  bool is_text() const { return type_ == MessageType::kText; }
  bool is_binary() const { return type_ == MessageType::kBinary; }
  bool is_control() const {
    return type_ != MessageType::kText && type_ != MessageType::kBinary;
  }

  const Bytes& data() const { return data_; }
  std::string_view text_view() const { return data_.as_string_view(); }
  size_t size() const { return data_.size(); }

  bool has_close_code() const { return has_code_; }
  uint16_t close_code() const { return code_; }
  const std::string& close_reason() const { return reason_; }

  bool operator==(const Message& other) const;
  bool operator!=(const Message& other) const { return !(*this == other); }

 private:
  Message() = default;

  MessageType type_ = MessageType::kBinary;
  Bytes data_;
  bool has_code_ = false;
  uint16_t code_ = close_code::kNoStatus;
  std::string reason_;
};

// ============================================================================
// Close payload
// ============================================================================

struct ClosePayload {
  bool has_code = false;
  uint16_t code = close_code::kNoStatus;
  std::string reason;
};

/// Parse a Close frame body. A 1-byte body or a reason that is not UTF-8 is
/// kProtocolViolation. The code itself is not range-checked here.
expected<ClosePayload, ErrorCode> parse_close_payload(const Bytes& payload);

/// Big-endian code followed by the reason, cut to 123 bytes.
std::vector<uint8_t> build_close_payload(uint16_t code, std::string_view reason);

/// Longest prefix of reason that fits a close frame and ends on a character
/// boundary.
std::string_view truncate_close_reason(std::string_view reason);

// ============================================================================
// Close notification
// ============================================================================

enum class CloseOrigin : uint8_t { kLocal, kRemote };

/// Reported exactly once per connection when it reaches Closed.
struct CloseInfo {
  uint16_t code = close_code::kAbnormal;
  std::string reason;
  CloseOrigin origin = CloseOrigin::kLocal;
  bool timed_out = false;
  ErrorCode error = ErrorCode::kOk;  // kOk for an orderly close
};

}  // namespace wscore

#endif  // WSCORE_MESSAGE_HPP_
