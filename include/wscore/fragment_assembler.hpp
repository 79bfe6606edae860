#ifndef WSCORE_FRAGMENT_ASSEMBLER_HPP_
#define WSCORE_FRAGMENT_ASSEMBLER_HPP_

#include "wscore/bytes.hpp"
#include "wscore/frame.hpp"
#include "wscore/vocabulary.hpp"

#include <cstdint>

#include <vector>

namespace wscore {

/// A complete data message as it came off the wire, before decompression.
struct AssembledMessage {
  ws::OpCode opcode = ws::OpCode::kBinary;  // kText or kBinary
  bool compressed = false;                  // RSV1 on the first frame
  Bytes payload;
};

/**
 * @brief Idle / accumulating state for one connection.
 *
 * Only data frames (Text, Binary, Continuation) are fed in; control frames
 * are routed elsewhere and never touch this state. Single-frame messages pass
 * their payload through without copying.
 */
class FragmentAssembler {
 public:
  explicit FragmentAssembler(size_t max_message_size)
      : max_message_size_(max_message_size) {}

  /**
   * @brief Feed one data frame.
   * @return true when out holds a complete message, false when more
   *         fragments are needed. kProtocolViolation on a sequencing error,
   *         kMessageTooLarge when the message would exceed the limit. Any
   *         error discards the partial message.
   */
  expected<bool, ErrorCode> feed(const ws::Frame& frame, AssembledMessage& out);

  bool in_progress() const { return in_progress_; }
  size_t buffered() const { return buffer_.size(); }
  void reset();

 private:
  size_t max_message_size_;
  bool in_progress_ = false;
  ws::OpCode opcode_ = ws::OpCode::kBinary;
  bool compressed_ = false;
  std::vector<uint8_t> buffer_;
};

}  // namespace wscore

#endif  // WSCORE_FRAGMENT_ASSEMBLER_HPP_
