#include "wscore/fragment_assembler.hpp"

namespace wscore {

using FeedResult = expected<bool, ErrorCode>;

void FragmentAssembler::reset() {
  in_progress_ = false;
  compressed_ = false;
  buffer_.clear();
  buffer_.shrink_to_fit();
}

FeedResult FragmentAssembler::feed(const ws::Frame& frame, AssembledMessage& out) {
  const size_t len = frame.payload.size();

  if (frame.opcode == ws::OpCode::kContinuation) {
    if (!in_progress_) return FeedResult::error(ErrorCode::kProtocolViolation);
    // RSV1 is only meaningful on the first fragment.
    if (frame.compressed()) {
      reset();
      return FeedResult::error(ErrorCode::kProtocolViolation);
    }
    if (len > max_message_size_ - buffer_.size()) {
      reset();
      return FeedResult::error(ErrorCode::kMessageTooLarge);
    }
    buffer_.insert(buffer_.end(), frame.payload.begin(), frame.payload.end());
    if (!frame.fin) return FeedResult::success(false);

    out.opcode = opcode_;
    out.compressed = compressed_;
    out.payload = Bytes(std::move(buffer_));
    buffer_ = std::vector<uint8_t>();
    in_progress_ = false;
    compressed_ = false;
    return FeedResult::success(true);
  }

  if (frame.opcode != ws::OpCode::kText && frame.opcode != ws::OpCode::kBinary) {
    return FeedResult::error(ErrorCode::kInvalidArgument);
  }
  if (in_progress_) {
    reset();
    return FeedResult::error(ErrorCode::kProtocolViolation);
  }
  if (len > max_message_size_) {
    return FeedResult::error(ErrorCode::kMessageTooLarge);
  }

  if (frame.fin) {
    out.opcode = frame.opcode;
    out.compressed = frame.compressed();
    out.payload = frame.payload;
    return FeedResult::success(true);
  }

  in_progress_ = true;
  opcode_ = frame.opcode;
  compressed_ = frame.compressed();
  buffer_.assign(frame.payload.begin(), frame.payload.end());
  return FeedResult::success(false);
}

}  // namespace wscore
