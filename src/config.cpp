#include "wscore/config.hpp"

#include "wscore/log.hpp"
#include "wscore/message.hpp"

#include <string>

namespace wscore {

namespace {

expected<void, ErrorCode> reject(const char* what) {
  WSCORE_LOG_ERROR(std::string("invalid config: ") + what);
  return expected<void, ErrorCode>::error(ErrorCode::kInvalidConfig);
}

}  // namespace

expected<void, ErrorCode> EngineConfig::validate() const {
  if (max_frame_size == 0) return reject("max_frame_size must be > 0");
  if (max_message_size == 0) return reject("max_message_size must be > 0");
  if (max_message_size < max_frame_size) {
    return reject("max_message_size must be >= max_frame_size");
  }
  if (close_handshake_timeout.count() <= 0) {
    return reject("close_handshake_timeout must be > 0");
  }
  if (handshake_timeout.count() <= 0) return reject("handshake_timeout must be > 0");
  if (idle_timeout.count() < 0 || ping_interval.count() < 0) {
    return reject("timeouts must not be negative");
  }
  if (!is_valid_close_code(compression_error_close_code)) {
    return reject("compression_error_close_code is not a sendable close code");
  }

  if (backpressure.capacity == 0) return reject("backpressure.capacity must be > 0");
  if (backpressure.inbound_capacity == 0) {
    return reject("backpressure.inbound_capacity must be > 0");
  }
  if (backpressure.block_timeout.count() < 0) {
    return reject("backpressure.block_timeout must not be negative");
  }
  if (backpressure.high_watermark != 0 && backpressure.low_watermark != 0 &&
      backpressure.low_watermark >= backpressure.high_watermark) {
    return reject("backpressure.low_watermark must be below high_watermark");
  }

  if (compression.window_bits < 8 || compression.window_bits > 15) {
    return reject("compression.window_bits must be in 8..15");
  }
  if (compression.level < 0 || compression.level > 9) {
    return reject("compression.level must be in 0..9");
  }
  return expected<void, ErrorCode>::success();
}

}  // namespace wscore
