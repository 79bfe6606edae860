#ifndef WSCORE_CONFIG_HPP_
#define WSCORE_CONFIG_HPP_

#include "wscore/backpressure.hpp"
#include "wscore/compression.hpp"
#include "wscore/frame.hpp"
#include "wscore/vocabulary.hpp"

#include <cstddef>

#include <chrono>

namespace wscore {

struct EngineConfig {
  Role role = Role::kServer;

  size_t max_frame_size = 16 * 1024 * 1024;
  size_t max_message_size = 64 * 1024 * 1024;
  size_t max_decompressed_size = 0;  // 0: max_message_size

  std::chrono::milliseconds idle_timeout{300000};  // 0 disables
  std::chrono::milliseconds ping_interval{0};      // 0 disables keepalive pings
  std::chrono::milliseconds close_handshake_timeout{5000};
  std::chrono::milliseconds handshake_timeout{10000};

  bool enforce_masking = true;
  bool surface_pongs = false;
  // Close code sent when permessage-deflate fails.
  uint16_t compression_error_close_code = 1011;

  BackpressureConfig backpressure;
  CompressionConfig compression;

  size_t decompressed_limit() const {
    return max_decompressed_size != 0 ? max_decompressed_size : max_message_size;
  }

  /// kInvalidConfig on the first inconsistent field.
  expected<void, ErrorCode> validate() const;
};

}  // namespace wscore

#endif  // WSCORE_CONFIG_HPP_
