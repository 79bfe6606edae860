#ifndef WSCORE_COMPRESSION_HPP_
#define WSCORE_COMPRESSION_HPP_

#include "wscore/vocabulary.hpp"

#include <cstdint>

#include <vector>
#include <zlib.h>

namespace wscore {

/// window_bits and context_takeover describe our compressor. The inflater
/// always runs with a 15-bit window, which reads any smaller one.
struct CompressionConfig {
  bool enabled = false;
  uint8_t window_bits = 15;     // 8..15
  bool context_takeover = true; // false: every message starts from a fresh window
  bool peer_context_takeover = true;  // false: the peer resets, so may we
  int level = 6;                // zlib level 0..9
};

/**
 * @brief One raw-deflate stream, either compressing or decompressing.
 *
 * Owns the z_stream for its whole lifetime.
 */
class ZlibStream {
 public:
  enum class Mode { kDeflate, kInflate };

  ZlibStream(Mode mode, int window_bits, int level);
  ~ZlibStream();

  ZlibStream(const ZlibStream&) = delete;
  ZlibStream& operator=(const ZlibStream&) = delete;

  bool ok() const { return initialized_; }

  /// Run all of input through the stream with Z_SYNC_FLUSH, appending to out.
  /// max_out == 0 means unbounded.
  expected<void, ErrorCode> process(const uint8_t* input, size_t len,
                                    std::vector<uint8_t>& out, size_t max_out);

  expected<void, ErrorCode> reset();

 private:
  Mode mode_;
  z_stream stream_{};
  bool initialized_ = false;
};

/**
 * @brief Per-connection permessage-deflate state: one deflater for outbound
 *        messages and one inflater for inbound messages.
 */
class PerMessageDeflate {
 public:
  PerMessageDeflate(const CompressionConfig& config, size_t max_decompressed);

  bool enabled() const { return config_.enabled; }
  const CompressionConfig& config() const { return config_; }

  /// Compressed message body with the trailing 00 00 FF FF removed.
  expected<std::vector<uint8_t>, ErrorCode> compress(const uint8_t* data, size_t len);

  /// Inverse of compress(). Output larger than the configured ceiling and
  /// malformed streams are kCompressionError.
  expected<std::vector<uint8_t>, ErrorCode> decompress(const uint8_t* data, size_t len);

 private:
  CompressionConfig config_;
  size_t max_decompressed_;
  ZlibStream deflater_;
  ZlibStream inflater_;
};

}  // namespace wscore

#endif  // WSCORE_COMPRESSION_HPP_
